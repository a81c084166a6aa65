#include "plx_config.h"
#include "plx_env.h"
#include <iostream>

plx_config plx_config::from_environment()
{
  plx_config config;

  long port = plx_getenv_int("PLX_PORT", config.port);
  if (port <= 0 || port > 65535) {
    std::cerr << "Warning: PLX_PORT " << port << " is not a valid port, using " << config.port << std::endl;
  } else {
    config.port = static_cast<int>(port);
  }

  long threads = plx_getenv_int("PLX_THREADS", static_cast<long>(config.threads));
  if (threads < 1) {
    threads = 1;
  }
  config.threads = static_cast<size_t>(threads);

  long max_body = plx_getenv_int("PLX_MAX_BODY_BYTES", static_cast<long>(config.max_body_bytes));
  if (max_body > 0) {
    config.max_body_bytes = static_cast<size_t>(max_body);
  }

  config.strict_elements = plx_getenv_bool("PLX_STRICT_ELEMENTS", config.strict_elements);

  long font_size = plx_getenv_int("PLX_DEFAULT_FONT_SIZE", static_cast<long>(config.default_font_size));
  if (font_size > 0) {
    config.default_font_size = static_cast<double>(font_size);
  }

  config.tls_key_path = plx_getenv("PLX_TLS_KEY", config.tls_key_path);
  config.tls_cert_path = plx_getenv("PLX_TLS_CERT", config.tls_cert_path);
  config.podofo_log_level = plx_to_lower(plx_getenv("PLX_PODOFO_LOG", config.podofo_log_level));

  return config;
}
