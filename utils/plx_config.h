#ifndef PLX_CONFIG_H
#define PLX_CONFIG_H

#include <cstddef>
#include <string>

// Runtime settings, read from the environment after load_env_file().
struct plx_config
{
  int port = 3007;
  size_t threads = 4;
  size_t max_body_bytes = 50 * 1024 * 1024;
  bool strict_elements = false;
  double default_font_size = 12.0;
  std::string tls_key_path = "privkey.pem";
  std::string tls_cert_path = "cert.pem";
  std::string podofo_log_level = "warning";

  static plx_config from_environment();
};

#endif // PLX_CONFIG_H
