#include "api/server/plx_rest_api.h"
#include "utils/plx_config.h"
#include "utils/plx_env.h"
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <iterator>
#include <thread>

static volatile std::sig_atomic_t stop_requested = 0;

static void on_signal(int)
{
  stop_requested = 1;
}

static bool read_file(const std::string& path, std::string& data)
{
  std::ifstream f(path, std::ios::binary);
  if (!f.is_open())
  {
    return false;
  }
  // read all bytes from the file
  data.assign((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  return true;
}

int main(int argc, char *argv[])
{
  std::string env_file = argc > 1 ? argv[1] : ".env";
  if (load_env_file(env_file))
  {
    std::cout << "Loaded environment from " << env_file << std::endl;
  }

  plx_config config = plx_config::from_environment();
  plx_pdf_engine engine(config);
  plx_rest_api api(engine, config);

  std::string privkey;
  std::string cert;
  if (read_file(config.tls_key_path, privkey) && read_file(config.tls_cert_path, cert))
  {
    if (api.check_ssl_supported())
    {
      std::cout << "Found certificates for https!" << std::endl;
      api.activate_ssl(privkey, cert);
    }
    else
    {
      std::cerr << "Warning: certificates found but libmicrohttpd has no TLS support, serving http" << std::endl;
    }
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  api.activate_thread_pool(config.threads);
  if (!api.exec(config.port))
  {
    return -1;
  }
  std::cout << "Strict element parsing: " << (config.strict_elements ? "on" : "off")
            << ", body limit " << config.max_body_bytes << " bytes"
            << ", PoDoFo log level " << engine.log_level() << std::endl;

  while (api.is_running() && !stop_requested)
  {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  api.stop();
  std::cout << "Server stopped" << std::endl;
  return 0;
}
