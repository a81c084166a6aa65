#ifndef PLX_HTTPDAEMON_H
#define PLX_HTTPDAEMON_H

#include <cstdint>
#include <microhttpd.h>
#include <map>
#include <mutex>
#include <string>

// Compatibility with older libmicrohttpd versions
#if MHD_VERSION < 0x00097002
typedef int MHD_Result;
#endif

class plx_http_daemon
{
public:
  struct request
  {
    std::string path;
    std::string method;
    std::string body;
    // header names are lower case
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> params;
    // multipart/form-data fields, file contents included
    std::map<std::string, std::string> form;
    std::map<std::string, std::string> filenames;
    bool too_large = false;
    size_t received = 0;
  };

  struct response
  {
    std::string body;
    std::map<std::string, std::string> headers;
    int statuscode = 0;
  };

  plx_http_daemon();
  virtual ~plx_http_daemon();

  bool exec(int port);
  void stop();
  bool is_running();

  bool check_ssl_supported();
  void activate_ssl(const std::string& privatekey, const std::string& certificate);
  void activate_thread_pool(size_t threads);
  // Larger bodies are drained and answered with 413
  void set_max_body_bytes(size_t max_body_bytes);
  size_t get_max_body_bytes() const;

  virtual response handle(request req);

private:
  struct connection_state;

  static MHD_Result fill_request(void* req, enum MHD_ValueKind kind,
                                 const char* key, const char* value);

  static MHD_Result iterate_post(void* cls, enum MHD_ValueKind kind, const char* key,
                                 const char* filename, const char* content_type,
                                 const char* transfer_encoding, const char* data,
                                 uint64_t off, size_t size);

  static void request_completed(void* cls, struct MHD_Connection* connection,
                                void** con_cls, enum MHD_RequestTerminationCode toe);

  static MHD_Result echo(void* cls,
                         struct MHD_Connection* connection,
                         const char* url,
                         const char* method,
                         const char* version,
                         const char* upload_data,
                         size_t* upload_data_size,
                         void** ptr);

  void stop_locked();

  bool ssl;
  std::string privatekey;
  std::string certificate;
  volatile bool running;
  MHD_Daemon* daemon;
  size_t threads;
  size_t max_body_bytes;
  std::mutex mutex;
};

#endif // PLX_HTTPDAEMON_H
