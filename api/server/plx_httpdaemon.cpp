#include "plx_httpdaemon.h"
#include "../../utils/plx_env.h"
#include <errno.h>
#include <string.h>
#include <iostream>

// Per-connection state, lives from the first callback until request_completed
struct plx_http_daemon::connection_state
{
  request req;
  MHD_PostProcessor* post = nullptr;
};

plx_http_daemon::plx_http_daemon()
{
  threads = 1;
  running = false;
  ssl = false;
  daemon = nullptr;
  max_body_bytes = 50 * 1024 * 1024;
}

plx_http_daemon::~plx_http_daemon()
{
  stop();
}

MHD_Result plx_http_daemon::fill_request(void* r, MHD_ValueKind kind, const char* key, const char* value)
{
  request* req = static_cast<request*>(r);
  if (key == nullptr)
  {
    return MHD_YES;
  }

  if (kind == MHD_GET_ARGUMENT_KIND)
  {
    req->params[key] = value != nullptr ? value : "";
  }
  else if (kind == MHD_HEADER_KIND)
  {
    req->headers[plx_to_lower(key)] = value != nullptr ? value : "";
  }
  return MHD_YES;
}

MHD_Result plx_http_daemon::iterate_post(void* cls, MHD_ValueKind, const char* key,
                                         const char* filename, const char*,
                                         const char*, const char* data,
                                         uint64_t, size_t size)
{
  request* req = static_cast<request*>(cls);
  if (key == nullptr)
  {
    return MHD_YES;
  }
  if (filename != nullptr)
  {
    req->filenames[key] = filename;
  }
  if (size > 0)
  {
    req->form[key].append(data, size);
  }
  return MHD_YES;
}

void plx_http_daemon::request_completed(void*, struct MHD_Connection*,
                                        void** con_cls,
                                        enum MHD_RequestTerminationCode toe)
{
  connection_state* state = static_cast<connection_state*>(*con_cls);
  if (!state)
  {
    return;
  }
  if (toe != MHD_REQUEST_TERMINATED_COMPLETED_OK)
  {
    std::cout << "Request " << state->req.method << " " << state->req.path
              << " terminated early (" << toe << ")" << std::endl;
  }
  if (state->post != nullptr)
  {
    MHD_destroy_post_processor(state->post);
  }
  delete state;
  *con_cls = nullptr;
}

MHD_Result plx_http_daemon::echo(void* cls, MHD_Connection* connection,
                                 const char* url,
                                 const char* method,
                                 const char*,
                                 const char* upload_data,
                                 size_t* upload_data_size,
                                 void** con_cls)
{
  plx_http_daemon* daemon = static_cast<plx_http_daemon*>(cls);
  connection_state* state = static_cast<connection_state*>(*con_cls);

  if (state == nullptr)
  {
    // This is the beginning of a new request
    std::cout << "Incoming request: " << method << ": " << url << std::endl;
    state = new connection_state();
    state->req.path = url;
    state->req.method = method;

    // The headers are already valid. Lets use them
    MHD_get_connection_values(connection, MHD_HEADER_KIND, &fill_request, &state->req);

    auto content_type = state->req.headers.find("content-type");
    if (content_type != state->req.headers.end() &&
        plx_starts_with(plx_to_lower(content_type->second), "multipart/form-data"))
    {
      state->post = MHD_create_post_processor(connection, 64 * 1024, &iterate_post, &state->req);
      if (state->post == nullptr)
      {
        std::cerr << "Warning: could not create post processor, reading raw body" << std::endl;
      }
    }

    *con_cls = state;
    return MHD_YES;
  }

  request& req = state->req;

  if (*upload_data_size)
  {
    req.received += *upload_data_size;
    if (req.received > daemon->max_body_bytes)
    {
      // keep draining, the body is dropped
      req.too_large = true;
      req.body.clear();
      req.form.clear();
    }
    else if (state->post != nullptr)
    {
      if (MHD_post_process(state->post, upload_data, *upload_data_size) != MHD_YES)
      {
        std::cerr << "Warning: malformed multipart body" << std::endl;
      }
    }
    else
    {
      req.body.append(upload_data, *upload_data_size);
    }
    // Tell MHD that we have consumed the chunk
    *upload_data_size = 0;
    return MHD_YES;
  }

  // Get url parameters
  MHD_get_connection_values(connection, MHD_GET_ARGUMENT_KIND, &fill_request, &req);

  // Process the constructed request
  response result(daemon->handle(req));

  // Construct response
  MHD_Response* resp = MHD_create_response_from_buffer(result.body.size(),
                                                       (void*) result.body.data(),
                                                       MHD_RESPMEM_MUST_COPY);
  if (resp == nullptr)
  {
    std::cerr << "Error: could not create response" << std::endl;
    return MHD_NO;
  }
  for (auto i = result.headers.begin(); i != result.headers.end(); ++i)
  {
    MHD_add_response_header(resp, i->first.c_str(), i->second.c_str());
  }
  MHD_Result ret = MHD_queue_response(connection, result.statuscode, resp);
  MHD_destroy_response(resp);
  std::cout << "Finished " << req.method << " " << req.path << " with statuscode " << result.statuscode
            << " (" << result.body.size() << " bytes)" << std::endl;
  return ret;
}

bool plx_http_daemon::exec(int port)
{
  std::lock_guard<std::mutex> lock(mutex);
  if (running)
  {
    stop_locked();
  }
  std::cout << "Starting daemon on port " << port << " using " << threads << " threads." << std::endl;
  if (ssl)
  {
    daemon = MHD_start_daemon(MHD_USE_INTERNAL_POLLING_THREAD | MHD_USE_SSL,
                              port,
                              nullptr,
                              nullptr,
                              &echo,
                              this,
                              MHD_OPTION_THREAD_POOL_SIZE, static_cast<unsigned int>(threads),
                              MHD_OPTION_HTTPS_MEM_KEY, privatekey.c_str(),
                              MHD_OPTION_HTTPS_MEM_CERT, certificate.c_str(),
                              MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                              MHD_OPTION_END
                              );
  }
  else
  {
    daemon = MHD_start_daemon(MHD_USE_INTERNAL_POLLING_THREAD,
                              port,
                              nullptr,
                              nullptr,
                              &echo,
                              this,
                              MHD_OPTION_THREAD_POOL_SIZE, static_cast<unsigned int>(threads),
                              MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                              MHD_OPTION_END
                              );
  }
  if (daemon == nullptr)
  {
    std::cerr << "Error starting daemon: " << strerror(errno) << std::endl;
    return false;
  }

  running = true;
  return true;
}

void plx_http_daemon::stop()
{
  std::lock_guard<std::mutex> lock(mutex);
  stop_locked();
}

void plx_http_daemon::stop_locked()
{
  if (running && daemon != nullptr)
  {
    MHD_stop_daemon(daemon);
    daemon = nullptr;
  }
  running = false;
}

bool plx_http_daemon::is_running()
{
  return running;
}

bool plx_http_daemon::check_ssl_supported()
{
  return MHD_YES == MHD_is_feature_supported(MHD_FEATURE_SSL);
}

void plx_http_daemon::activate_ssl(const std::string& privatekey, const std::string& certificate)
{
  this->privatekey = privatekey;
  this->certificate = certificate;
  ssl = true;
}

void plx_http_daemon::activate_thread_pool(size_t threads)
{
  this->threads = threads > 0 ? threads : 1;
}

void plx_http_daemon::set_max_body_bytes(size_t max_body_bytes)
{
  this->max_body_bytes = max_body_bytes;
}

size_t plx_http_daemon::get_max_body_bytes() const
{
  return max_body_bytes;
}

plx_http_daemon::response plx_http_daemon::handle(plx_http_daemon::request req)
{
  response r;
  r.body = req.body;
  r.statuscode = 200;
  return r;
}
