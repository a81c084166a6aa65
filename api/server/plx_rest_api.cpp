#include "plx_rest_api.h"
#include "../../utils/plx_base64.h"
#include "../../utils/plx_env.h"
#include "../../utils/plx_exceptions.h"
#include <nlohmann/json.hpp>
#include <iostream>

plx_rest_api::plx_rest_api(const plx_pdf_engine& engine, const plx_config& config)
  : service(engine, config)
{
  set_max_body_bytes(config.max_body_bytes);
}

plx_http_daemon::response plx_rest_api::handle(plx_http_daemon::request req)
{
  response r;
  if (req.method == "OPTIONS")
  {
    r.headers["Access-Control-Allow-Headers"] = "Content-Type, Authorization";
    r.headers["Access-Control-Allow-Methods"] = "POST, OPTIONS";
    r.statuscode = 204;
  }
  else if (req.too_large)
  {
    plx_payload_too_large e(req.received, get_max_body_bytes());
    r = error_response(413, "payload_too_large", e.get_detail());
  }
  else
  {
    r = dispatch(req);
  }

  std::string origin = req.headers["origin"];
  r.headers["Access-Control-Allow-Origin"] = origin.empty() ? "*" : origin;
  return r;
}

plx_http_daemon::response plx_rest_api::dispatch(request& req)
{
  try
  {
    if (req.path == "/pdfToJson")
    {
      if (req.method != "POST")
        return error_response(405, "method_not_allowed", req.method + " " + req.path);
      return pdf_to_json(req);
    }
    if (req.path == "/jsonToPdf")
    {
      if (req.method != "POST")
        return error_response(405, "method_not_allowed", req.method + " " + req.path);
      return json_to_pdf(req);
    }
    return error_response(404, "not_found", req.path);
  }
  catch (const plx_user_error& e)
  {
    std::string detail = e.get_detail();
    return error_response(400, "invalid_request", detail.empty() ? e.what() : std::string(e.what()) + ": " + detail);
  }
  catch (const plx_processing_error& e)
  {
    std::cerr << "Error: " << e.what() << ": " << e.get_detail() << std::endl;
    bool unreadable = e.get_stage() == plx_processing_error::stage::parse;
    return error_response(unreadable ? 422 : 500,
                          unreadable ? "unprocessable_document" : "document_write_failed",
                          std::string(e.what()) + (e.get_detail().empty() ? "" : ": " + e.get_detail()));
  }
  catch (const std::exception& e)
  {
    std::cerr << "Error: unexpected failure in " << req.path << ": " << e.what() << std::endl;
    return error_response(500, "internal_error", e.what());
  }
}

plx_http_daemon::response plx_rest_api::pdf_to_json(request& req)
{
  const std::string* upload = nullptr;
  auto file = req.form.find("file");
  if (file != req.form.end())
  {
    upload = &file->second;
    std::cout << "Converting upload " << req.filenames["file"] << " (" << upload->size() << " bytes)" << std::endl;
  }
  else if (req.form.empty())
  {
    upload = &req.body;
  }

  if (upload == nullptr || upload->empty())
  {
    throw plx_user_error("No file uploaded", "expected multipart field \"file\" or a PDF request body");
  }

  response r;
  r.body = service.extract(*upload);
  r.headers["Content-Type"] = "application/json";
  r.headers["Content-Disposition"] = "attachment; filename=\"document.json\"";
  r.statuscode = 200;
  return r;
}

plx_http_daemon::response plx_rest_api::json_to_pdf(request& req)
{
  plx_document_result document = service.reconstruct(req.body);

  response r;
  if (plx_to_lower(req.params["format"]) == "json")
  {
    nlohmann::json envelope = {
      {"filename", document.filename},
      {"size", document.size},
      {"data", plx_base64_encode(document.data)}
    };
    r.body = envelope.dump();
    r.headers["Content-Type"] = "application/json";
  }
  else
  {
    r.body = document.data;
    r.headers["Content-Type"] = "application/pdf";
    r.headers["Content-Disposition"] = "attachment; filename=\"" + document.filename + "\"";
  }
  r.headers["X-Document-Size"] = std::to_string(document.size);
  r.statuscode = 200;
  return r;
}

plx_http_daemon::response plx_rest_api::error_response(int statuscode, const std::string& kind, const std::string& detail)
{
  response r;
  nlohmann::json body = {
    {"error", kind},
    {"detail", detail}
  };
  r.body = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  r.headers["Content-Type"] = "application/json";
  r.statuscode = statuscode;
  return r;
}
