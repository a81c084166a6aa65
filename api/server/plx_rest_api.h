#ifndef PLX_REST_API_H
#define PLX_REST_API_H

#include "plx_httpdaemon.h"
#include "plx_conversion_service.h"

// POST /pdfToJson   multipart field "file" or raw PDF body -> layout JSON
// POST /jsonToPdf   layout JSON -> PDF (or base64 envelope with ?format=json)
// OPTIONS *         CORS preflight
class plx_rest_api : public plx_http_daemon
{
  plx_conversion_service service;

public:
  plx_rest_api(const plx_pdf_engine& engine, const plx_config& config);

  response handle(request req) override;
  response dispatch(request& req);

  // {"error": kind, "detail": detail} with the given status
  static response error_response(int statuscode, const std::string& kind, const std::string& detail);

private:
  response pdf_to_json(request& req);
  response json_to_pdf(request& req);
};

#endif // PLX_REST_API_H
