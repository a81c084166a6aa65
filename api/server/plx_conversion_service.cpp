#include "plx_conversion_service.h"
#include "../../documents/json/plx_json_sio.h"
#include "../../documents/pdf/plx_pdf_sio.h"
#include "../../utils/plx_exceptions.h"
#include "../../utils/plx_hash.h"
#include <iostream>

plx_conversion_service::plx_conversion_service(const plx_pdf_engine& engine, const plx_config& config)
  : m_engine(engine), m_config(config)
{
}

std::vector<plx_layout_page> plx_conversion_service::extract_pages(const std::string& pdf_bytes) const
{
  if (pdf_bytes.empty()) {
    throw plx_user_error("No document uploaded");
  }

  plx_pdf_sio pdf(m_engine);
  pdf.parse_or_throw(pdf_bytes);
  return pdf.pages;
}

std::string plx_conversion_service::extract(const std::string& pdf_bytes) const
{
  plx_json_options options;
  options.default_font_size = m_config.default_font_size;
  plx_json_sio json(options);
  json.pages = extract_pages(pdf_bytes);

  std::string data;
  if (!json.serialize(data)) {
    throw plx_processing_error(plx_processing_error::stage::serialize, "Failed to write JSON", json.last_error());
  }
  return data;
}

plx_document_result plx_conversion_service::reconstruct_pages(const std::vector<plx_layout_page>& pages) const
{
  plx_pdf_sio pdf(m_engine);
  pdf.pages = pages;

  plx_document_result result;
  result.data = pdf.serialize_or_throw();
  result.size = result.data.size();
  result.filename = plx_fnv1a64_hex(result.data) + ".pdf";
  return result;
}

plx_document_result plx_conversion_service::reconstruct(const std::string& json_body) const
{
  if (json_body.empty()) {
    throw plx_user_error("Empty request body");
  }

  plx_json_options options;
  options.strict = m_config.strict_elements;
  options.default_font_size = m_config.default_font_size;
  plx_json_sio json(options);
  json.parse_or_throw(json_body);

  return reconstruct_pages(json.pages);
}
