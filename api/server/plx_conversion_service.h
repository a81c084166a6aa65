#ifndef PLX_CONVERSION_SERVICE_H
#define PLX_CONVERSION_SERVICE_H

#include "../../documents/layout/plx_layout_page.h"
#include "../../documents/pdf/plx_pdf_engine.h"
#include "../../utils/plx_config.h"
#include <string>
#include <vector>

struct plx_document_result
{
  std::string data;
  size_t size = 0;
  // content-addressable name, "<fnv1a-64 hex>.pdf"
  std::string filename;
};

// The two conversions without any transport around them. Every call works
// on its own page list; nothing is shared between calls except the engine.
//
// Errors: plx_user_error for unusable input, plx_processing_error when the
// PDF engine fails. Element-level problems never fail a call.
class plx_conversion_service
{
public:
  plx_conversion_service(const plx_pdf_engine& engine, const plx_config& config);

  std::vector<plx_layout_page> extract_pages(const std::string& pdf_bytes) const;
  // Returns the JSON document {"pages": [...]}
  std::string extract(const std::string& pdf_bytes) const;

  plx_document_result reconstruct_pages(const std::vector<plx_layout_page>& pages) const;
  // Takes the JSON document {"pages": [...]}
  plx_document_result reconstruct(const std::string& json_body) const;

private:
  const plx_pdf_engine& m_engine;
  plx_config m_config;
};

#endif // PLX_CONVERSION_SERVICE_H
