#ifndef PLX_PDF_SIO_H
#define PLX_PDF_SIO_H

#include "../plx_doc_sio.h"
#include "plx_pdf_engine.h"
#include <memory>
#include <vector>

namespace PoDoFo {
  class PdfMemDocument;
}

// PDF <-> layout pages. parse() runs the extractor over the loaded document,
// serialize() reconstructs a new document from pages.
class plx_pdf_sio : public plx_doc_sio
{
private:
  const plx_pdf_engine& m_engine;
  std::unique_ptr<PoDoFo::PdfMemDocument> m_pdf;
  // Stable buffer for LoadFromBuffer, PoDoFo reads objects lazily
  std::vector<char> m_pdf_buffer;

public:
  explicit plx_pdf_sio(const plx_pdf_engine& engine);
  ~plx_pdf_sio();

  bool parse(const std::string& data) override;
  bool serialize(std::string& data) override;

  // Throwing variants for the service layer:
  // plx_user_error for empty input, plx_processing_error for engine failures
  void parse_or_throw(const std::string& data);
  std::string serialize_or_throw();
};

#endif // PLX_PDF_SIO_H
