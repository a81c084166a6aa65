#include "plx_pdf_sio.h"
#include "plx_pdf_content_reader.h"
#include "plx_pdf_page_writer.h"
#include "../layout/plx_layout_extractor.h"
#include "../layout/plx_layout_reconstructor.h"
#include "../../utils/plx_exceptions.h"
#include <podofo/podofo.h>
#include <iostream>

using namespace PoDoFo;

plx_pdf_sio::plx_pdf_sio(const plx_pdf_engine& engine)
  : m_engine(engine)
{
}

plx_pdf_sio::~plx_pdf_sio()
{
}

bool plx_pdf_sio::parse(const std::string& data)
{
  try {
    parse_or_throw(data);
    return true;
  } catch (const plx_exception& e) {
    std::string detail = e.get_detail();
    set_error(detail.empty() ? std::string(e.what()) : std::string(e.what()) + ": " + detail);
    return false;
  }
}

bool plx_pdf_sio::serialize(std::string& data)
{
  try {
    data = serialize_or_throw();
    return true;
  } catch (const plx_exception& e) {
    std::string detail = e.get_detail();
    set_error(detail.empty() ? std::string(e.what()) : std::string(e.what()) + ": " + detail);
    return false;
  }
}

void plx_pdf_sio::parse_or_throw(const std::string& data)
{
  clear_error();
  if (data.empty()) {
    throw plx_user_error("Empty document");
  }

  m_pdf.reset(new PdfMemDocument());
  m_pdf_buffer.assign(data.data(), data.data() + data.size());
  bufferview buffer(m_pdf_buffer.data(), m_pdf_buffer.size());

  try {
    m_pdf->LoadFromBuffer(buffer);
    std::cout << "PDF loaded: " << data.size() << " bytes, " << m_pdf->GetPages().GetCount() << " page(s)" << std::endl;

    plx_pdf_content_reader reader(*m_pdf, m_engine.default_font_size());
    plx_layout_extractor extractor(m_engine.default_font_size());
    pages = extractor.extract(reader);
  } catch (const plx_exception&) {
    m_pdf.reset();
    throw;
  } catch (const std::exception& e) {
    m_pdf.reset();
    throw plx_processing_error(plx_processing_error::stage::parse, "Document could not be parsed", e.what());
  }
}

std::string plx_pdf_sio::serialize_or_throw()
{
  clear_error();

  plx_pdf_page_writer writer(m_engine);
  plx_layout_reconstructor reconstructor(m_engine.default_font_size());
  try {
    return reconstructor.reconstruct(pages, writer);
  } catch (const plx_exception&) {
    throw;
  } catch (const std::exception& e) {
    throw plx_processing_error(plx_processing_error::stage::serialize, "Failed to write document", e.what());
  }
}
