#ifndef PLX_PDF_CONTENT_READER_H
#define PLX_PDF_CONTENT_READER_H

#include "../layout/plx_page_source.h"
#include <memory>
#include <vector>

#include <podofo/podofo.h>

// Reads glyph runs and the operator trace of PoDoFo pages.
//
// Text state follows the content stream operators (cm, q/Q, BT/ET, Tf, Tm,
// Td/TD/T*, TL, Tc, Tw, Tz, Ts and the show operators). Every Tj, ', " and
// TJ yields one run whose transform is the text rendering matrix.
// Form XObjects are followed, image XObjects become paint_image entries.
class plx_pdf_content_reader : public plx_page_source
{
public:
  plx_pdf_content_reader(PoDoFo::PdfMemDocument& document, double default_font_size = 12.0);

  size_t page_count() const override;
  plx_page_content read_page(size_t page_index) override;
  plx_raster resolve_image(size_t page_index, const plx_content_operator& op) override;

private:
  struct text_state;
  struct read_context;

  PoDoFo::PdfMemDocument& m_document;
  double m_default_font_size;
  size_t m_current_page;
  std::vector<std::shared_ptr<const PoDoFo::PdfXObject>> m_images;
};

#endif // PLX_PDF_CONTENT_READER_H
