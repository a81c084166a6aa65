#ifndef PLX_PDF_PAGE_WRITER_H
#define PLX_PDF_PAGE_WRITER_H

#include "../layout/plx_page_source.h"
#include "plx_pdf_engine.h"
#include <memory>

namespace PoDoFo {
  class PdfMemDocument;
  class PdfPainter;
  class PdfFont;
}

// Builds a new PDF through PoDoFo. All text is set in Helvetica (standard 14,
// not embedded). PNG and JPEG are embedded as they are, other raster formats
// are decoded with OpenCV and embedded as BGR pixels.
class plx_pdf_page_writer : public plx_page_canvas
{
public:
  explicit plx_pdf_page_writer(const plx_pdf_engine& engine);
  ~plx_pdf_page_writer();

  void begin_page(double width, double height, int rotation) override;
  void draw_text(const std::string& text, double x, double baseline_y,
                 double font_size, const plx_color& color) override;
  void draw_image(const std::string& encoded, const std::string& sniffed_mime,
                  double x, double y, double width, double height) override;
  void end_page() override;
  std::string finish() override;

private:
  PoDoFo::PdfPainter& painter();

  const plx_pdf_engine& m_engine;
  std::unique_ptr<PoDoFo::PdfMemDocument> m_pdf;
  std::unique_ptr<PoDoFo::PdfPainter> m_painter;
  PoDoFo::PdfFont* m_font;
};

#endif // PLX_PDF_PAGE_WRITER_H
