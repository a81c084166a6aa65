#include "plx_pdf_page_writer.h"
#include "../image/plx_image_codec.h"
#include <podofo/podofo.h>
#include <opencv2/core.hpp>
#include <iostream>
#include <sstream>
#include <stdexcept>

using namespace PoDoFo;

plx_pdf_page_writer::plx_pdf_page_writer(const plx_pdf_engine& engine)
  : m_engine(engine), m_pdf(new PdfMemDocument()), m_font(nullptr)
{
}

plx_pdf_page_writer::~plx_pdf_page_writer()
{
}

PdfPainter& plx_pdf_page_writer::painter()
{
  if (m_painter == nullptr) {
    throw std::logic_error("no page open");
  }
  return *m_painter;
}

void plx_pdf_page_writer::begin_page(double width, double height, int rotation)
{
  if (m_painter != nullptr) {
    end_page();
  }
  if (!(width > 0) || !(height > 0)) {
    throw std::invalid_argument("page size must be positive");
  }

  auto& pdf_page = m_pdf->GetPages().CreatePage(Rect(0, 0, width, height));
  if (rotation != 0) {
    pdf_page.SetRotationRaw(rotation);
  }

  m_painter.reset(new PdfPainter());
  m_painter->SetCanvas(pdf_page);
}

void plx_pdf_page_writer::draw_text(const std::string& text, double x, double baseline_y,
                                    double font_size, const plx_color& color)
{
  if (m_font == nullptr) {
    m_font = &m_pdf->GetFonts().GetStandard14Font(PdfStandard14FontType::Helvetica);
  }
  double size = font_size > 0 ? font_size : m_engine.default_font_size();

  PdfPainter& p = painter();
  p.TextState.SetFont(*m_font, size);
  p.GraphicsState.SetNonStrokingColor(PdfColor(color.r, color.g, color.b));
  p.DrawText(text, x, baseline_y);
}

void plx_pdf_page_writer::draw_image(const std::string& encoded, const std::string& sniffed_mime,
                                     double x, double y, double width, double height)
{
  PdfPainter& p = painter();

  // Decoded before the image object exists, so a corrupt image leaves nothing behind
  cv::Mat image = plx_image_codec::decode(encoded);

  auto pdf_image = m_pdf->CreateImage();
  if (plx_image_codec::is_native_format(sniffed_mime)) {
    bufferview buffer(encoded.data(), encoded.size());
    pdf_image->LoadFromBuffer(buffer);
  } else {
    // Anything else, or an unknown format: embed the pixels OpenCV decoded
    bufferview pixels(reinterpret_cast<const char*>(image.data), image.step * image.rows);
    pdf_image->SetData(pixels, static_cast<unsigned>(image.cols), static_cast<unsigned>(image.rows),
                       PdfPixelFormat::BGR24, static_cast<int>(image.step));
  }

  double original_width = pdf_image->GetWidth();
  double original_height = pdf_image->GetHeight();
  if (original_width <= 0 || original_height <= 0) {
    throw std::runtime_error("image has no pixels");
  }

  // Without a declared footprint the image is placed at one point per pixel
  double scale_x = width > 0 ? width / original_width : 1.0;
  double scale_y = height > 0 ? height / original_height : 1.0;

  p.DrawImage(*pdf_image, x, y, scale_x, scale_y);
}

void plx_pdf_page_writer::end_page()
{
  if (m_painter == nullptr) {
    return;
  }
  m_painter->FinishDrawing();
  m_painter.reset();
}

std::string plx_pdf_page_writer::finish()
{
  end_page();

  // Serialize to buffer using PoDoFo StreamDevice
  std::stringstream buffer;
  StandardStreamDevice device(buffer);
  m_pdf->Save(device);
  return buffer.str();
}
