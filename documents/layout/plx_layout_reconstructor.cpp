#include "plx_layout_reconstructor.h"
#include "plx_layout_coords.h"
#include "../image/plx_image_codec.h"
#include "../../utils/plx_exceptions.h"
#include <iostream>
#include <stdexcept>

plx_layout_reconstructor::plx_layout_reconstructor(double default_font_size)
  : m_default_font_size(default_font_size > 0 ? default_font_size : 12.0)
{
}

std::string plx_layout_reconstructor::reconstruct(const std::vector<plx_layout_page>& pages, plx_page_canvas& canvas) const
{
  size_t skipped = 0;
  for (size_t i = 0; i < pages.size(); i++) {
    skipped += render_page(pages[i], canvas);
  }

  std::string data;
  try {
    data = canvas.finish();
  } catch (const std::exception& e) {
    throw plx_processing_error(plx_processing_error::stage::serialize, "Failed to write document", e.what());
  }

  std::cout << "Reconstructed " << pages.size() << " page(s), " << data.size() << " bytes";
  if (skipped > 0) {
    std::cout << ", " << skipped << " element(s) skipped";
  }
  std::cout << std::endl;
  return data;
}

size_t plx_layout_reconstructor::render_page(const plx_layout_page& page, plx_page_canvas& canvas) const
{
  try {
    canvas.begin_page(page.width, page.height, plx_normalize_rotation(page.rotation));
  } catch (const std::exception& e) {
    throw plx_processing_error(plx_processing_error::stage::serialize, "Failed to create page", e.what());
  }

  size_t skipped = 0;
  for (const plx_layout_element* element : paint_order(page)) {
    try {
      if (const auto* image = std::get_if<plx_layout_image>(element)) {
        draw_image(*image, page.height, canvas);
      } else {
        draw_text(std::get<plx_layout_text>(*element), page.height, canvas);
      }
    } catch (const std::exception& e) {
      skipped++;
      std::cerr << "Warning: skipping " << (plx_is_image(*element) ? "image" : "text")
                << " element: " << e.what() << std::endl;
    }
  }

  try {
    canvas.end_page();
  } catch (const std::exception& e) {
    throw plx_processing_error(plx_processing_error::stage::serialize, "Failed to finish page", e.what());
  }
  return skipped;
}

std::vector<const plx_layout_element*> plx_layout_reconstructor::paint_order(const plx_layout_page& page)
{
  std::vector<const plx_layout_element*> order;
  order.reserve(page.elements.size());
  for (const auto& element : page.elements) {
    if (plx_is_image(element)) {
      order.push_back(&element);
    }
  }
  for (const auto& element : page.elements) {
    if (plx_is_text(element)) {
      order.push_back(&element);
    }
  }
  return order;
}

void plx_layout_reconstructor::draw_text(const plx_layout_text& text, double page_height, plx_page_canvas& canvas) const
{
  if (text.text.empty()) {
    return;
  }
  double size = text.font_size > 0 ? text.font_size : m_default_font_size;
  // text is anchored at its baseline
  double baseline = plx_coords::from_canonical_y(text.y, page_height, 0.0);
  canvas.draw_text(text.text, text.x, baseline, size, text.color);
}

void plx_layout_reconstructor::draw_image(const plx_layout_image& image, double page_height, plx_page_canvas& canvas) const
{
  if (image.data.empty()) {
    throw std::runtime_error("image has no data");
  }
  std::string mime = plx_image_codec::detect_format(image.data);
  if (!image.mime_type.empty() && !mime.empty() && mime != image.mime_type) {
    std::cout << "Image declared as " << image.mime_type << " but contains " << mime << std::endl;
  }
  double height = image.height > 0 ? image.height : 0.0;
  double y = plx_coords::from_canonical_y(image.y, page_height, height);
  canvas.draw_image(image.data, mime, image.x, y, image.width, image.height);
}
