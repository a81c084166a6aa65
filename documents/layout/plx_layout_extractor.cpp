#include "plx_layout_extractor.h"
#include "plx_layout_coords.h"
#include "../image/plx_image_codec.h"
#include "../../utils/plx_exceptions.h"
#include <iostream>

plx_layout_extractor::plx_layout_extractor(double default_font_size)
  : m_default_font_size(default_font_size > 0 ? default_font_size : 12.0)
{
}

std::vector<plx_layout_page> plx_layout_extractor::extract(plx_page_source& source) const
{
  std::vector<plx_layout_page> pages;
  size_t count = source.page_count();
  pages.reserve(count);

  for (size_t page_index = 0; page_index < count; page_index++) {
    pages.push_back(extract_page(source, page_index));
  }

  std::cout << "Extracted " << pages.size() << " page(s)" << std::endl;
  return pages;
}

plx_layout_page plx_layout_extractor::extract_page(plx_page_source& source, size_t page_index) const
{
  const int page_number = static_cast<int>(page_index) + 1;

  plx_page_content content;
  try {
    content = source.read_page(page_index);
  } catch (const plx_processing_error&) {
    throw;
  } catch (const std::exception& e) {
    throw plx_processing_error(plx_processing_error::stage::parse,
                               "Failed to read page " + std::to_string(page_number), e.what(), page_number);
  }

  plx_layout_page page(content.width, content.height, content.rotation);

  // Text runs first, in run order
  for (const auto& run : content.runs) {
    if (run.text.empty()) {
      continue;
    }
    page.add_text(text_from_run(run, content.height));
  }

  // Images after all text, in trace order
  size_t skipped = 0;
  for (size_t i = 0; i < content.trace.size(); i++) {
    const auto& op = content.trace[i];
    if (op.kind != plx_content_operator::paint_image) {
      continue;
    }

    try {
      plx_raster raster = source.resolve_image(page_index, op);

      plx_layout_image image;
      image.data = plx_image_codec::encode_png(raster);
      image.mime_type = "image/png";

      long t = find_preceding_transform(content.trace, i);
      plx_matrix m = t >= 0 ? content.trace[static_cast<size_t>(t)].operands : plx_identity_matrix();
      plx_placement placement = plx_coords::unit_square_to_origin(m, content.height);

      if (placement.degenerate) {
        std::cerr << "Warning: page " << page_number << ": unusable transform for image "
                  << op.name << ", placing it at the origin" << std::endl;
        image.x = 0.0;
        image.y = 0.0;
        image.width = raster.width;
        image.height = raster.height;
      } else {
        image.x = placement.x;
        image.y = placement.y;
        image.width = placement.scale_x;
        image.height = placement.scale_y;
      }

      page.add_image(image);
    } catch (const std::exception& e) {
      skipped++;
      std::cerr << "Warning: page " << page_number << ": skipping image " << op.name
                << ": " << e.what() << std::endl;
    }
  }

  std::cout << "Page " << page_number << ": " << page.text_count() << " texts, "
            << page.image_count() << " images";
  if (skipped > 0) {
    std::cout << ", " << skipped << " images skipped";
  }
  std::cout << std::endl;

  return page;
}

plx_layout_text plx_layout_extractor::text_from_run(const plx_text_run& run, double page_height) const
{
  plx_layout_text text;
  text.text = run.text;
  text.font_name = run.font_name;
  text.color = run.color;

  plx_placement placement = plx_coords::matrix_to_origin(run.transform, page_height);
  if (placement.degenerate) {
    text.x = 0.0;
    text.y = 0.0;
    text.font_size = run.font_size > 0 ? run.font_size : m_default_font_size;
  } else {
    text.x = placement.x;
    text.y = placement.y;
    text.font_size = placement.scale_y;
  }

  text.width = run.width > 0 ? run.width : 0.0;
  text.height = run.height > 0 ? run.height : text.font_size;
  return text;
}

long plx_layout_extractor::find_preceding_transform(const std::vector<plx_content_operator>& trace, size_t index)
{
  if (index > trace.size()) {
    index = trace.size();
  }
  for (size_t i = index; i > 0; i--) {
    if (trace[i - 1].kind == plx_content_operator::set_transform) {
      return static_cast<long>(i - 1);
    }
  }
  return -1;
}
