#include "plx_layout_page.h"

plx_layout_page::plx_layout_page(double width_val, double height_val, int rotation_val)
  : width(width_val), height(height_val), rotation(plx_normalize_rotation(rotation_val))
{
}

plx_layout_text& plx_layout_page::add_text(const plx_layout_text& text)
{
  elements.emplace_back(text);
  return std::get<plx_layout_text>(elements.back());
}

plx_layout_image& plx_layout_page::add_image(const plx_layout_image& image)
{
  elements.emplace_back(image);
  return std::get<plx_layout_image>(elements.back());
}

size_t plx_layout_page::text_count() const
{
  size_t count = 0;
  for (const auto& element : elements) {
    if (plx_is_text(element)) {
      count++;
    }
  }
  return count;
}

size_t plx_layout_page::image_count() const
{
  return elements.size() - text_count();
}

std::vector<const plx_layout_text*> plx_layout_page::texts() const
{
  std::vector<const plx_layout_text*> result;
  for (const auto& element : elements) {
    if (const auto* text = std::get_if<plx_layout_text>(&element)) {
      result.push_back(text);
    }
  }
  return result;
}

bool plx_is_text(const plx_layout_element& element)
{
  return std::holds_alternative<plx_layout_text>(element);
}

bool plx_is_image(const plx_layout_element& element)
{
  return std::holds_alternative<plx_layout_image>(element);
}

int plx_normalize_rotation(int rotation)
{
  int r = rotation % 360;
  if (r < 0) {
    r += 360;
  }
  return (r / 90) * 90;
}
