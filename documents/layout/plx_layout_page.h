#ifndef PLX_LAYOUT_PAGE_H
#define PLX_LAYOUT_PAGE_H

#include "plx_layout_text.h"
#include "plx_layout_image.h"
#include <variant>
#include <vector>

using plx_layout_element = std::variant<plx_layout_text, plx_layout_image>;

class plx_layout_page
{
public:
  double width = 0.0;
  double height = 0.0;
  // 0, 90, 180 or 270
  int rotation = 0;
  // extraction order; paint order when reconstructing
  std::vector<plx_layout_element> elements;

  plx_layout_page() = default;
  plx_layout_page(double width_val, double height_val, int rotation_val = 0);

  plx_layout_text& add_text(const plx_layout_text& text);
  plx_layout_image& add_image(const plx_layout_image& image);

  size_t text_count() const;
  size_t image_count() const;

  // Texts in element order, for callers that don't care about images
  std::vector<const plx_layout_text*> texts() const;
};

bool plx_is_text(const plx_layout_element& element);
bool plx_is_image(const plx_layout_element& element);

// Maps any angle onto 0/90/180/270, rounding down to a quarter turn
int plx_normalize_rotation(int rotation);

#endif // PLX_LAYOUT_PAGE_H
