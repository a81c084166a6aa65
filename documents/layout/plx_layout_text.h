#ifndef PLX_LAYOUT_TEXT_H
#define PLX_LAYOUT_TEXT_H

#include "plx_layout_bounds.h"
#include <string>

// RGB fill color, channels in 0..1
struct plx_color
{
  double r = 0.0;
  double g = 0.0;
  double b = 0.0;

  bool operator==(const plx_color& other) const
  {
    return r == other.r && g == other.g && b == other.b;
  }
};

// One positioned text run. y is the baseline in the layout frame,
// width/height is the run's approximate extent.
class plx_layout_text : public plx_layout_bounds
{
public:
  std::string text;
  double font_size = 12.0;
  std::string font_name;
  plx_color color;

  plx_layout_text() = default;
  plx_layout_text(const std::string& text_val, double x_val, double y_val, double font_size_val)
    : plx_layout_bounds(x_val, y_val, 0.0, font_size_val), text(text_val), font_size(font_size_val) {}
};

#endif // PLX_LAYOUT_TEXT_H
