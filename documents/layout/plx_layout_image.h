#ifndef PLX_LAYOUT_IMAGE_H
#define PLX_LAYOUT_IMAGE_H

#include "plx_layout_bounds.h"
#include <string>

// A placed raster image. width/height is the placed footprint on the page,
// not the pixel size. y is the top edge in the layout frame.
class plx_layout_image : public plx_layout_bounds
{
public:
  // encoded image file bytes (PNG, JPEG, ...)
  std::string data;
  // declared label only, the real format is sniffed from data
  std::string mime_type;

  plx_layout_image() = default;
  plx_layout_image(double x_val, double y_val, double width_val, double height_val)
    : plx_layout_bounds(x_val, y_val, width_val, height_val) {}
};

#endif // PLX_LAYOUT_IMAGE_H
