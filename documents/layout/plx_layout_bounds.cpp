#include "plx_layout_bounds.h"

plx_layout_bounds::plx_layout_bounds()
{
}

plx_layout_bounds::plx_layout_bounds(double x_val, double y_val, double width_val, double height_val)
  : x(x_val), y(y_val), width(width_val), height(height_val)
{
}
