#ifndef PLX_LAYOUT_BOUNDS_H
#define PLX_LAYOUT_BOUNDS_H

// Position and footprint of an element in the layout frame:
// origin at the top-left corner of the page, y grows downwards, units are points.
class plx_layout_bounds
{
public:
  double x = 0.0;
  double y = 0.0;
  double width = 0.0;
  double height = 0.0;

  plx_layout_bounds();
  plx_layout_bounds(double x_val, double y_val, double width_val, double height_val);
};

#endif // PLX_LAYOUT_BOUNDS_H
