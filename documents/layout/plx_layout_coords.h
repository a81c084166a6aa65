#ifndef PLX_LAYOUT_COORDS_H
#define PLX_LAYOUT_COORDS_H

#include <algorithm>
#include <array>
#include <cmath>

// Affine transform [a b c d e f] as used by page content streams:
// x' = a*x + c*y + e, y' = b*x + d*y + f
using plx_matrix = std::array<double, 6>;

inline plx_matrix plx_identity_matrix()
{
  return plx_matrix{1.0, 0.0, 0.0, 1.0, 0.0, 0.0};
}

// Where an element lands in the layout frame and how much it is scaled
struct plx_placement
{
  double x = 0.0;
  double y = 0.0;
  double scale_x = 1.0;
  double scale_y = 1.0;
  // true if the matrix was unusable and the fallback placement was taken
  bool degenerate = false;
};

namespace plx_coords {
  /**
   * @brief Converts a bottom-up page y coordinate into the top-down layout frame.
   * @param raw_y y in page units, origin at the bottom edge
   * @param height page height
   */
  inline double to_canonical_y(double raw_y, double height) {
    return height - raw_y;
  }

  /**
   * @brief Converts a layout y back into page coordinates.
   * @param canonical_y top edge (or baseline for text) in the layout frame
   * @param height target page height
   * @param element_height height of the element, 0 for baseline-anchored text
   * @return y of the element's bottom edge in page coordinates
   *
   * from_canonical_y(to_canonical_y(y, h), h, 0) == y
   */
  inline double from_canonical_y(double canonical_y, double height, double element_height) {
    return height - canonical_y - element_height;
  }

  /**
   * @brief Resolves a transform matrix into a layout placement.
   *
   * scale_x = |(a, b)|, scale_y = |(c, d)|, position from the translation (e, f).
   * Non-finite entries or a zero scale yield the fallback placement at (0, 0)
   * with unit scale and degenerate set.
   */
  inline plx_placement matrix_to_origin(const plx_matrix& m, double page_height) {
    plx_placement p;
    for (double v : m) {
      if (!std::isfinite(v)) {
        p.degenerate = true;
        return p;
      }
    }
    if (!std::isfinite(page_height)) {
      p.degenerate = true;
      return p;
    }

    double sx = std::hypot(m[0], m[1]);
    double sy = std::hypot(m[2], m[3]);
    if (sx == 0.0 || sy == 0.0) {
      p.degenerate = true;
      return p;
    }

    p.scale_x = sx;
    p.scale_y = sy;
    p.x = m[4];
    p.y = to_canonical_y(m[5], page_height);
    return p;
  }

  /**
   * @brief Layout y of the top edge of a box whose bottom edge sits at raw_bottom.
   */
  inline double to_canonical_top(double raw_bottom, double box_height, double page_height) {
    return to_canonical_y(raw_bottom + box_height, page_height);
  }

  /**
   * @brief Placement of the unit square mapped through m, as images are painted.
   *
   * x is the left edge and y the top edge of the mapped square's bounding box,
   * so flipped (d < 0) and rotated transforms land where they are drawn.
   * Scales and the degenerate fallback are those of matrix_to_origin.
   */
  inline plx_placement unit_square_to_origin(const plx_matrix& m, double page_height) {
    plx_placement p = matrix_to_origin(m, page_height);
    if (p.degenerate) {
      return p;
    }

    const double xs[4] = {m[4], m[4] + m[0], m[4] + m[2], m[4] + m[0] + m[2]};
    const double ys[4] = {m[5], m[5] + m[1], m[5] + m[3], m[5] + m[1] + m[3]};
    double bottom = *std::min_element(ys, ys + 4);
    double top = *std::max_element(ys, ys + 4);

    p.x = *std::min_element(xs, xs + 4);
    p.y = to_canonical_top(bottom, top - bottom, page_height);
    return p;
  }

  // Row-vector product as in content streams: apply lhs first, then rhs
  inline plx_matrix multiply(const plx_matrix& lhs, const plx_matrix& rhs) {
    return plx_matrix{
      lhs[0] * rhs[0] + lhs[1] * rhs[2],
      lhs[0] * rhs[1] + lhs[1] * rhs[3],
      lhs[2] * rhs[0] + lhs[3] * rhs[2],
      lhs[2] * rhs[1] + lhs[3] * rhs[3],
      lhs[4] * rhs[0] + lhs[5] * rhs[2] + rhs[4],
      lhs[4] * rhs[1] + lhs[5] * rhs[3] + rhs[5]
    };
  }
} // namespace plx_coords

#endif // PLX_LAYOUT_COORDS_H
