#ifndef PLX_LAYOUT_RECONSTRUCTOR_H
#define PLX_LAYOUT_RECONSTRUCTOR_H

#include "plx_layout_page.h"
#include "plx_page_source.h"
#include <string>
#include <vector>

// Draws layout pages onto a canvas. Images are painted beneath text; an
// element that fails to draw is logged and skipped without failing the page.
class plx_layout_reconstructor
{
public:
  explicit plx_layout_reconstructor(double default_font_size = 12.0);

  // Returns the finished document bytes. Throws plx_processing_error if the
  // canvas cannot create a page or produce the document.
  std::string reconstruct(const std::vector<plx_layout_page>& pages, plx_page_canvas& canvas) const;

  // Returns the number of skipped elements
  size_t render_page(const plx_layout_page& page, plx_page_canvas& canvas) const;

  // Stable partition: images in their relative order, then texts in theirs
  static std::vector<const plx_layout_element*> paint_order(const plx_layout_page& page);

private:
  void draw_text(const plx_layout_text& text, double page_height, plx_page_canvas& canvas) const;
  void draw_image(const plx_layout_image& image, double page_height, plx_page_canvas& canvas) const;

  double m_default_font_size;
};

#endif // PLX_LAYOUT_RECONSTRUCTOR_H
