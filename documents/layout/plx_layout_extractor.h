#ifndef PLX_LAYOUT_EXTRACTOR_H
#define PLX_LAYOUT_EXTRACTOR_H

#include "plx_layout_page.h"
#include "plx_page_source.h"
#include <vector>

// Turns the runs and operator trace of each source page into layout pages.
// Per page, all text elements come first in run order, followed by the
// images in trace order.
class plx_layout_extractor
{
public:
  explicit plx_layout_extractor(double default_font_size = 12.0);

  // Throws plx_processing_error if a page cannot be read.
  // Images that fail to decode are logged and left out.
  std::vector<plx_layout_page> extract(plx_page_source& source) const;
  plx_layout_page extract_page(plx_page_source& source, size_t page_index) const;

  plx_layout_text text_from_run(const plx_text_run& run, double page_height) const;

  /**
   * @brief Nearest set_transform strictly before index.
   * @return its position in the trace, or -1 if there is none
   *
   * Linear scan per image, so O(n^2) for a page full of images.
   */
  static long find_preceding_transform(const std::vector<plx_content_operator>& trace, size_t index);

private:
  double m_default_font_size;
};

#endif // PLX_LAYOUT_EXTRACTOR_H
