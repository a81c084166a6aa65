#ifndef PLX_PAGE_SOURCE_H
#define PLX_PAGE_SOURCE_H

#include "plx_layout_coords.h"
#include "plx_layout_text.h"
#include <string>
#include <vector>

// ============================================================================
// Seams between the layout model and the document engines.
// plx_pdf_content_reader and plx_pdf_page_writer implement them over PoDoFo,
// the tests implement them in memory.
// ============================================================================

// A glyph run as the parsing engine reports it. transform is the full text
// rendering matrix with the font size folded in, its translation is the
// baseline origin in page coordinates.
struct plx_text_run
{
  plx_matrix transform = plx_identity_matrix();
  std::string text;
  double width = 0.0;
  double height = 0.0;
  std::string font_name;
  // Tf size, 0 if unknown
  double font_size = 0.0;
  plx_color color;
};

// One entry of a page's low-level operator trace
struct plx_content_operator
{
  enum kind_t { set_transform, paint_image, paint_text, save_state, restore_state, other };

  kind_t kind = other;
  // set_transform: the transform in effect after the operator
  plx_matrix operands = plx_identity_matrix();
  // resource name of the painted object, if any
  std::string name;
  // engine-side handle for paint_image
  size_t resource_index = 0;
};

struct plx_page_content
{
  double width = 0.0;
  double height = 0.0;
  int rotation = 0;
  std::vector<plx_text_run> runs;
  std::vector<plx_content_operator> trace;
};

// Decoded pixels, BGR or BGRA interleaved, tightly packed
struct plx_raster
{
  std::string pixels;
  int width = 0;
  int height = 0;
  int channels = 3;
};

class plx_page_source
{
public:
  virtual ~plx_page_source() = default;

  virtual size_t page_count() const = 0;

  // Throws if the page content cannot be read
  virtual plx_page_content read_page(size_t page_index) = 0;

  // Throws if the image behind a paint_image operator cannot be decoded.
  // Valid for the page most recently returned by read_page().
  virtual plx_raster resolve_image(size_t page_index, const plx_content_operator& op) = 0;
};

class plx_page_canvas
{
public:
  virtual ~plx_page_canvas() = default;

  // Coordinates passed to draw_* are page coordinates (origin bottom-left)
  virtual void begin_page(double width, double height, int rotation) = 0;
  virtual void draw_text(const std::string& text, double x, double baseline_y,
                         double font_size, const plx_color& color) = 0;
  // x/y is the bottom-left corner of the placed image
  virtual void draw_image(const std::string& encoded, const std::string& sniffed_mime,
                          double x, double y, double width, double height) = 0;
  virtual void end_page() = 0;

  // Produces the finished document bytes
  virtual std::string finish() = 0;
};

#endif // PLX_PAGE_SOURCE_H
