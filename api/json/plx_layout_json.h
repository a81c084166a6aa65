#ifndef PLX_LAYOUT_JSON_H
#define PLX_LAYOUT_JSON_H

#include "../../documents/layout/plx_layout_page.h"
#include <string>
#include <vector>

// nlohmann::json stays out of this header.

struct plx_json_options
{
  // Reject malformed text elements and unknown element types instead of
  // filling in defaults or skipping them
  bool strict = false;
  double default_font_size = 12.0;
  // Indentation for create_document, -1 for compact output
  int indent = -1;
};

/**
 * JSON form of the layout:
 *
 *   { "pages": [ { "width", "height", "rotation", "elements": [
 *       { "type": "text", "text", "x", "y", "fontSize", "width", "height", "fontName", "color": [r, g, b] },
 *       { "type": "image", "x", "y", "width", "height", "src": "data:image/png;base64,..." } ] } ] }
 */
class plx_layout_json
{
public:
  explicit plx_layout_json(const plx_json_options& options = plx_json_options());

  // Throws plx_user_error if the text is not JSON or has no "pages" array.
  // Element-level problems are logged and the element skipped (lenient mode).
  std::vector<plx_layout_page> parse_document(const std::string& json_string) const;

  std::string create_document(const std::vector<plx_layout_page>& pages) const;

  // "#RRGGBB" into 0..1 channels. False (color untouched) if malformed.
  static bool parse_hex_color(const std::string& hex_color, plx_color& color);

private:
  plx_json_options m_options;
};

#endif // PLX_LAYOUT_JSON_H
