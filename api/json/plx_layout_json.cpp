#include "plx_layout_json.h"
#include "../../documents/image/plx_image_codec.h"
#include "../../utils/plx_base64.h"
#include "../../utils/plx_exceptions.h"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cmath>
#include <iostream>

using json = nlohmann::json;

namespace {

  const double DEFAULT_PAGE_WIDTH = 595.28;
  const double DEFAULT_PAGE_HEIGHT = 841.89;

  bool read_number(const json& obj, const char* key, double& out) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) {
      return false;
    }
    double value = it->get<double>();
    if (!std::isfinite(value)) {
      return false;
    }
    out = value;
    return true;
  }

  double number_or(const json& obj, const char* key, double def) {
    double value = def;
    read_number(obj, key, value);
    return value;
  }

  std::string string_or(const json& obj, const char* key, const std::string& def) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
      return def;
    }
    return it->get<std::string>();
  }

  double clamp_channel(double v) {
    if (v < 0.0) return 0.0;
    if (v > 1.0) return 1.0;
    return v;
  }

  // [r, g, b], {"r","g","b"} or "#RRGGBB"
  bool read_color(const json& value, plx_color& color) {
    if (value.is_string()) {
      return plx_layout_json::parse_hex_color(value.get<std::string>(), color);
    }

    double r = 0, g = 0, b = 0;
    if (value.is_array()) {
      if (value.size() != 3 || !value[0].is_number() || !value[1].is_number() || !value[2].is_number()) {
        return false;
      }
      r = value[0].get<double>();
      g = value[1].get<double>();
      b = value[2].get<double>();
    } else if (value.is_object()) {
      if (!read_number(value, "r", r) || !read_number(value, "g", g) || !read_number(value, "b", b)) {
        return false;
      }
    } else {
      return false;
    }

    // 0..255 notation
    if (r > 1.0 || g > 1.0 || b > 1.0) {
      r /= 255.0;
      g /= 255.0;
      b /= 255.0;
    }
    color.r = clamp_channel(r);
    color.g = clamp_channel(g);
    color.b = clamp_channel(b);
    return true;
  }

  json color_to_json(const plx_color& color) {
    return json::array({color.r, color.g, color.b});
  }

  struct element_writer {
    json operator()(const plx_layout_text& text) const {
      return {
        {"type", "text"},
        {"text", text.text},
        {"x", text.x},
        {"y", text.y},
        {"fontSize", text.font_size},
        {"width", text.width},
        {"height", text.height},
        {"fontName", text.font_name},
        {"color", color_to_json(text.color)}
      };
    }

    json operator()(const plx_layout_image& image) const {
      std::string mime = image.mime_type.empty() ? plx_image_codec::detect_format(image.data) : image.mime_type;
      if (mime.empty()) {
        mime = "application/octet-stream";
      }
      return {
        {"type", "image"},
        {"x", image.x},
        {"y", image.y},
        {"width", image.width},
        {"height", image.height},
        {"src", plx_make_data_uri(mime, image.data)}
      };
    }
  };

} // namespace

plx_layout_json::plx_layout_json(const plx_json_options& options)
  : m_options(options)
{
  if (m_options.default_font_size <= 0) {
    m_options.default_font_size = 12.0;
  }
}

bool plx_layout_json::parse_hex_color(const std::string& hex_color, plx_color& color)
{
  if (hex_color.size() != 7 || hex_color[0] != '#') {
    return false;
  }
  int channels[3];
  for (int i = 0; i < 3; i++) {
    std::string part = hex_color.substr(1 + i * 2, 2);
    if (!std::isxdigit(static_cast<unsigned char>(part[0])) || !std::isxdigit(static_cast<unsigned char>(part[1]))) {
      return false;
    }
    channels[i] = std::stoi(part, nullptr, 16);
  }
  color.r = channels[0] / 255.0;
  color.g = channels[1] / 255.0;
  color.b = channels[2] / 255.0;
  return true;
}

std::vector<plx_layout_page> plx_layout_json::parse_document(const std::string& json_string) const
{
  json root;
  try {
    root = json::parse(json_string);
  } catch (const json::parse_error& e) {
    throw plx_user_error("Request body is not valid JSON",
                         std::string(e.what()) + " at byte " + std::to_string(e.byte));
  }

  if (!root.is_object()) {
    throw plx_user_error("Request body must be a JSON object");
  }
  auto pages_it = root.find("pages");
  if (pages_it == root.end()) {
    throw plx_user_error("Missing \"pages\"");
  }
  if (!pages_it->is_array()) {
    throw plx_user_error("\"pages\" must be an array");
  }

  std::vector<plx_layout_page> pages;
  pages.reserve(pages_it->size());

  size_t page_number = 0;
  for (const auto& jpage : *pages_it) {
    page_number++;
    const std::string where = "page " + std::to_string(page_number);

    if (!jpage.is_object()) {
      throw plx_user_error("Invalid page", where + " is not an object");
    }

    plx_layout_page page;
    bool has_width = read_number(jpage, "width", page.width) && page.width > 0;
    bool has_height = read_number(jpage, "height", page.height) && page.height > 0;
    if (!has_width || !has_height) {
      if (m_options.strict) {
        throw plx_user_error("Invalid page", where + " needs positive width and height");
      }
      std::cerr << "Warning: " << where << " has no usable size, using A4" << std::endl;
      page.width = DEFAULT_PAGE_WIDTH;
      page.height = DEFAULT_PAGE_HEIGHT;
    }
    // reduced before the cast so that any finite value fits an int
    double rotation = std::fmod(number_or(jpage, "rotation", 0.0), 360.0);
    page.rotation = plx_normalize_rotation(static_cast<int>(rotation));

    auto elements_it = jpage.find("elements");
    if (elements_it == jpage.end() || elements_it->is_null()) {
      pages.push_back(std::move(page));
      continue;
    }
    if (!elements_it->is_array()) {
      throw plx_user_error("Invalid page", where + ": \"elements\" must be an array");
    }

    size_t element_number = 0;
    for (const auto& jel : *elements_it) {
      element_number++;
      const std::string el_where = where + ", element " + std::to_string(element_number);

      if (!jel.is_object()) {
        if (m_options.strict) {
          throw plx_user_error("Invalid element", el_where + " is not an object");
        }
        std::cerr << "Warning: " << el_where << " is not an object, skipped" << std::endl;
        continue;
      }

      std::string type = string_or(jel, "type", "");
      if (type == "text") {
        plx_layout_text text;
        auto text_it = jel.find("text");
        bool has_text = text_it != jel.end() && text_it->is_string();
        bool has_x = read_number(jel, "x", text.x);
        bool has_y = read_number(jel, "y", text.y);

        if (m_options.strict) {
          if (!has_text || !has_x || !has_y) {
            throw plx_user_error("Invalid text element", el_where + " needs \"text\", \"x\" and \"y\"");
          }
          auto fs_it = jel.find("fontSize");
          if (fs_it != jel.end() && !fs_it->is_number()) {
            throw plx_user_error("Invalid text element", el_where + ": \"fontSize\" must be a number");
          }
        }

        if (has_text) {
          text.text = text_it->get<std::string>();
        }
        text.font_size = number_or(jel, "fontSize", 0.0);
        if (text.font_size <= 0) {
          text.font_size = m_options.default_font_size;
        }
        text.width = number_or(jel, "width", 0.0);
        text.height = number_or(jel, "height", text.font_size);
        text.font_name = string_or(jel, "fontName", "");

        auto color_it = jel.find("color");
        if (color_it != jel.end() && !color_it->is_null() && !read_color(*color_it, text.color)) {
          std::cerr << "Warning: " << el_where << " has an unreadable color, using black" << std::endl;
          text.color = plx_color();
        }

        page.add_text(text);
      } else if (type == "image") {
        auto src_it = jel.find("src");
        if (src_it == jel.end() || !src_it->is_string() || src_it->get<std::string>().empty()) {
          std::cerr << "Warning: " << el_where << " is an image without src, skipped" << std::endl;
          continue;
        }

        plx_layout_image image;
        if (!plx_parse_data_uri(src_it->get<std::string>(), image.mime_type, image.data)) {
          std::cerr << "Warning: " << el_where << " has an undecodable src, skipped" << std::endl;
          continue;
        }
        image.x = number_or(jel, "x", 0.0);
        image.y = number_or(jel, "y", 0.0);
        image.width = number_or(jel, "width", 0.0);
        image.height = number_or(jel, "height", 0.0);

        page.add_image(image);
      } else {
        if (m_options.strict) {
          throw plx_user_error("Invalid element", el_where + " has unknown type '" + type + "'");
        }
        std::cerr << "Warning: " << el_where << " has unknown type '" << type << "', skipped" << std::endl;
      }
    }

    pages.push_back(std::move(page));
  }

  return pages;
}

std::string plx_layout_json::create_document(const std::vector<plx_layout_page>& pages) const
{
  json jpages = json::array();

  for (const auto& page : pages) {
    json jelements = json::array();

    for (const auto& element : page.elements) {
      jelements.push_back(std::visit(element_writer(), element));
    }

    jpages.push_back({
      {"width", page.width},
      {"height", page.height},
      {"rotation", page.rotation},
      {"elements", jelements}
    });
  }

  json root = {{"pages", jpages}};
  return root.dump(m_options.indent, ' ', false, json::error_handler_t::replace);
}
