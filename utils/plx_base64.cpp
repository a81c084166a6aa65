#include "plx_base64.h"
#include <cctype>

static const char BASE64_ALPHABET[] =
  "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static int base64_value(unsigned char c)
{
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '+') return 62;
  if (c == '/') return 63;
  return -1;
}

std::string plx_base64_encode(const std::string& data)
{
  std::string out;
  out.reserve(((data.size() + 2) / 3) * 4);

  size_t i = 0;
  while (i + 2 < data.size()) {
    unsigned int triple = (static_cast<unsigned char>(data[i]) << 16) |
                          (static_cast<unsigned char>(data[i + 1]) << 8) |
                          static_cast<unsigned char>(data[i + 2]);
    out += BASE64_ALPHABET[(triple >> 18) & 0x3F];
    out += BASE64_ALPHABET[(triple >> 12) & 0x3F];
    out += BASE64_ALPHABET[(triple >> 6) & 0x3F];
    out += BASE64_ALPHABET[triple & 0x3F];
    i += 3;
  }

  size_t rest = data.size() - i;
  if (rest == 1) {
    unsigned int triple = static_cast<unsigned char>(data[i]) << 16;
    out += BASE64_ALPHABET[(triple >> 18) & 0x3F];
    out += BASE64_ALPHABET[(triple >> 12) & 0x3F];
    out += "==";
  } else if (rest == 2) {
    unsigned int triple = (static_cast<unsigned char>(data[i]) << 16) |
                          (static_cast<unsigned char>(data[i + 1]) << 8);
    out += BASE64_ALPHABET[(triple >> 18) & 0x3F];
    out += BASE64_ALPHABET[(triple >> 12) & 0x3F];
    out += BASE64_ALPHABET[(triple >> 6) & 0x3F];
    out += '=';
  }
  return out;
}

bool plx_base64_decode(const std::string& input, std::string& output)
{
  output.clear();
  output.reserve((input.size() / 4) * 3);

  unsigned int buffer = 0;
  int bits = 0;
  size_t sextets = 0;
  bool padding = false;

  for (unsigned char c : input) {
    if (std::isspace(c)) {
      continue;
    }
    if (c == '=') {
      padding = true;
      continue;
    }
    // data after padding
    if (padding) {
      output.clear();
      return false;
    }
    int value = base64_value(c);
    if (value < 0) {
      output.clear();
      return false;
    }
    buffer = (buffer << 6) | static_cast<unsigned int>(value);
    bits += 6;
    sextets++;
    if (bits >= 8) {
      bits -= 8;
      output += static_cast<char>((buffer >> bits) & 0xFF);
    }
  }

  if (sextets % 4 == 1) {
    output.clear();
    return false;
  }
  return true;
}

bool plx_is_data_uri(const std::string& uri)
{
  return uri.compare(0, 5, "data:") == 0;
}

bool plx_parse_data_uri(const std::string& uri, std::string& mime_type, std::string& output)
{
  mime_type.clear();
  if (!plx_is_data_uri(uri)) {
    return plx_base64_decode(uri, output);
  }

  size_t comma = uri.find(',');
  if (comma == std::string::npos) {
    output.clear();
    return false;
  }

  std::string header = uri.substr(5, comma - 5);
  const std::string marker = ";base64";
  if (header.size() < marker.size() ||
      header.compare(header.size() - marker.size(), marker.size(), marker) != 0) {
    // only base64 payloads carry binary images
    output.clear();
    return false;
  }
  mime_type = header.substr(0, header.size() - marker.size());

  return plx_base64_decode(uri.substr(comma + 1), output);
}

std::string plx_make_data_uri(const std::string& mime_type, const std::string& data)
{
  return "data:" + mime_type + ";base64," + plx_base64_encode(data);
}
