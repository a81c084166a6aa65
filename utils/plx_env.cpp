#include "plx_env.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

std::string plx_trim(const std::string& s)
{
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::string plx_to_lower(std::string s)
{
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool plx_starts_with(const std::string& s, const std::string& prefix)
{
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool load_env_file(const std::string& filepath) {
  std::ifstream file(filepath);
  if (!file.is_open()) {
    return false;
  }

  std::string line;
  while (std::getline(file, line)) {
    line = plx_trim(line);

    if (line.empty() || plx_starts_with(line, "#")) {
      continue;
    }

    size_t pos = line.find('=');
    if (pos == std::string::npos) {
      continue;
    }

    std::string key = plx_trim(line.substr(0, pos));
    std::string value = plx_trim(line.substr(pos + 1));
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') || (value.front() == '\'' && value.back() == '\''))) {
      value = value.substr(1, value.size() - 2);
    }
    if (key.empty()) {
      continue;
    }

    setenv(key.c_str(), value.c_str(), 1);
  }
  return true;
}

std::string plx_getenv(const char* key, const std::string& def)
{
  const char* value = std::getenv(key);
  if (value == nullptr || *value == '\0') {
    return def;
  }
  return value;
}

long plx_getenv_int(const char* key, long def)
{
  const char* value = std::getenv(key);
  if (value == nullptr || *value == '\0') {
    return def;
  }
  try {
    return std::stol(value);
  } catch (const std::invalid_argument&) {
    std::cerr << "Warning: " << key << "='" << value << "' is not a number, using " << def << std::endl;
    return def;
  } catch (const std::out_of_range&) {
    std::cerr << "Warning: " << key << "='" << value << "' is out of range, using " << def << std::endl;
    return def;
  }
}

bool plx_getenv_bool(const char* key, bool def)
{
  std::string value = plx_to_lower(plx_getenv(key, ""));
  if (value.empty()) {
    return def;
  }
  if (value == "1" || value == "true" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "0" || value == "false" || value == "no" || value == "off") {
    return false;
  }
  std::cerr << "Warning: " << key << "='" << value << "' is not a boolean, using " << (def ? "true" : "false") << std::endl;
  return def;
}
