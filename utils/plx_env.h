#ifndef PLX_ENV_H
#define PLX_ENV_H

#include <string>

// Loads KEY=VALUE lines into the process environment. Lines starting with '#'
// are comments. Surrounding quotes on the value are removed.
// Returns false if the file could not be opened.
bool load_env_file(const std::string& filepath);

std::string plx_trim(const std::string& s);
std::string plx_to_lower(std::string s);
bool plx_starts_with(const std::string& s, const std::string& prefix);

// Environment lookups with defaults
std::string plx_getenv(const char* key, const std::string& def);
long plx_getenv_int(const char* key, long def);
bool plx_getenv_bool(const char* key, bool def);

#endif // PLX_ENV_H
