#ifndef PLX_BASE64_H
#define PLX_BASE64_H

#include <string>

std::string plx_base64_encode(const std::string& data);

/**
 * Decode standard base64. Whitespace is ignored, padding is optional.
 * @return false on any character outside the alphabet or a dangling
 *         single trailing sextet; output is left empty in that case
 */
bool plx_base64_decode(const std::string& input, std::string& output);

// True if the string starts with "data:"
bool plx_is_data_uri(const std::string& uri);

/**
 * Decode an image source: either a data URI of the form
 * data:[<mediatype>][;base64],<data> or a bare base64 payload.
 * @param mime_type receives the declared media type, empty if none
 */
bool plx_parse_data_uri(const std::string& uri, std::string& mime_type, std::string& output);

std::string plx_make_data_uri(const std::string& mime_type, const std::string& data);

#endif // PLX_BASE64_H
