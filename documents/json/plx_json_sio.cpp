#include "plx_json_sio.h"
#include "../../utils/plx_exceptions.h"

plx_json_sio::plx_json_sio(const plx_json_options& options)
  : m_codec(options)
{
}

bool plx_json_sio::parse(const std::string& data)
{
  try {
    parse_or_throw(data);
    return true;
  } catch (const plx_exception& e) {
    std::string detail = e.get_detail();
    set_error(detail.empty() ? std::string(e.what()) : std::string(e.what()) + ": " + detail);
    return false;
  }
}

void plx_json_sio::parse_or_throw(const std::string& data)
{
  clear_error();
  pages = m_codec.parse_document(data);
}

bool plx_json_sio::serialize(std::string& data)
{
  clear_error();
  try {
    data = m_codec.create_document(pages);
    return true;
  } catch (const std::exception& e) {
    set_error(std::string("JSON serialization failed: ") + e.what());
    return false;
  }
}
