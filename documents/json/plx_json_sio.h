#ifndef PLX_JSON_SIO_H
#define PLX_JSON_SIO_H

#include "../plx_doc_sio.h"
#include "../../api/json/plx_layout_json.h"

// Layout pages as JSON documents
class plx_json_sio : public plx_doc_sio
{
public:
  explicit plx_json_sio(const plx_json_options& options = plx_json_options());

  bool parse(const std::string& data) override;
  bool serialize(std::string& data) override;

  // Like parse(), but lets plx_user_error through for callers that map it
  void parse_or_throw(const std::string& data);

private:
  plx_layout_json m_codec;
};

#endif // PLX_JSON_SIO_H
