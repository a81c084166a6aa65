#ifndef PLX_DOC_SIO_H
#define PLX_DOC_SIO_H

#include "layout/plx_layout_page.h"
#include <string>
#include <vector>

class plx_doc_sio
{
public:
  virtual ~plx_doc_sio() = default;

  // Format-agnostic document structure
  std::vector<plx_layout_page> pages;

  // Core document operations. On false, last_error() says why.
  virtual bool read(const std::string& filename);
  virtual bool write(const std::string& filename);
  virtual bool parse(const std::string& data) = 0;
  virtual bool serialize(std::string& data) = 0;

  size_t page_count() const;

  const std::string& last_error() const;

protected:
  void set_error(const std::string& message);
  void clear_error();

  std::string m_last_error;
};

#endif // PLX_DOC_SIO_H
