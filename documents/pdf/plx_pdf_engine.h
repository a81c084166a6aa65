#ifndef PLX_PDF_ENGINE_H
#define PLX_PDF_ENGINE_H

#include "../../utils/plx_config.h"
#include <string>

// Process-wide PoDoFo setup, done once at startup. The instance is then
// passed by const reference to every reader and writer.
class plx_pdf_engine
{
public:
  plx_pdf_engine();
  explicit plx_pdf_engine(const plx_config& config);

  double default_font_size() const { return m_default_font_size; }
  const std::string& log_level() const { return m_log_level; }

private:
  void apply_log_level();

  double m_default_font_size;
  std::string m_log_level;
};

#endif // PLX_PDF_ENGINE_H
