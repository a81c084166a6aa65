#include "plx_pdf_engine.h"
#include <podofo/podofo.h>
#include <iostream>

using namespace PoDoFo;

plx_pdf_engine::plx_pdf_engine()
  : m_default_font_size(12.0), m_log_level("warning")
{
  apply_log_level();
}

plx_pdf_engine::plx_pdf_engine(const plx_config& config)
  : m_default_font_size(config.default_font_size > 0 ? config.default_font_size : 12.0),
    m_log_level(config.podofo_log_level)
{
  apply_log_level();
}

void plx_pdf_engine::apply_log_level()
{
  PdfLogSeverity severity = PdfLogSeverity::Warning;
  if (m_log_level == "none") {
    severity = PdfLogSeverity::None;
  } else if (m_log_level == "error") {
    severity = PdfLogSeverity::Error;
  } else if (m_log_level == "information" || m_log_level == "info") {
    severity = PdfLogSeverity::Information;
  } else if (m_log_level == "debug") {
    severity = PdfLogSeverity::Debug;
  } else if (m_log_level != "warning") {
    std::cerr << "Warning: unknown PoDoFo log level '" << m_log_level << "', using warning" << std::endl;
    m_log_level = "warning";
  }
  PdfCommon::SetMaxLoggingSeverity(severity);
}
