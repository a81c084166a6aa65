#include "plx_doc_sio.h"
#include <fstream>
#include <iostream>
#include <iterator>

bool plx_doc_sio::read(const std::string& filename)
{
  std::fstream f;
  f.open(filename.c_str(), std::ios::in | std::ios::binary);
  if (!f.is_open())
  {
    set_error("Cannot open " + filename);
    return false;
  }
  // read all bytes from the file
  std::string data((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  f.close();

  return parse(data);
}

bool plx_doc_sio::write(const std::string& filename)
{
  std::string data;
  if (!serialize(data))
  {
    return false;
  }

  std::fstream f;
  f.open(filename.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
  if (!f.is_open())
  {
    set_error("Cannot open " + filename + " for writing");
    return false;
  }
  f.write(data.data(), static_cast<std::streamsize>(data.size()));
  f.close();
  return true;
}

size_t plx_doc_sio::page_count() const
{
  return pages.size();
}

const std::string& plx_doc_sio::last_error() const
{
  return m_last_error;
}

void plx_doc_sio::set_error(const std::string& message)
{
  m_last_error = message;
  std::cerr << "Error: " << message << std::endl;
}

void plx_doc_sio::clear_error()
{
  m_last_error.clear();
}
