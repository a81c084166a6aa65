#include "documents/pdf/plx_pdf_sio.h"
#include "documents/json/plx_json_sio.h"
#include "utils/plx_config.h"
#include "utils/plx_env.h"
#include "utils/plx_hash.h"
#include <iostream>
#include <string>

static void usage(const char* program)
{
  std::cout << "Usage: " << program << " to-json <in.pdf> [out.json]" << std::endl;
  std::cout << "       " << program << " to-pdf <in.json> [out.pdf]" << std::endl;
  std::cout << "Converts between PDF and the layout JSON format." << std::endl;
}

static int pdf_to_json(const plx_pdf_engine& engine, const plx_config& config,
                       const std::string& pdf_path, const std::string& output_path)
{
  plx_pdf_sio pdf(engine);
  if (!pdf.read(pdf_path))
  {
    std::cerr << "Failed to parse PDF: " << pdf.last_error() << std::endl;
    return 1;
  }
  std::cerr << "Parsed PDF with " << pdf.page_count() << " page(s)" << std::endl;

  plx_json_options options;
  options.indent = 2;
  options.default_font_size = config.default_font_size;
  plx_json_sio json(options);
  json.pages = pdf.pages;

  // Output to file or stdout
  if (!output_path.empty())
  {
    if (!json.write(output_path))
    {
      std::cerr << "Failed to write JSON: " << json.last_error() << std::endl;
      return 1;
    }
    std::cerr << "JSON written to: " << output_path << std::endl;
  }
  else
  {
    std::string data;
    if (!json.serialize(data))
    {
      std::cerr << "Failed to create JSON: " << json.last_error() << std::endl;
      return 1;
    }
    std::cout << data << std::endl;
  }
  return 0;
}

static int json_to_pdf(const plx_pdf_engine& engine, const plx_config& config,
                       const std::string& json_path, std::string output_path)
{
  plx_json_options options;
  options.strict = config.strict_elements;
  options.default_font_size = config.default_font_size;
  plx_json_sio json(options);
  if (!json.read(json_path))
  {
    std::cerr << "Failed to read layout JSON: " << json.last_error() << std::endl;
    return 1;
  }

  plx_pdf_sio pdf(engine);
  pdf.pages = json.pages;

  std::string data;
  if (!pdf.serialize(data))
  {
    std::cerr << "Failed to create PDF: " << pdf.last_error() << std::endl;
    return 1;
  }

  // Content-addressable name when no output is given
  if (output_path.empty())
  {
    output_path = plx_fnv1a64_hex(data) + ".pdf";
  }
  if (!pdf.write(output_path))
  {
    std::cerr << "Failed to write PDF: " << pdf.last_error() << std::endl;
    return 1;
  }
  std::cerr << "PDF written to: " << output_path << " (" << data.size() << " bytes, "
            << pdf.page_count() << " page(s))" << std::endl;
  return 0;
}

int main(int argc, char* argv[])
{
  if (argc < 3)
  {
    usage(argv[0]);
    return 1;
  }

  load_env_file(".env");
  plx_config config = plx_config::from_environment();
  plx_pdf_engine engine(config);

  std::string command = argv[1];
  std::string input_path = argv[2];
  std::string output_path = argc >= 4 ? argv[3] : "";

  if (command == "to-json")
  {
    return pdf_to_json(engine, config, input_path, output_path);
  }
  if (command == "to-pdf")
  {
    return json_to_pdf(engine, config, input_path, output_path);
  }

  usage(argv[0]);
  return 1;
}
