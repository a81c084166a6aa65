#ifndef PLX_IMAGE_CODEC_H
#define PLX_IMAGE_CODEC_H

#include "../layout/plx_page_source.h"
#include <opencv2/core.hpp>
#include <string>

// Raster encode/decode and content sniffing for embedded images.
class plx_image_codec
{
public:
  // Media type from the bytes themselves (libmagic), empty if inconclusive
  static std::string detect_format(const std::string& bytes);

  // Formats the document writer can embed without re-encoding
  static bool is_native_format(const std::string& mime_type);

  // Decodes any format OpenCV reads into 8-bit BGR. Throws std::runtime_error.
  static cv::Mat decode(const std::string& bytes);

  static cv::Mat to_mat(const plx_raster& raster);

  // Throws std::runtime_error if the image cannot be encoded
  static std::string encode_png(const cv::Mat& image);
  static std::string encode_png(const plx_raster& raster);
};

#endif // PLX_IMAGE_CODEC_H
