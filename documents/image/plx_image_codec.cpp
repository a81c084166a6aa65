#include "plx_image_codec.h"
#include <magic.h>
#include <opencv2/imgcodecs.hpp>
#include <iostream>
#include <stdexcept>
#include <vector>

// PNG and JPEG signatures, for when libmagic has no answer
static std::string signature_format(const std::string& bytes)
{
  if (bytes.compare(0, 8, "\x89PNG\r\n\x1a\n") == 0) {
    return "image/png";
  }
  if (bytes.compare(0, 3, "\xff\xd8\xff") == 0) {
    return "image/jpeg";
  }
  return {};
}

std::string plx_image_codec::detect_format(const std::string& bytes)
{
  if (bytes.empty()) {
    return {};
  }

  // magic_t is not thread safe, every call gets its own cookie
  const magic_t magic = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
  if (!magic) {
    std::cerr << "Warning: magic_open failed, checking signatures only" << std::endl;
    return signature_format(bytes);
  }
  if (magic_load(magic, nullptr) != 0) {
    std::cerr << "Warning: could not load magic database: " << magic_error(magic) << std::endl;
    magic_close(magic);
    return signature_format(bytes);
  }
  const char* mime = magic_buffer(magic, bytes.data(), bytes.size());
  std::string result = mime ? mime : "";
  magic_close(magic);

  if (result.empty() || result == "application/octet-stream" || result == "text/plain") {
    return signature_format(bytes);
  }
  return result;
}

bool plx_image_codec::is_native_format(const std::string& mime_type)
{
  return mime_type == "image/png" || mime_type == "image/jpeg";
}

cv::Mat plx_image_codec::decode(const std::string& bytes)
{
  if (bytes.empty()) {
    throw std::runtime_error("empty image data");
  }
  std::vector<uchar> buffer(bytes.begin(), bytes.end());
  cv::Mat image = cv::imdecode(buffer, cv::IMREAD_COLOR);
  if (image.empty()) {
    throw std::runtime_error("image data could not be decoded (" + std::to_string(bytes.size()) + " bytes)");
  }
  return image;
}

cv::Mat plx_image_codec::to_mat(const plx_raster& raster)
{
  int type = 0;
  switch (raster.channels) {
    case 1:
      type = CV_8UC1;
      break;
    case 3:
      type = CV_8UC3;
      break;
    case 4:
      type = CV_8UC4;
      break;
    default:
      throw std::runtime_error("unsupported channel count " + std::to_string(raster.channels));
  }

  if (raster.width <= 0 || raster.height <= 0) {
    throw std::runtime_error("raster has no pixels");
  }
  size_t expected = static_cast<size_t>(raster.width) * raster.height * raster.channels;
  if (raster.pixels.size() < expected) {
    throw std::runtime_error("raster buffer too small: " + std::to_string(raster.pixels.size()) +
                             " < " + std::to_string(expected));
  }

  cv::Mat view(raster.height, raster.width, type, const_cast<char*>(raster.pixels.data()));
  return view.clone();
}

std::string plx_image_codec::encode_png(const cv::Mat& image)
{
  if (image.empty()) {
    throw std::runtime_error("cannot encode empty image");
  }
  std::vector<uchar> buffer;
  if (!cv::imencode(".png", image, buffer)) {
    throw std::runtime_error("PNG encoding failed");
  }
  return std::string(buffer.begin(), buffer.end());
}

std::string plx_image_codec::encode_png(const plx_raster& raster)
{
  return encode_png(to_mat(raster));
}
