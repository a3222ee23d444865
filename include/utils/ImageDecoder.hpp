/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IMAGE_DECODER_HPP
#define IMAGE_DECODER_HPP

#include <cstdint>
#include <filesystem>
#include <vector>

namespace MapForge {

struct Rgb {
  uint8_t r{0};
  uint8_t g{0};
  uint8_t b{0};

  bool operator==(const Rgb &) const = default;
};

/**
 * @brief Decoded raster, row-major: pixels[y * width + x]
 */
struct RgbImage {
  uint32_t width{0};
  uint32_t height{0};
  std::vector<Rgb> pixels;

  const Rgb &at(uint32_t x, uint32_t y) const {
    return pixels[static_cast<size_t>(y) * width + x];
  }
  bool empty() const { return pixels.empty(); }
};

/**
 * @brief Turns an image file into 8-bit RGB pixels
 *
 * Indexed and greyscale bitmaps come back expanded to RGB.
 */
class ImageDecoder {
public:
  virtual ~ImageDecoder() = default;

  /**
   * @throws MapError FileNotFound when the file is missing, ImageLoad when it
   *         cannot be decoded
   */
  virtual RgbImage decode(const std::filesystem::path &path) const = 0;
};

/**
 * @brief ImageDecoder backed by SDL3_image
 */
class SdlImageDecoder : public ImageDecoder {
public:
  RgbImage decode(const std::filesystem::path &path) const override;
};

} // namespace MapForge

#endif // IMAGE_DECODER_HPP
