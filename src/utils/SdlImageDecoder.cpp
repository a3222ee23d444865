/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/Logger.hpp"
#include "core/MapError.hpp"
#include "utils/ImageDecoder.hpp"
#include <SDL3/SDL.h>
#include <SDL3_image/SDL_image.h>
#include <format>
#include <memory>

namespace MapForge {

RgbImage SdlImageDecoder::decode(const std::filesystem::path &path) const {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw MapError(MapErrorCode::FileNotFound,
                   std::format("image not found: {}", path.string()), path);
  }

  std::string fileName = path.string();
  auto surface = std::unique_ptr<SDL_Surface, decltype(&SDL_DestroySurface)>(
      IMG_Load(fileName.c_str()), SDL_DestroySurface);
  if (!surface) {
    IMAGE_ERROR("Could not load image: " + std::string(SDL_GetError()));
    throw MapError(MapErrorCode::ImageLoad,
                   std::format("could not load image {}: {}", fileName,
                               SDL_GetError()),
                   path);
  }

  auto rgb = std::unique_ptr<SDL_Surface, decltype(&SDL_DestroySurface)>(
      SDL_ConvertSurface(surface.get(), SDL_PIXELFORMAT_RGB24),
      SDL_DestroySurface);
  if (!rgb) {
    IMAGE_ERROR("Could not convert image: " + std::string(SDL_GetError()));
    throw MapError(MapErrorCode::ImageLoad,
                   std::format("could not convert {} to RGB: {}", fileName,
                               SDL_GetError()),
                   path);
  }

  RgbImage image;
  image.width = static_cast<uint32_t>(rgb->w);
  image.height = static_cast<uint32_t>(rgb->h);
  image.pixels.resize(static_cast<size_t>(image.width) * image.height);

  if (!SDL_LockSurface(rgb.get())) {
    throw MapError(MapErrorCode::ImageLoad,
                   std::format("could not lock {}: {}", fileName, SDL_GetError()),
                   path);
  }
  const auto *bytes = static_cast<const uint8_t *>(rgb->pixels);
  for (uint32_t y = 0; y < image.height; ++y) {
    const uint8_t *row = bytes + static_cast<size_t>(y) * rgb->pitch;
    for (uint32_t x = 0; x < image.width; ++x) {
      image.pixels[static_cast<size_t>(y) * image.width + x] =
          Rgb{row[x * 3], row[x * 3 + 1], row[x * 3 + 2]};
    }
  }
  SDL_UnlockSurface(rgb.get());

  IMAGE_DEBUG(std::format("decoded {} ({}x{})", fileName, image.width,
                          image.height));
  return image;
}

} // namespace MapForge
