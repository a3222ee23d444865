/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FAKE_IMAGE_DECODER_HPP
#define FAKE_IMAGE_DECODER_HPP

#include "core/MapError.hpp"
#include "utils/ImageDecoder.hpp"
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <set>
#include <vector>

/**
 * @brief ImageDecoder that never touches the disk
 *
 * Every decode returns a width x height image filled with one color and
 * records the requested path. Paths listed with failOn() throw ImageLoad.
 */
class FakeImageDecoder : public MapForge::ImageDecoder {
public:
    FakeImageDecoder(uint32_t width = 4, uint32_t height = 2) : m_width(width), m_height(height) {}

    MapForge::RgbImage decode(const std::filesystem::path& path) const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_requested.push_back(path);
        if (m_failing.contains(path.filename().string())) {
            throw MapForge::MapError(MapForge::MapErrorCode::ImageLoad,
                                     "fake decode failure for " + path.string(), path);
        }
        MapForge::RgbImage image;
        image.width = m_width;
        image.height = m_height;
        image.pixels.assign(static_cast<size_t>(m_width) * m_height, MapForge::Rgb{12, 34, 56});
        return image;
    }

    void failOn(const std::string& fileName) { m_failing.insert(fileName); }

    std::vector<std::filesystem::path> requested() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requested;
    }

private:
    uint32_t m_width;
    uint32_t m_height;
    std::set<std::string> m_failing;
    mutable std::vector<std::filesystem::path> m_requested;
    mutable std::mutex m_mutex;
};

#endif // FAKE_IMAGE_DECODER_HPP
