/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SCRATCH_DIRECTORY_HPP
#define SCRATCH_DIRECTORY_HPP

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <string_view>

#ifndef MAPFORGE_TEST_DATA_DIR
#define MAPFORGE_TEST_DATA_DIR "tests/test_data"
#endif

namespace MapForgeTest {

// Checked-in sample map
inline std::filesystem::path fixtureMapRoot() {
    return std::filesystem::path(MAPFORGE_TEST_DATA_DIR) / "map_root";
}

/**
 * @brief Temporary directory removed again when the test ends
 */
class ScratchDirectory {
public:
    ScratchDirectory() {
        std::random_device device;
        m_path = std::filesystem::temp_directory_path() /
                 ("mapforge_test_" + std::to_string(device()) + "_" + std::to_string(device()));
        std::filesystem::create_directories(m_path);
    }

    ~ScratchDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const std::filesystem::path& path() const { return m_path; }

    // Writes content (binary, as given) to a path relative to the directory
    std::filesystem::path write(const std::filesystem::path& relative, std::string_view content) const {
        std::filesystem::path target = m_path / relative;
        std::filesystem::create_directories(target.parent_path());
        std::ofstream file(target, std::ios::binary);
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        return target;
    }

    // Copies the checked-in sample map into the directory and returns its root
    std::filesystem::path copyFixtureMap() const {
        std::filesystem::path root = m_path / "map_root";
        std::filesystem::copy(fixtureMapRoot(), root, std::filesystem::copy_options::recursive);
        return root;
    }

private:
    std::filesystem::path m_path;
};

} // namespace MapForgeTest

#endif // SCRATCH_DIRECTORY_HPP
