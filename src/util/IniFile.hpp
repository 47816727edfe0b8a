#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "util/Expected.hpp"

namespace saltline {

/**
 * @brief Minimal single-section ini reader/writer
 *
 * Format:
 *   [section]
 *   key = value
 *   # comment      ; comment
 *
 * Only the requested section is returned; other sections are skipped.
 * Keys keep their order of appearance. A later duplicate key replaces
 * the earlier value in place.
 */
namespace IniFile {

using KeyValues = std::vector<std::pair<std::string, std::string>>;

/// Parse text and return the key/value pairs of section; InvalidPolicy on syntax errors or a missing section
Expected<KeyValues> readSection(const std::string& text, const std::string& section);

/// Render one section
std::string writeSection(const std::string& section, const KeyValues& values);

/// Read a whole file into memory; IoError if it cannot be opened
Expected<std::string> readFile(const std::filesystem::path& path);

}  // namespace IniFile

}  // namespace saltline
