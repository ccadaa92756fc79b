#pragma once

#include "chomp/parser/source.hpp"

#include <expected>
#include <filesystem>
#include <string>

namespace chomp::parser
{

/**
 * @brief Read a whole file into a source.
 *
 * The source is named after the absolute path of the file.
 *
 * @param path Path to the file.
 * @return Source or error message.
 */
std::expected<Source, std::string> load_source(const std::filesystem::path& path);

}  // namespace chomp::parser
