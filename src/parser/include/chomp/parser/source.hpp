#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace chomp::parser
{

/// Name given to sources that were not read from a file.
inline constexpr std::string_view inline_source_name = "<inline>";

struct Source {
    std::string text;                               ///< Whole text being parsed
    std::string file_name{inline_source_name};      ///< Absolute path of the file, or "<inline>"
};

struct Position {
    std::size_t line = 1;    ///< 1-based line
    std::size_t column = 1;  ///< 1-based column, counted in chars
    std::size_t offset = 0;  ///< Offset from the beginning of the text

    bool operator==(const Position&) const = default;
};

/**
 * @brief Resolve an offset into a line/column position.
 *
 * Offsets past the end of the text are clamped to the end.
 *
 * @param text Full text of the source.
 * @param offset Offset inside the text.
 * @return Position of the offset.
 */
Position position_of(std::string_view text, std::size_t offset);

/**
 * @brief Offset at which a remainder starts inside the source text.
 *
 * @param source Source the remainder was cut from.
 * @param remainder Suffix of the source text.
 * @return Number of characters consumed before the remainder.
 */
std::size_t offset_of(const Source& source, std::string_view remainder);

}  // namespace chomp::parser
