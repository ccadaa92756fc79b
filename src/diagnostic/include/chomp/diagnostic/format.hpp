#pragma once

#include "chomp/parser/error.hpp"
#include "chomp/parser/source.hpp"

#include <fmt/core.h>

#include <string>
#include <string_view>

namespace chomp::diagnostic
{

/**
 * @brief Render a parse error as a single diagnostic line.
 *
 * The line has the form `<file>:<line>:<column>: error: <message>`.
 *
 * @param error Error to render.
 * @return Diagnostic line without a trailing newline.
 */
std::string format(const parser::ParseError& error);

}  // namespace chomp::diagnostic

template <>
struct fmt::formatter<chomp::parser::Position> : fmt::formatter<std::string_view> {
    auto format(const chomp::parser::Position& position, fmt::format_context& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}:{}", position.line, position.column);
    }
};

template <>
struct fmt::formatter<chomp::parser::ParseError> : fmt::formatter<std::string_view> {
    auto format(const chomp::parser::ParseError& error, fmt::format_context& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", chomp::diagnostic::format(error));
    }
};
