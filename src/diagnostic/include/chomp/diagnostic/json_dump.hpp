#pragma once

#include "chomp/parser/error.hpp"

#include <nlohmann/json_fwd.hpp>

namespace chomp::diagnostic
{

/**
 * @brief Produce a JSON representation of a parse error.
 *
 * Intended for tools that report diagnostics to other programs, e.g.
 * editors. The found text is `null` for unexpected end of input.
 */
nlohmann::json to_json(const parser::ParseError& error);

nlohmann::json to_json(const parser::Position& position);

}  // namespace chomp::diagnostic
