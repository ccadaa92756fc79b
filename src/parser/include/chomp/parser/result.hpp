#pragma once

#include "chomp/parser/error.hpp"

#include <expected>
#include <string_view>
#include <utility>

namespace chomp::parser
{

/**
 * @brief Value produced by a successful match.
 *
 * `remainder` is the unconsumed suffix of the input handed to the parser
 * and views the text of the source being parsed.
 */
template <typename A>
struct Result {
    A value;
    std::string_view remainder;
};

/// Outcome of a single `eat` step.
template <typename A>
using EatResult = std::expected<Result<A>, ParseError>;

/// Outcome of a whole-input parse.
template <typename A>
using ParseResult = std::expected<A, ParseError>;

template <typename A>
inline EatResult<A> success(A value, std::string_view remainder)
{
    return Result<A>{std::move(value), remainder};
}

template <typename A>
inline EatResult<A> unexpected_result(ParseError error)
{
    return std::unexpected(std::move(error));
}

}  // namespace chomp::parser
