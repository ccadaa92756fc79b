#pragma once

#include "chomp/parser/source.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace chomp::parser
{

enum class ParseErrorCode { UnexpectedEof = 1, UnexpectedToken };

}  // namespace chomp::parser

template <>
struct std::is_error_code_enum<chomp::parser::ParseErrorCode> : std::true_type {
};

namespace chomp::parser
{

class ParseErrorCategory : public std::error_category
{
public:
    const char* name() const noexcept override
    {
        return "chomp.parse";
    }

    std::string message(int ev) const override
    {
        const auto code = static_cast<ParseErrorCode>(ev);
        switch (code) {
            case ParseErrorCode::UnexpectedEof:
                return "unexpected end of input";
            case ParseErrorCode::UnexpectedToken:
                return "unexpected token";
        }
        return "unknown";
    }
};

inline const std::error_category& parse_error_category()
{
    static ParseErrorCategory category;
    return category;
}

inline std::error_code make_error_code(ParseErrorCode code)
{
    return {static_cast<int>(code), parse_error_category()};
}

/// Maximum number of characters of the offending input kept in an error.
inline constexpr std::size_t found_preview_length = 20;

/// Expectation reported when input is left over after a complete parse.
inline constexpr std::string_view end_of_input_description = "<EOF>";

/**
 * @brief Failure of a parser at a given position.
 *
 * `found` is empty for unexpected end of input and holds a bounded
 * preview of the remaining input for unexpected tokens.
 *
 * Matchers only record the offset of the failure; line and column stay 0
 * until `locate` resolves them. The parse entry points locate every error
 * they return.
 */
struct ParseError {
    std::error_code code = make_error_code(ParseErrorCode::UnexpectedToken);
    std::optional<std::string> found;
    std::string expected;
    Position position;
    std::string file_name{inline_source_name};

    bool is_unexpected_eof() const
    {
        return code == ParseErrorCode::UnexpectedEof;
    }

    bool is_unexpected_token() const
    {
        return code == ParseErrorCode::UnexpectedToken;
    }

    bool is_located() const
    {
        return position.line != 0;
    }

    /// One-line description without location, e.g. `unexpected token "x", expected 'a'`.
    std::string message() const;
};

/**
 * @brief Build an unexpected end of input error.
 *
 * End of input is a property of the whole source, so the error is placed
 * at the end of the source text rather than at the local cursor.
 */
ParseError unexpected_eof(const Source& source, std::string expected);

/**
 * @brief Build an unexpected token error for the head of `input`.
 *
 * @param source Source being parsed.
 * @param input Suffix of the source text where matching failed.
 * @param expected Description of what was expected there.
 */
ParseError unexpected_token(const Source& source, std::string_view input, std::string expected);

/// Resolve line and column of an error raised while parsing `source`.
void locate(ParseError& error, const Source& source);

/**
 * @brief Prefix of `text` no longer than `limit` chars.
 *
 * The cut never splits a UTF-8 sequence: a sequence crossing the limit is
 * left out entirely.
 */
std::string bound_length(std::string_view text, std::size_t limit);

}  // namespace chomp::parser
