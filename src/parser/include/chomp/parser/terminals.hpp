#pragma once

#include "chomp/parser/parser.hpp"

#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace chomp::parser
{

/// Description shared by the parsers that consume nothing.
inline constexpr std::string_view empty_description = "empty string";

/// Consumes nothing and produces no value.
template <typename A>
class EmptyParser : public Parser<std::optional<A>>
{
public:
    std::string expected_description() const override
    {
        return std::string(empty_description);
    }

    EatResult<std::optional<A>> eat(const Source&, std::string_view input) const override
    {
        return success<std::optional<A>>(std::nullopt, input);
    }
};

/// Consumes exactly the literal `expected`.
class StringParser : public Parser<std::string>
{
public:
    explicit StringParser(std::string expected);

    std::string expected_description() const override;
    EatResult<std::string> eat(const Source& source, std::string_view input) const override;

private:
    std::string expected_;
};

/// Consumes one character equal to `expected`.
class CharParser : public Parser<char>
{
public:
    explicit CharParser(char expected);

    std::string expected_description() const override;
    EatResult<char> eat(const Source& source, std::string_view input) const override;

private:
    char expected_;
};

/// Consumes one character out of `included`.
class IncludedCharParser : public Parser<char>
{
public:
    explicit IncludedCharParser(std::string included);

    std::string expected_description() const override;
    EatResult<char> eat(const Source& source, std::string_view input) const override;

private:
    std::string included_;
};

/// Consumes one character that is not in `excluded`.
class ExcludedCharParser : public Parser<char>
{
public:
    explicit ExcludedCharParser(std::string excluded);

    std::string expected_description() const override;
    EatResult<char> eat(const Source& source, std::string_view input) const override;

private:
    std::string excluded_;
};

/// Consumes any one character.
class AnyCharParser : public Parser<char>
{
public:
    std::string expected_description() const override;
    EatResult<char> eat(const Source& source, std::string_view input) const override;
};

template <typename A>
ParserPtr<std::optional<A>> empty()
{
    return std::make_shared<EmptyParser<A>>();
}

/// Consumes nothing and produces an empty string.
ParserPtr<std::string> empty_string();

/**
 * @brief Parser for a literal string.
 *
 * Literals of length 0 and 1 are served by the empty and character
 * parsers; errors are reported as for any other literal.
 */
ParserPtr<std::string> string(std::string expected);

inline ParserPtr<std::string> str(std::string expected)
{
    return string(std::move(expected));
}

ParserPtr<char> character(char expected);

inline ParserPtr<char> chr(char expected)
{
    return character(expected);
}

ParserPtr<char> any_of(std::string_view included);
ParserPtr<char> any_of(std::initializer_list<char> included);

ParserPtr<char> except(std::string_view excluded);
ParserPtr<char> except(std::initializer_list<char> excluded);

ParserPtr<char> any_char();

}  // namespace chomp::parser
