#include "chomp/parser/terminals.hpp"

#include "chomp/parser/inline_parser.hpp"

#include <fmt/ranges.h>

#include <utility>

namespace chomp::parser
{

namespace
{

std::string quoted_literal(std::string_view literal)
{
    return fmt::format("\"{}\"", literal);
}

std::string char_set(std::string_view chars)
{
    return fmt::format("{{{}}}", fmt::join(chars, ", "));
}

bool contains(std::string_view chars, char c)
{
    return chars.find(c) != std::string_view::npos;
}

}  // namespace

StringParser::StringParser(std::string expected)
    : expected_(std::move(expected))
{
}

std::string StringParser::expected_description() const
{
    return quoted_literal(expected_);
}

EatResult<std::string> StringParser::eat(const Source& source, std::string_view input) const
{
    if (expected_.size() > input.size()) {
        return unexpected_result<std::string>(unexpected_eof(source, expected_description()));
    }

    if (input.compare(0, expected_.size(), expected_) != 0) {
        return unexpected_result<std::string>(unexpected_token(source, input, expected_description()));
    }

    return success(expected_, input.substr(expected_.size()));
}

CharParser::CharParser(char expected)
    : expected_(expected)
{
}

std::string CharParser::expected_description() const
{
    return fmt::format("'{}'", expected_);
}

EatResult<char> CharParser::eat(const Source& source, std::string_view input) const
{
    if (input.empty()) {
        return unexpected_result<char>(unexpected_eof(source, expected_description()));
    }

    if (input.front() != expected_) {
        return unexpected_result<char>(unexpected_token(source, input, expected_description()));
    }

    return success(expected_, input.substr(1));
}

IncludedCharParser::IncludedCharParser(std::string included)
    : included_(std::move(included))
{
}

std::string IncludedCharParser::expected_description() const
{
    return "any char of " + char_set(included_);
}

EatResult<char> IncludedCharParser::eat(const Source& source, std::string_view input) const
{
    if (input.empty()) {
        return unexpected_result<char>(unexpected_eof(source, expected_description()));
    }

    const char value = input.front();
    if (!contains(included_, value)) {
        return unexpected_result<char>(unexpected_token(source, input, expected_description()));
    }

    return success(value, input.substr(1));
}

ExcludedCharParser::ExcludedCharParser(std::string excluded)
    : excluded_(std::move(excluded))
{
}

std::string ExcludedCharParser::expected_description() const
{
    return "any char except " + char_set(excluded_);
}

EatResult<char> ExcludedCharParser::eat(const Source& source, std::string_view input) const
{
    if (input.empty()) {
        return unexpected_result<char>(unexpected_eof(source, expected_description()));
    }

    const char value = input.front();
    if (contains(excluded_, value)) {
        return unexpected_result<char>(unexpected_token(source, input, expected_description()));
    }

    return success(value, input.substr(1));
}

std::string AnyCharParser::expected_description() const
{
    return "any char";
}

EatResult<char> AnyCharParser::eat(const Source& source, std::string_view input) const
{
    if (input.empty()) {
        return unexpected_result<char>(unexpected_eof(source, expected_description()));
    }

    return success(input.front(), input.substr(1));
}

ParserPtr<std::string> empty_string()
{
    auto nothing = empty<std::string>();
    return make_parser<std::string>(
        nothing->expected_description(), [nothing](const Source& source, std::string_view input) {
            auto eaten = nothing->eat(source, input);
            if (!eaten) {
                return unexpected_result<std::string>(std::move(eaten.error()));
            }
            return success(std::string{}, eaten->remainder);
        });
}

ParserPtr<std::string> string(std::string expected)
{
    switch (expected.size()) {
        case 0:
            return empty_string();
        case 1: {
            auto single = character(expected.front());
            auto description = quoted_literal(expected);
            return make_parser<std::string>(
                description, [single, description](const Source& source, std::string_view input) {
                    auto eaten = single->eat(source, input);
                    if (!eaten) {
                        // report the literal, not the character it was matched with
                        auto error = std::move(eaten.error());
                        error.expected = description;
                        return unexpected_result<std::string>(std::move(error));
                    }
                    return success(std::string(1, eaten->value), eaten->remainder);
                });
        }
        default:
            return std::make_shared<StringParser>(std::move(expected));
    }
}

ParserPtr<char> character(char expected)
{
    return std::make_shared<CharParser>(expected);
}

ParserPtr<char> any_of(std::string_view included)
{
    return std::make_shared<IncludedCharParser>(std::string(included));
}

ParserPtr<char> any_of(std::initializer_list<char> included)
{
    return std::make_shared<IncludedCharParser>(std::string(included));
}

ParserPtr<char> except(std::string_view excluded)
{
    return std::make_shared<ExcludedCharParser>(std::string(excluded));
}

ParserPtr<char> except(std::initializer_list<char> excluded)
{
    return std::make_shared<ExcludedCharParser>(std::string(excluded));
}

ParserPtr<char> any_char()
{
    return std::make_shared<AnyCharParser>();
}

}  // namespace chomp::parser
