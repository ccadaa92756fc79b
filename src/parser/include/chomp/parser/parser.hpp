#pragma once

#include "chomp/parser/error.hpp"
#include "chomp/parser/file.hpp"
#include "chomp/parser/result.hpp"
#include "chomp/parser/source.hpp"

#include <filesystem>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace chomp::parser
{

namespace detail
{

/**
 * @brief Error reported when a parse stops before the end of the source.
 *
 * @param source Source being parsed.
 * @param remainder Unconsumed suffix of the source text.
 */
ParseError trailing_input_error(const Source& source, std::string_view remainder);

}  // namespace detail

/**
 * @brief Parser producing values of type A.
 *
 * Implementations override `eat`, which consumes a prefix of the input and
 * reports what is left. `eat` must not modify the parser, so one instance
 * can serve any number of parses, including concurrent ones.
 *
 * The values produced by the entry points outlive the source, so `A` must
 * not refer to the text being parsed.
 */
template <typename A>
class Parser
{
public:
    using value_type = A;

    virtual ~Parser() = default;

    /// Description of the expected input used in error messages.
    virtual std::string expected_description() const = 0;

    /**
     * @brief Consume a prefix of the input.
     *
     * @param source Source being parsed.
     * @param input Suffix of `source.text` to consume from.
     * @return Value with the remainder of the input, or the failure.
     */
    virtual EatResult<A> eat(const Source& source, std::string_view input) const = 0;

    /// Parse a whole in-memory string.
    ParseResult<A> parse(std::string text) const
    {
        const Source source{.text = std::move(text)};
        return parse_source(source);
    }

    /**
     * @brief Parse a whole file.
     *
     * @throws std::runtime_error if the file cannot be read.
     */
    ParseResult<A> parse_file(const std::filesystem::path& path) const
    {
        auto maybe_source = load_source(path);
        if (!maybe_source) {
            throw std::runtime_error(maybe_source.error());
        }
        return parse_source(maybe_source.value());
    }

    /// Parse a whole source; input left over after `eat` is an error.
    /// Errors returned from here are located.
    ParseResult<A> parse_source(const Source& source) const
    {
        auto eaten = eat(source, source.text);
        if (!eaten) {
            auto error = std::move(eaten.error());
            locate(error, source);
            return std::unexpected(std::move(error));
        }
        if (!eaten->remainder.empty()) {
            return std::unexpected(detail::trailing_input_error(source, eaten->remainder));
        }
        return std::move(eaten->value);
    }
};

template <typename A>
using ParserPtr = std::shared_ptr<const Parser<A>>;

template <typename A>
std::ostream& operator<<(std::ostream& os, const Parser<A>& parser)
{
    return os << parser.expected_description();
}

}  // namespace chomp::parser
