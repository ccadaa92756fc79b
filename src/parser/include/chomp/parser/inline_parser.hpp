#pragma once

#include "chomp/parser/parser.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace chomp::parser
{

/**
 * @brief Parser whose `eat` is an arbitrary function.
 *
 * Used to build one-off parsers and combinators without declaring a type.
 */
template <typename A>
class InlineParser : public Parser<A>
{
public:
    using EatFunction = std::function<EatResult<A>(const Source&, std::string_view)>;

    InlineParser(std::string expected_description, EatFunction eat_function)
        : expected_description_(std::move(expected_description))
        , eat_function_(std::move(eat_function))
    {
    }

    std::string expected_description() const override
    {
        return expected_description_;
    }

    EatResult<A> eat(const Source& source, std::string_view input) const override
    {
        return eat_function_(source, input);
    }

private:
    std::string expected_description_;
    EatFunction eat_function_;
};

template <typename A>
ParserPtr<A> make_parser(std::string expected_description, typename InlineParser<A>::EatFunction eat_function)
{
    return std::make_shared<InlineParser<A>>(std::move(expected_description), std::move(eat_function));
}

}  // namespace chomp::parser
