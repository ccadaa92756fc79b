#pragma once

#include "chomp/parser/parser.hpp"

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace chomp::parser
{

/**
 * @brief Parser that looks up its target every time it is used.
 *
 * Lets a rule mention another rule that is not constructed yet, or itself:
 *
 * @code
 * ParserPtr<int> expression;
 * auto expression_ref = ref<int>([&expression] { return expression; });
 * auto group = ...;  // uses expression_ref
 * expression = ...;  // uses group
 * @endcode
 *
 * The resolver is called on each `eat` and `expected_description`; the
 * result is never cached. The resolver should not own the parser it returns
 * when that parser owns the reference, or the cycle is never released.
 */
template <typename A>
class ReferencedParser : public Parser<A>
{
public:
    using Resolver = std::function<ParserPtr<A>()>;

    explicit ReferencedParser(Resolver target)
        : target_(std::move(target))
    {
    }

    std::string expected_description() const override
    {
        return resolve()->expected_description();
    }

    EatResult<A> eat(const Source& source, std::string_view input) const override
    {
        return resolve()->eat(source, input);
    }

private:
    ParserPtr<A> resolve() const
    {
        auto target = target_();
        if (!target) {
            throw std::logic_error("parser reference is not resolved");
        }
        return target;
    }

    Resolver target_;
};

template <typename A>
ParserPtr<A> ref(typename ReferencedParser<A>::Resolver target)
{
    return std::make_shared<ReferencedParser<A>>(std::move(target));
}

}  // namespace chomp::parser
