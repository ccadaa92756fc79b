#include "chomp/parser/parser.hpp"

#include <spdlog/spdlog.h>

namespace chomp::parser
{

namespace detail
{

ParseError trailing_input_error(const Source& source, std::string_view remainder)
{
    auto error = unexpected_token(source, remainder, std::string(end_of_input_description));
    locate(error, source);
    spdlog::debug("{}:{}:{}: {} characters left unconsumed", source.file_name, error.position.line,
                  error.position.column, remainder.size());
    return error;
}

}  // namespace detail

}  // namespace chomp::parser
