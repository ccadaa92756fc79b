#include "chomp/diagnostic/format.hpp"

namespace chomp::diagnostic
{

std::string format(const parser::ParseError& error)
{
    return fmt::format("{}:{}: error: {}", error.file_name, error.position, error.message());
}

}  // namespace chomp::diagnostic
