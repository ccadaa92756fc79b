#include "chomp/parser/source.hpp"

#include <algorithm>

namespace chomp::parser
{

Position position_of(std::string_view text, std::size_t offset)
{
    offset = std::min(offset, text.size());

    Position position;
    position.offset = offset;
    for (std::size_t i = 0; i < offset; ++i) {
        if (text[i] == '\n') {
            ++position.line;
            position.column = 1;
        } else {
            ++position.column;
        }
    }
    return position;
}

std::size_t offset_of(const Source& source, std::string_view remainder)
{
    if (remainder.size() > source.text.size()) {
        return 0;
    }
    return source.text.size() - remainder.size();
}

}  // namespace chomp::parser
