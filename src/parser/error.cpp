#include "chomp/parser/error.hpp"

#include <fmt/core.h>

#include <utility>

namespace chomp::parser
{

namespace
{

Position unlocated(std::size_t offset)
{
    return Position{.line = 0, .column = 0, .offset = offset};
}

bool is_continuation_byte(char c)
{
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

}  // namespace

std::string ParseError::message() const
{
    if (found) {
        return fmt::format("{} \"{}\", expected {}", code.message(), *found, expected);
    }
    return fmt::format("{}, expected {}", code.message(), expected);
}

ParseError unexpected_eof(const Source& source, std::string expected)
{
    return ParseError{.code = make_error_code(ParseErrorCode::UnexpectedEof),
                      .found = std::nullopt,
                      .expected = std::move(expected),
                      .position = unlocated(source.text.size()),
                      .file_name = source.file_name};
}

ParseError unexpected_token(const Source& source, std::string_view input, std::string expected)
{
    return ParseError{.code = make_error_code(ParseErrorCode::UnexpectedToken),
                      .found = bound_length(input, found_preview_length),
                      .expected = std::move(expected),
                      .position = unlocated(offset_of(source, input)),
                      .file_name = source.file_name};
}

void locate(ParseError& error, const Source& source)
{
    error.position = position_of(source.text, error.position.offset);
}

std::string bound_length(std::string_view text, std::size_t limit)
{
    if (text.size() <= limit) {
        return std::string(text);
    }

    // back off to the lead byte of a sequence cut by the limit
    std::size_t cut = limit;
    while (cut > 0 && is_continuation_byte(text[cut])) {
        --cut;
    }
    return std::string(text.substr(0, cut));
}

}  // namespace chomp::parser
