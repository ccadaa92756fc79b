#include <gtest/gtest.h>

#include "chomp/parser/error.hpp"

#include <string>
#include <system_error>

using namespace chomp::parser;

TEST(ParseErrorCategory, NameAndMessages)
{
    const auto& category = parse_error_category();
    EXPECT_STREQ(category.name(), "chomp.parse");
    EXPECT_EQ(category.message(static_cast<int>(ParseErrorCode::UnexpectedEof)), "unexpected end of input");
    EXPECT_EQ(category.message(static_cast<int>(ParseErrorCode::UnexpectedToken)), "unexpected token");
    EXPECT_EQ(category.message(0), "unknown");
}

TEST(ParseErrorCategory, CodesConvertToErrorCode)
{
    std::error_code ec = ParseErrorCode::UnexpectedToken;
    EXPECT_EQ(&ec.category(), &parse_error_category());
    EXPECT_EQ(ec, ParseErrorCode::UnexpectedToken);
    EXPECT_NE(ec, ParseErrorCode::UnexpectedEof);
    EXPECT_TRUE(static_cast<bool>(ec));
}

TEST(ParseError, UnexpectedEofIsPlacedAtEndOfSource)
{
    const Source source{.text = "ab\ncd", .file_name = "/tmp/input.txt"};

    auto error = unexpected_eof(source, "'x'");
    EXPECT_TRUE(error.is_unexpected_eof());
    EXPECT_FALSE(error.is_unexpected_token());
    EXPECT_FALSE(error.found.has_value());
    EXPECT_EQ(error.expected, "'x'");
    EXPECT_EQ(error.position.offset, 5);
    EXPECT_EQ(error.file_name, "/tmp/input.txt");

    locate(error, source);
    EXPECT_EQ(error.position, (Position{.line = 2, .column = 3, .offset = 5}));
}

TEST(ParseError, UnexpectedTokenIsPlacedAtInput)
{
    const Source source{.text = "abc\ndef"};
    const std::string_view input = std::string_view(source.text).substr(5);

    auto error = unexpected_token(source, input, "'x'");
    EXPECT_TRUE(error.is_unexpected_token());
    EXPECT_FALSE(error.is_unexpected_eof());
    ASSERT_TRUE(error.found.has_value());
    EXPECT_EQ(*error.found, "ef");
    EXPECT_EQ(error.expected, "'x'");
    EXPECT_EQ(error.position.offset, 5);
    EXPECT_EQ(error.file_name, "<inline>");

    locate(error, source);
    EXPECT_EQ(error.position, (Position{.line = 2, .column = 2, .offset = 5}));
}

TEST(ParseError, FoundTextIsBounded)
{
    const Source source{.text = std::string(100, 'z')};

    auto error = unexpected_token(source, source.text, "'a'");
    ASSERT_TRUE(error.found.has_value());
    EXPECT_EQ(error.found->size(), found_preview_length);
    EXPECT_EQ(*error.found, std::string(20, 'z'));
}

TEST(ParseError, MatchersLeaveErrorsUnlocated)
{
    const Source source{.text = "one\ntwo"};

    auto error = unexpected_token(source, std::string_view(source.text).substr(4), "'x'");
    EXPECT_FALSE(error.is_located());
    EXPECT_EQ(error.position.line, 0);
    EXPECT_EQ(error.position.column, 0);
    EXPECT_EQ(error.position.offset, 4);

    locate(error, source);
    EXPECT_TRUE(error.is_located());
    EXPECT_EQ(error.position, (Position{.line = 2, .column = 1, .offset = 4}));
}

TEST(ParseError, BoundLength)
{
    EXPECT_EQ(bound_length("abcdef", 3), "abc");
    EXPECT_EQ(bound_length("ab", 3), "ab");
    EXPECT_EQ(bound_length("", 3), "");
}

TEST(ParseError, BoundLengthKeepsUtf8SequencesWhole)
{
    // U+00E9 is two bytes, U+20AC three
    const std::string e_acute = "\xC3\xA9";
    const std::string euro = "\xE2\x82\xAC";

    EXPECT_EQ(bound_length("ab" + e_acute, 3), "ab");
    EXPECT_EQ(bound_length("ab" + e_acute, 4), "ab" + e_acute);
    EXPECT_EQ(bound_length("a" + euro + "z", 2), "a");
    EXPECT_EQ(bound_length("a" + euro + "z", 3), "a");
    EXPECT_EQ(bound_length("a" + euro + "z", 4), "a" + euro);
}

TEST(ParseError, FoundTextDoesNotSplitUtf8)
{
    const Source source{.text = std::string(19, 'a') + "\xC3\xA9tail"};

    auto error = unexpected_token(source, source.text, "'x'");
    ASSERT_TRUE(error.found.has_value());
    EXPECT_EQ(*error.found, std::string(19, 'a'));
}

TEST(ParseError, Message)
{
    const Source source{.text = "xyz"};

    EXPECT_EQ(unexpected_eof(source, "'a'").message(), "unexpected end of input, expected 'a'");
    EXPECT_EQ(unexpected_token(source, source.text, "\"ab\"").message(),
              "unexpected token \"xyz\", expected \"ab\"");
}
