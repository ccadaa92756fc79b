#include "chomp/diagnostic/json_dump.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace chomp::diagnostic
{
namespace
{

using nlohmann::json;

std::string error_kind_to_string(const parser::ParseError& error)
{
    if (error.is_unexpected_eof()) {
        return "unexpected_eof";
    }
    if (error.is_unexpected_token()) {
        return "unexpected_token";
    }
    return "<unknown>";
}

}  // namespace

nlohmann::json to_json(const parser::Position& position)
{
    json result;
    result["line"] = position.line;
    result["column"] = position.column;
    result["offset"] = position.offset;
    return result;
}

nlohmann::json to_json(const parser::ParseError& error)
{
    json result;
    result["kind"] = error_kind_to_string(error);
    result["found"] = error.found ? json(*error.found) : json(nullptr);
    result["expected"] = error.expected;
    result["message"] = error.message();
    result["position"] = to_json(error.position);
    result["source"] = json{{"file_name", error.file_name}};
    return result;
}

}  // namespace chomp::diagnostic
