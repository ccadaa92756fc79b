#include "chomp/parser/file.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>
#include <utility>

namespace chomp::parser
{

namespace
{

std::expected<Source, std::string> failure(std::string message)
{
    spdlog::debug("{}", message);
    return std::unexpected(std::move(message));
}

}  // namespace

std::expected<Source, std::string> load_source(const std::filesystem::path& path)
{
    namespace fs = std::filesystem;

    std::error_code ec;
    const fs::path absolute_path = fs::absolute(path, ec);
    if (ec) {
        return failure("Failed to resolve path: " + path.string() + ": " + ec.message());
    }

    if (!fs::is_regular_file(absolute_path, ec)) {
        return failure("Failed to open file: " + absolute_path.string() + ": " +
                       (ec ? ec.message() : std::string("not a regular file")));
    }

    std::ifstream file(absolute_path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return failure("Failed to open file: " + absolute_path.string());
    }

    const auto file_size = fs::file_size(absolute_path, ec);
    if (ec) {
        return failure("Failed to read file: " + absolute_path.string() + ": " + ec.message());
    }

    std::string content(file_size, '\0');
    if (!file.read(content.data(), static_cast<std::streamsize>(content.size()))) {
        return failure("Failed to read file: " + absolute_path.string());
    }

    spdlog::debug("Loaded {} bytes from {}", content.size(), absolute_path.string());

    return Source{.text = std::move(content), .file_name = absolute_path.string()};
}

}  // namespace chomp::parser
