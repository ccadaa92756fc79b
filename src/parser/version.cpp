#include "chomp/version.hpp"

#include <fmt/core.h>

namespace chomp
{

std::string version()
{
    return fmt::format("{}.{}.{}", CHOMP_VERSION_MAJOR, CHOMP_VERSION_MINOR, CHOMP_VERSION_PATCH);
}

}  // namespace chomp
