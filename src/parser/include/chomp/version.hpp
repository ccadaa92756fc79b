#pragma once

#include <string>

namespace chomp
{

/// Library version as "major.minor.patch".
std::string version();

}  // namespace chomp
