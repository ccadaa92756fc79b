#pragma once

#include "chomp/parser/error.hpp"
#include "chomp/parser/file.hpp"
#include "chomp/parser/inline_parser.hpp"
#include "chomp/parser/parser.hpp"
#include "chomp/parser/reference.hpp"
#include "chomp/parser/result.hpp"
#include "chomp/parser/source.hpp"
#include "chomp/parser/terminals.hpp"
#include "chomp/version.hpp"
