#pragma once

#include <cstdio>

#include "lowrank_cli/args.hpp"
#include "lowrank_cli/pnm.hpp"

namespace lowrank_cli {
// whole command: parse, load, compress, save, previews, report. progress and
// the report go to out, diagnostics to err. returns one of the kExit codes
int run(In int argc, In const char* const* argv, InOut std::FILE* out, InOut std::FILE* err) noexcept;

} // namespace lowrank_cli
