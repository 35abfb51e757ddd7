#pragma once

#include <cstdint>

#include "lowrank_core/error.hpp"
#include "lowrank_core/pipeline.hpp"
#include "lowrank_core/writer.hpp"

namespace lowrank_cli {
// "[ 40%] solving eigenpairs G"
lowrank_core::ErrorCode format_progress(In std::uint8_t percent, In const char* label, Out lowrank_core::Writer* w) noexcept;

// multi line summary: singular values kept, data ratio, retained share for
// the sum policy, MSE, then one line per channel
lowrank_core::ErrorCode format_report(In const lowrank_core::CompressReport& report,
        In lowrank_core::PolicyKind policy,
        Out lowrank_core::Writer* w) noexcept;

// "dimension mismatch 4x4 vs 2x3" style one liner for a core error
lowrank_core::ErrorCode format_error(In const lowrank_core::Error& err, Out lowrank_core::Writer* w) noexcept;

} // namespace lowrank_cli
