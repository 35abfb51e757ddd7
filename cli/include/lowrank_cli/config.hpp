#pragma once

#include <cstddef>
#include <cstdint>

namespace lowrank_cli {
// largest accepted image side. bigger inputs are rejected while reading the
// header, before any pixel memory is reserved
constexpr std::uint32_t kMaxImageSide = 16384;

constexpr std::size_t kMessageBytes = 256;
constexpr std::size_t kPathBytes = 1024;
constexpr std::size_t kReportBytes = 1024;

// exit codes
constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitIo = 2;
constexpr int kExitCompress = 3;
} // namespace lowrank_cli

