#pragma once

#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>
#include <chrono>
#include <map>

#define CONTROLHUB_VERSION "2025.12.0"

namespace scoreboard::controlhub {

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i8 = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using size_t = std::size_t;
using usize = std::size_t;

using TimePoint = std::chrono::steady_clock::time_point;
using WallClock = std::chrono::system_clock;
using Duration = std::chrono::nanoseconds;
using Milliseconds = std::chrono::milliseconds;

using TransactionId = u64;
using DocumentVersion = u64;

// Relative path inside a plugin package -> file contents.
using PackageFiles = std::map<std::string, std::string>;

}  // namespace scoreboard::controlhub
