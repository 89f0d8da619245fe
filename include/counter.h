#pragma once
#include <array>
#include <chrono>
#include <cstdint>

// Whole-second wall-clock instant. system_clock::time_point is nanosecond
// based on common libraries and cannot reach year 2603 (t = 20000000000).
using UnixSeconds = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

// Largest time-step counter the 8-byte encoding carries (low 4 bytes only).
constexpr std::uint64_t kMaxCounter = 0xFFFFFFFFull;

// Truncates to whole seconds.
UnixSeconds to_unix_seconds(std::chrono::system_clock::time_point tp);

// floor(unix_seconds / period); pre-epoch times clamp to 0.
// Throws InvalidParameterError if period <= 0.
std::uint64_t time_counter(UnixSeconds t, std::chrono::seconds period);

// Seconds until the counter ticks over.
std::chrono::seconds seconds_remaining(UnixSeconds t, std::chrono::seconds period);

// 8 bytes big-endian, high half zero. Throws InvalidParameterError above kMaxCounter.
std::array<unsigned char, 8> encode_counter(std::uint64_t counter);
