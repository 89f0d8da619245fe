#include "counter.h"
#include "totp_errors.h"

#include <string>

namespace {

void check_period(std::chrono::seconds period) {
    if (period.count() <= 0) {
        throw InvalidParameterError("TOTP: period must be positive, got " +
                                    std::to_string(period.count()));
    }
}

long long clamped_seconds(UnixSeconds t) {
    auto secs = t.time_since_epoch().count();
    return secs >= 0 ? secs : 0;
}

} // namespace

UnixSeconds to_unix_seconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::time_point_cast<std::chrono::seconds>(tp);
}

std::uint64_t time_counter(UnixSeconds t, std::chrono::seconds period) {
    check_period(period);
    return static_cast<std::uint64_t>(clamped_seconds(t)) /
           static_cast<std::uint64_t>(period.count());
}

std::chrono::seconds seconds_remaining(UnixSeconds t, std::chrono::seconds period) {
    check_period(period);
    const long long p = period.count();
    return std::chrono::seconds(p - clamped_seconds(t) % p);
}

std::array<unsigned char, 8> encode_counter(std::uint64_t counter) {
    if (counter > kMaxCounter) {
        throw InvalidParameterError("TOTP: counter " + std::to_string(counter) +
                                    " does not fit in 32 bits");
    }
    std::array<unsigned char, 8> msg{};
    auto low = static_cast<std::uint32_t>(counter);
    for (int i = 7; i >= 4; --i) {
        msg[i] = static_cast<unsigned char>(low & 0xFF);
        low >>= 8;
    }
    return msg;
}
