#include "core/types.hpp"

#include <type_traits>

namespace wsbeacon {

static_assert(sizeof(DeviceId) == 16, "DeviceId should be 16 bytes");
static_assert(std::is_trivially_copyable_v<DeviceId>, "DeviceId should be trivially copyable");

uint64_t system_unix_seconds() {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count();
    // A clock before 1970 is treated as the epoch; such packets fail freshness anyway.
    return secs < 0 ? 0 : static_cast<uint64_t>(secs);
}

UnixClock system_clock() {
    return &system_unix_seconds;
}

} // namespace wsbeacon
