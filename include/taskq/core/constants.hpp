#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

namespace taskq {

namespace queues {
inline constexpr std::string_view kCritical = "critical";
inline constexpr std::string_view kDefault = "default";
inline constexpr std::string_view kLow = "low";
}

namespace paging {
inline constexpr int kDefaultPage = 1;
inline constexpr int kDefaultPageSize = 20;
inline constexpr int kMaxPageSize = 100;
inline constexpr std::size_t kPayloadPreviewLen = 100;
}

namespace timing {
inline constexpr auto kMonitorTick = std::chrono::milliseconds(20);
inline constexpr auto kBrokerBackoffInitial = std::chrono::milliseconds(100);
inline constexpr auto kBrokerBackoffMax = std::chrono::seconds(5);
inline constexpr auto kShutdownPollInterval = std::chrono::milliseconds(50);
inline constexpr auto kSqliteBusyTimeout = std::chrono::milliseconds(5000);
}

}  // namespace taskq
