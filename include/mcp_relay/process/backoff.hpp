#pragma once

#include <chrono>

namespace mcp_relay {

/// Delay before restart/reconnect attempt `attempt` (0-based):
/// min(base * 2^attempt, cap). Never overflows for large attempts.
[[nodiscard]] std::chrono::milliseconds BackoffDelay(std::chrono::milliseconds base,
                                                     std::chrono::milliseconds cap,
                                                     int attempt);

} // namespace mcp_relay
