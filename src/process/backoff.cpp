#include <mcp_relay/process/backoff.hpp>

namespace mcp_relay {

std::chrono::milliseconds BackoffDelay(std::chrono::milliseconds base,
                                       std::chrono::milliseconds cap,
                                       int attempt) {
    if (base.count() <= 0) return std::chrono::milliseconds(0);
    if (attempt < 0) attempt = 0;

    auto delay = base.count();
    for (int i = 0; i < attempt; ++i) {
        if (delay >= cap.count()) break;
        delay *= 2;
    }
    return std::chrono::milliseconds(delay < cap.count() ? delay : cap.count());
}

} // namespace mcp_relay
