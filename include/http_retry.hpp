#pragma once

#include <chrono>
#include <string>
#include <thread>
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

namespace workspace_rag {

inline bool is_success(const cpr::Response& r) {
    return r.status_code >= 200 && r.status_code < 300;
}

// Re-issues the request on 429 / 503 with a linear cooldown; any other
// status is returned to the caller as is.
template<typename Func>
cpr::Response perform_request_with_retry(Func request_factory,
                                         const std::string& what,
                                         int max_retries = 4,
                                         std::chrono::milliseconds base_delay = std::chrono::milliseconds(500)) {
    cpr::Response r;
    for (int i = 0; i < max_retries; ++i) {
        r = request_factory();
        if (is_success(r)) return r;
        if (r.status_code == 429 || r.status_code == 503) {
            spdlog::warn("⚠️ {} returned {} ({}). Cooling down (Attempt {}/{})...",
                         what, r.status_code, (r.status_code == 429 ? "Quota" : "Overload"), i + 1, max_retries);
            std::this_thread::sleep_for(base_delay * (i + 1));
            continue;
        }
        break;
    }
    return r;
}

} // namespace workspace_rag
