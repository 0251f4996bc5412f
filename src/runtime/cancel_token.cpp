#include "runtime/cancel_token.hpp"
#include <spdlog/spdlog.h>

#include <sys/eventfd.h>
#include <cerrno>
#include <cstdint>
#include <cstring>

namespace execbox::runtime {

CancelToken::CancelToken()
    : event_fd_(::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK)) {
    if (!event_fd_.is_open()) {
        spdlog::error("eventfd failed: {}", strerror(errno));
    }
}

void CancelToken::cancel() {
    if (cancelled_.exchange(true)) {
        return;
    }
    if (event_fd_.is_open()) {
        uint64_t one = 1;
        if (::write(event_fd_.get(), &one, sizeof(one)) < 0 && errno != EAGAIN) {
            spdlog::warn("Failed to signal cancel eventfd: {}", strerror(errno));
        }
    }
}

} // namespace execbox::runtime
