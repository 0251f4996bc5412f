#pragma once
#include <atomic>
#include "util/unique_fd.hpp"

namespace execbox::runtime {

// Cancellation signal for one execution. fd() becomes readable on cancel();
// an optional peer fd (a client socket) is watched for hang-up as well.
class CancelToken {
public:
    CancelToken();

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void cancel();
    bool cancelled() const { return cancelled_.load(); }

    // eventfd, -1 if it could not be created (cancel() still sets the flag)
    int fd() const { return event_fd_.get(); }

    // Not owned; must outlive the token's use by the runner
    void watch_peer(int fd) { peer_fd_ = fd; }
    int peer_fd() const { return peer_fd_; }

private:
    util::UniqueFd event_fd_;
    int peer_fd_ = -1;
    std::atomic<bool> cancelled_{false};
};

} // namespace execbox::runtime
