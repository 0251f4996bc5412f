#pragma once
#include <unistd.h>
#include <fcntl.h>
#include <utility>

namespace execbox::util {

// Owning file descriptor, closed on destruction
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    int get() const { return fd_; }
    bool is_open() const { return fd_ >= 0; }

    int release() {
        return std::exchange(fd_, -1);
    }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

// Close-on-exec pipe; returns false and leaves both ends closed on failure
inline bool make_pipe(Pipe& p, int extra_flags = 0) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC | extra_flags) < 0) {
        return false;
    }
    p.read_end.reset(fds[0]);
    p.write_end.reset(fds[1]);
    return true;
}

} // namespace execbox::util
