#pragma once
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

namespace views {

// Self-pipe the UI polls next to stdin. Any thread may notify; the UI drains
// it and repaints once.
class RepaintSignal {
public:
    RepaintSignal()
    {
        if (::pipe(fds_) != 0) {
            throw std::system_error(errno, std::generic_category(), "pipe");
        }
        for (int fd : fds_) {
            const int flags = ::fcntl(fd, F_GETFL, 0);
            if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0 ||
                ::fcntl(fd, F_SETFD, FD_CLOEXEC) != 0) {
                const int saved = errno;
                close_();
                throw std::system_error(saved, std::generic_category(), "fcntl");
            }
        }
    }

    ~RepaintSignal() { close_(); }

    RepaintSignal(const RepaintSignal&) = delete;
    RepaintSignal& operator=(const RepaintSignal&) = delete;

    int read_fd() const { return fds_[0]; }

    // A full pipe already guarantees a pending repaint.
    void notify() noexcept
    {
        const char b = 1;
        while (::write(fds_[1], &b, 1) < 0 && errno == EINTR) {
        }
    }

    void drain() noexcept
    {
        char buf[64];
        while (true) {
            const ssize_t n = ::read(fds_[0], buf, sizeof(buf));
            if (n > 0) continue;
            if (n < 0 && errno == EINTR) continue;
            break;
        }
    }

private:
    void close_() noexcept
    {
        for (int& fd : fds_) {
            if (fd >= 0) ::close(fd);
            fd = -1;
        }
    }

    int fds_[2] = {-1, -1};
};

} // namespace views
