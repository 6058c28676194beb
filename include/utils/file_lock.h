#pragma once

#include <filesystem>
#include <sys/file.h>
#include <fcntl.h>
#include <unistd.h>

namespace modelcat {

// Advisory flock() on a file for the lifetime of the object (best-effort).
// Shared mode is used by readers of config files, exclusive mode by writers.
// locked() is false if the file cannot be opened or the lock is held elsewhere.
class FileLock {
public:
    enum class Mode { Shared, Exclusive };

    explicit FileLock(const std::filesystem::path& target, Mode mode = Mode::Shared)
        : target_(target), mode_(mode) {
        acquire();
    }

    ~FileLock() { release(); }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool locked() const { return locked_; }

private:
    void acquire();
    void release();

    std::filesystem::path target_;
    Mode mode_;
    bool locked_{false};
    int fd_{-1};
};

inline void FileLock::acquire() {
    const int flags = mode_ == Mode::Shared ? O_RDONLY : (O_CREAT | O_RDWR);
    fd_ = ::open(target_.c_str(), flags | O_CLOEXEC, 0644);
    if (fd_ < 0) return;

    const int op = (mode_ == Mode::Shared ? LOCK_SH : LOCK_EX) | LOCK_NB;
    if (::flock(fd_, op) == 0) {
        locked_ = true;
        return;
    }
    ::close(fd_);
    fd_ = -1;
}

inline void FileLock::release() {
    if (fd_ < 0) return;
    if (locked_) ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
    locked_ = false;
}

}  // namespace modelcat
