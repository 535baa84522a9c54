// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "daemon_lock.h"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

namespace wlmenu {

namespace {

constexpr int MAX_ACQUIRE_ATTEMPTS = 5;

struct LockRecord {
    DaemonLock::Role role = DaemonLock::Role::DAEMON;
    pid_t pid = 0;
};

pid_t parse_pid(const char* text) {
    char* end = nullptr;
    errno = 0;
    long value = strtol(text, &end, 10);
    if (errno != 0 || end == text || value <= 0 || value > 0x7fffffff) {
        return 0;
    }
    return static_cast<pid_t>(value);
}

// "daemon 1234", "oneshot 1234" or a bare "1234"
LockRecord parse_record(const char* text) {
    LockRecord rec;
    if (strncmp(text, "oneshot ", 8) == 0) {
        rec.role = DaemonLock::Role::ONESHOT;
        rec.pid = parse_pid(text + 8);
    } else if (strncmp(text, "daemon ", 7) == 0) {
        rec.pid = parse_pid(text + 7);
    } else if (isdigit(static_cast<unsigned char>(text[0]))) {
        rec.pid = parse_pid(text);
    }
    return rec;
}

LockRecord read_record_fd(int fd) {
    char buf[48] = {};
    ssize_t n = pread(fd, buf, sizeof(buf) - 1, 0);
    if (n <= 0) {
        return LockRecord();
    }
    return parse_record(buf);
}

LockRecord read_record(const std::string& path) {
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return LockRecord();
    }
    LockRecord rec = read_record_fd(fd);
    close(fd);
    return rec;
}

} // namespace

const char* lock_status_name(DaemonLock::Status status) {
    switch (status) {
    case DaemonLock::Status::ACQUIRED:
        return "ACQUIRED";
    case DaemonLock::Status::ALREADY_RUNNING:
        return "ALREADY_RUNNING";
    case DaemonLock::Status::IO_ERROR:
        return "IO_ERROR";
    }
    return "UNKNOWN";
}

const char* lock_role_name(DaemonLock::Role role) {
    return role == DaemonLock::Role::ONESHOT ? "oneshot" : "daemon";
}

DaemonLock::DaemonLock(std::string path, Role role) : path_(std::move(path)), role_(role) {}

DaemonLock::~DaemonLock() {
    if (fd_ >= 0) {
        release();
        // Use fprintf - spdlog may be destroyed during static cleanup
        fprintf(stderr, "[DaemonLock] Released %s\n", path_.c_str());
    }
}

DaemonLock::Status DaemonLock::acquire() {
    if (fd_ >= 0) {
        return Status::ACQUIRED;
    }
    holder_pid_ = 0;
    holder_role_ = Role::DAEMON;
    reclaimed_pid_ = 0;
    error_.clear();

    for (int attempt = 0; attempt < MAX_ACQUIRE_ATTEMPTS; ++attempt) {
        int fd = open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd < 0) {
            error_ = "open " + path_ + ": " + strerror(errno);
            spdlog::error("[DaemonLock] {}", error_);
            return Status::IO_ERROR;
        }

        if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
            int err = errno;
            if (err == EWOULDBLOCK) {
                LockRecord holder = read_record_fd(fd);
                holder_pid_ = holder.pid;
                holder_role_ = holder.role;
                close(fd);
                spdlog::debug("[DaemonLock] Held by {} PID {}", lock_role_name(holder_role_),
                              holder_pid_);
                return Status::ALREADY_RUNNING;
            }
            close(fd);
            error_ = "flock " + path_ + ": " + strerror(err);
            spdlog::error("[DaemonLock] {}", error_);
            return Status::IO_ERROR;
        }

        // The previous holder may have unlinked the file between our open() and
        // flock(); then we locked an orphaned inode and must start over.
        struct stat fd_st;
        struct stat path_st;
        if (fstat(fd, &fd_st) != 0 || stat(path_.c_str(), &path_st) != 0 ||
            fd_st.st_ino != path_st.st_ino || fd_st.st_dev != path_st.st_dev) {
            close(fd);
            continue;
        }

        pid_t previous = read_record_fd(fd).pid;
        if (previous > 0 && previous != getpid()) {
            if (process_alive(previous)) {
                // Alive but not holding the flock: PID reuse, the old daemon is gone
                spdlog::debug("[DaemonLock] Recorded PID {} is alive but holds no lock",
                              previous);
            }
            reclaimed_pid_ = previous;
            spdlog::info("[DaemonLock] Reclaimed stale lock from PID {}", previous);
        }

        std::string content =
            std::string(lock_role_name(role_)) + " " + std::to_string(getpid()) + "\n";
        if (ftruncate(fd, 0) != 0 ||
            pwrite(fd, content.data(), content.size(), 0) != static_cast<ssize_t>(content.size()) ||
            fsync(fd) != 0) {
            error_ = "write " + path_ + ": " + strerror(errno);
            spdlog::error("[DaemonLock] {}", error_);
            close(fd);
            return Status::IO_ERROR;
        }

        fd_ = fd;
        spdlog::debug("[DaemonLock] Acquired {} as {} (PID {})", path_, lock_role_name(role_),
                      getpid());
        return Status::ACQUIRED;
    }

    error_ = "lock file kept changing underneath us: " + path_;
    spdlog::error("[DaemonLock] {}", error_);
    return Status::IO_ERROR;
}

DaemonLock::Status DaemonLock::acquire_waiting(std::chrono::milliseconds oneshot_wait) {
    const auto deadline = std::chrono::steady_clock::now() + oneshot_wait;
    for (;;) {
        Status status = acquire();
        if (status != Status::ALREADY_RUNNING) {
            return status;
        }
        // A dead or unrecorded PID means the holder has not written its record yet
        bool transient = holder_role_ == Role::ONESHOT || !process_alive(holder_pid_);
        if (!transient || std::chrono::steady_clock::now() >= deadline) {
            return status;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

void DaemonLock::release() {
    if (fd_ < 0) {
        return;
    }

    // Unlink while still holding the flock so no one can lock our inode in between
    struct stat fd_st;
    struct stat path_st;
    if (fstat(fd_, &fd_st) == 0 && stat(path_.c_str(), &path_st) == 0 &&
        fd_st.st_ino == path_st.st_ino && fd_st.st_dev == path_st.st_dev) {
        unlink(path_.c_str());
    }
    close(fd_);
    fd_ = -1;
}

pid_t DaemonLock::read_pid(const std::string& path) {
    return read_record(path).pid;
}

DaemonLock::Role DaemonLock::read_role(const std::string& path) {
    return read_record(path).role;
}

bool DaemonLock::process_alive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

pid_t DaemonLock::running_daemon_pid(const std::string& path) {
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return 0;
    }

    pid_t pid = 0;
    if (flock(fd, LOCK_SH | LOCK_NB) != 0) {
        if (errno == EWOULDBLOCK) {
            LockRecord holder = read_record_fd(fd);
            if (holder.role == Role::DAEMON && process_alive(holder.pid)) {
                pid = holder.pid;
            }
        }
    } else {
        flock(fd, LOCK_UN);
    }
    close(fd);
    return pid;
}

} // namespace wlmenu
