// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "daemon_lock.h"

#include "../test_fixtures.h"

#include <catch2/catch_test_macros.hpp>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <sys/file.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

using namespace std::chrono_literals;

namespace {

void write_lock_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

std::string read_lock_file(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

/// PID of a process that has already exited and been reaped
pid_t dead_pid() {
    pid_t child = fork();
    if (child == 0) {
        _exit(0);
    }
    int status = 0;
    waitpid(child, &status, 0);
    return child;
}

} // namespace

TEST_CASE("DaemonLock: acquire writes our PID", "[daemon][lock]") {
    TempDir dir;
    std::string path = dir.file("daemon.lock");

    DaemonLock lock(path);
    REQUIRE(lock.acquire() == DaemonLock::Status::ACQUIRED);
    REQUIRE(lock.held());
    REQUIRE(lock.reclaimed_pid() == 0);
    REQUIRE(DaemonLock::read_pid(path) == getpid());
}

TEST_CASE("DaemonLock: second instance sees the live holder", "[daemon][lock]") {
    TempDir dir;
    std::string path = dir.file("daemon.lock");

    DaemonLock first(path);
    REQUIRE(first.acquire() == DaemonLock::Status::ACQUIRED);

    DaemonLock second(path);
    REQUIRE(second.acquire() == DaemonLock::Status::ALREADY_RUNNING);
    REQUIRE_FALSE(second.held());
    REQUIRE(second.holder_pid() == getpid());

    // The loser must not have disturbed the holder's file
    REQUIRE(DaemonLock::read_pid(path) == getpid());
}

TEST_CASE("DaemonLock: acquire is idempotent for the holder", "[daemon][lock]") {
    TempDir dir;
    DaemonLock lock(dir.file("daemon.lock"));
    REQUIRE(lock.acquire() == DaemonLock::Status::ACQUIRED);
    REQUIRE(lock.acquire() == DaemonLock::Status::ACQUIRED);
}

TEST_CASE("DaemonLock: stale lock files are reclaimed", "[daemon][lock]") {
    TempDir dir;
    std::string path = dir.file("daemon.lock");

    SECTION("dead PID") {
        pid_t gone = dead_pid();
        write_lock_file(path, std::to_string(gone) + "\n");

        DaemonLock lock(path);
        REQUIRE(lock.acquire() == DaemonLock::Status::ACQUIRED);
        REQUIRE(lock.reclaimed_pid() == gone);
        REQUIRE(DaemonLock::read_pid(path) == getpid());
    }

    SECTION("garbage content") {
        write_lock_file(path, "not-a-pid");

        DaemonLock lock(path);
        REQUIRE(lock.acquire() == DaemonLock::Status::ACQUIRED);
        REQUIRE(lock.reclaimed_pid() == 0);
        REQUIRE(DaemonLock::read_pid(path) == getpid());
    }

    SECTION("empty file") {
        write_lock_file(path, "");

        DaemonLock lock(path);
        REQUIRE(lock.acquire() == DaemonLock::Status::ACQUIRED);
        REQUIRE(DaemonLock::read_pid(path) == getpid());
    }
}

TEST_CASE("DaemonLock: release removes the file and frees the lock", "[daemon][lock]") {
    TempDir dir;
    std::string path = dir.file("daemon.lock");

    {
        DaemonLock lock(path);
        REQUIRE(lock.acquire() == DaemonLock::Status::ACQUIRED);
        lock.release();
        REQUIRE_FALSE(lock.held());
        REQUIRE_FALSE(std::filesystem::exists(path));
    }

    SECTION("another instance can take over") {
        DaemonLock next(path);
        REQUIRE(next.acquire() == DaemonLock::Status::ACQUIRED);
    }

    SECTION("destructor releases too") {
        {
            DaemonLock scoped(path);
            REQUIRE(scoped.acquire() == DaemonLock::Status::ACQUIRED);
            REQUIRE(std::filesystem::exists(path));
        }
        REQUIRE_FALSE(std::filesystem::exists(path));
    }
}

TEST_CASE("DaemonLock: unusable directory reports an IO error", "[daemon][lock]") {
    DaemonLock lock("/nonexistent-wlmenu-dir/daemon.lock");
    REQUIRE(lock.acquire() == DaemonLock::Status::IO_ERROR);
    REQUIRE_FALSE(lock.held());
    REQUIRE_FALSE(lock.error().empty());
}

TEST_CASE("DaemonLock: running_daemon_pid follows the flock", "[daemon][lock]") {
    TempDir dir;
    std::string path = dir.file("daemon.lock");

    REQUIRE(DaemonLock::running_daemon_pid(path) == 0);

    // A file naming a PID without a lock holder is not a running daemon
    write_lock_file(path, std::to_string(getpid()) + "\n");
    REQUIRE(DaemonLock::running_daemon_pid(path) == 0);

    DaemonLock lock(path);
    REQUIRE(lock.acquire() == DaemonLock::Status::ACQUIRED);
    REQUIRE(DaemonLock::running_daemon_pid(path) == getpid());

    lock.release();
    REQUIRE(DaemonLock::running_daemon_pid(path) == 0);
}

TEST_CASE("DaemonLock: the file records the holder's role", "[daemon][lock]") {
    TempDir dir;
    std::string path = dir.file("daemon.lock");

    SECTION("daemon") {
        DaemonLock lock(path);
        REQUIRE(lock.acquire() == DaemonLock::Status::ACQUIRED);
        REQUIRE(read_lock_file(path) == "daemon " + std::to_string(getpid()) + "\n");
        REQUIRE(DaemonLock::read_role(path) == DaemonLock::Role::DAEMON);
    }

    SECTION("one-shot writer") {
        DaemonLock lock(path, DaemonLock::Role::ONESHOT);
        REQUIRE(lock.acquire() == DaemonLock::Status::ACQUIRED);
        REQUIRE(read_lock_file(path) == "oneshot " + std::to_string(getpid()) + "\n");
        REQUIRE(DaemonLock::read_role(path) == DaemonLock::Role::ONESHOT);
        REQUIRE(DaemonLock::read_pid(path) == getpid());
    }
}

TEST_CASE("DaemonLock: a one-shot holder is not a running daemon", "[daemon][lock]") {
    TempDir dir;
    std::string path = dir.file("daemon.lock");

    DaemonLock oneshot(path, DaemonLock::Role::ONESHOT);
    REQUIRE(oneshot.acquire() == DaemonLock::Status::ACQUIRED);
    REQUIRE(DaemonLock::running_daemon_pid(path) == 0);

    DaemonLock daemon(path);
    REQUIRE(daemon.acquire() == DaemonLock::Status::ALREADY_RUNNING);
    REQUIRE(daemon.holder_role() == DaemonLock::Role::ONESHOT);
    REQUIRE(daemon.holder_pid() == getpid());

    SECTION("daemon start waits for the one-shot cycle to end") {
        std::thread finisher([&oneshot]() {
            std::this_thread::sleep_for(200ms);
            oneshot.release();
        });
        DaemonLock::Status status = daemon.acquire_waiting(3000ms);
        finisher.join();

        REQUIRE(status == DaemonLock::Status::ACQUIRED);
        REQUIRE(DaemonLock::running_daemon_pid(path) == getpid());
    }

    SECTION("the wait is bounded") {
        auto start = std::chrono::steady_clock::now();
        REQUIRE(daemon.acquire_waiting(200ms) == DaemonLock::Status::ALREADY_RUNNING);
        REQUIRE(std::chrono::steady_clock::now() - start >= 200ms);
    }
}

TEST_CASE("DaemonLock: acquire_waiting does not wait for a live daemon", "[daemon][lock]") {
    TempDir dir;
    std::string path = dir.file("daemon.lock");

    DaemonLock first(path);
    REQUIRE(first.acquire() == DaemonLock::Status::ACQUIRED);

    DaemonLock second(path);
    auto start = std::chrono::steady_clock::now();
    REQUIRE(second.acquire_waiting(5000ms) == DaemonLock::Status::ALREADY_RUNNING);
    REQUIRE(std::chrono::steady_clock::now() - start < 1000ms);
    REQUIRE(second.holder_role() == DaemonLock::Role::DAEMON);
}

TEST_CASE("DaemonLock: a bare PID record counts as a daemon", "[daemon][lock]") {
    TempDir dir;
    std::string path = dir.file("daemon.lock");
    write_lock_file(path, std::to_string(getpid()) + "\n");

    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    REQUIRE(fd >= 0);
    REQUIRE(flock(fd, LOCK_EX | LOCK_NB) == 0);

    REQUIRE(DaemonLock::read_role(path) == DaemonLock::Role::DAEMON);
    REQUIRE(DaemonLock::running_daemon_pid(path) == getpid());
    close(fd);
}

TEST_CASE("DaemonLock: process liveness check", "[daemon][lock]") {
    REQUIRE(DaemonLock::process_alive(getpid()));
    REQUIRE_FALSE(DaemonLock::process_alive(0));
    REQUIRE_FALSE(DaemonLock::process_alive(-1));
    REQUIRE_FALSE(DaemonLock::process_alive(dead_pid()));
}

TEST_CASE("DaemonLock: status names", "[daemon][lock]") {
    REQUIRE(std::string(lock_status_name(DaemonLock::Status::ACQUIRED)) == "ACQUIRED");
    REQUIRE(std::string(lock_status_name(DaemonLock::Status::ALREADY_RUNNING)) ==
            "ALREADY_RUNNING");
    REQUIRE(std::string(lock_status_name(DaemonLock::Status::IO_ERROR)) == "IO_ERROR");
    REQUIRE(std::string(lock_role_name(DaemonLock::Role::DAEMON)) == "daemon");
    REQUIRE(std::string(lock_role_name(DaemonLock::Role::ONESHOT)) == "oneshot");
}
