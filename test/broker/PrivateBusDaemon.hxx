// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "lib/dbus/Connection.hxx"

#include <string>
#include <string_view>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

/**
 * Launches a private "dbus-daemon" with the session bus
 * configuration and terminates it in the destructor.  If the daemon
 * cannot be launched, IsAvailable() returns false.
 */
class PrivateBusDaemon {
    pid_t pid = -1;

    std::string address;

public:
    PrivateBusDaemon() noexcept {
        int fds[2];
        if (pipe2(fds, O_CLOEXEC) < 0)
            return;

        pid = fork();
        if (pid < 0) {
            close(fds[0]);
            close(fds[1]);
            return;
        }

        if (pid == 0) {
            dup2(fds[1], STDOUT_FILENO);
            execlp("dbus-daemon", "dbus-daemon",
                   "--session", "--nofork", "--print-address",
                   nullptr);
            _exit(127);
        }

        close(fds[1]);

        /* the daemon prints its address followed by a newline */
        char buffer[1024];
        std::size_t fill = 0;
        struct pollfd pfd{.fd = fds[0], .events = POLLIN, .revents = 0};
        while (fill < sizeof(buffer) && poll(&pfd, 1, 5000) > 0) {
            const auto nbytes = read(fds[0], buffer + fill,
                                     sizeof(buffer) - fill);
            if (nbytes <= 0)
                break;

            fill += nbytes;

            const std::string_view s{buffer, fill};
            if (const auto nl = s.find('\n'); nl != s.npos) {
                address = s.substr(0, nl);
                break;
            }
        }

        close(fds[0]);
    }

    ~PrivateBusDaemon() noexcept {
        if (pid > 0) {
            kill(pid, SIGTERM);
            waitpid(pid, nullptr, 0);
        }
    }

    PrivateBusDaemon(const PrivateBusDaemon &) = delete;
    PrivateBusDaemon &operator=(const PrivateBusDaemon &) = delete;

    bool IsAvailable() const noexcept {
        return !address.empty();
    }

    const std::string &GetAddress() const noexcept {
        return address;
    }

    /**
     * Open a new private connection to this bus.  The caller
     * must close it.
     */
    ODBus::Connection Connect() const {
        auto connection = ODBus::Connection::OpenPrivate(address.c_str());
        connection.SetExitOnDisconnect(false);

        try {
            connection.Register();
        } catch (...) {
            connection.Close();
            throw;
        }

        return connection;
    }
};
