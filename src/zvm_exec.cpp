/*
 * Copyright (C) 2011-2014 Red Hat, Inc.
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; If not, see <http://www.gnu.org/licenses/>.
 */

#include "zvm_exec.hpp"
#include "zvm_ipc.hpp"
#include "zvm_utils.hpp"

#include <algorithm>
#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <syslog.h>
#include <time.h>
#include <unistd.h>

namespace ZVM {

static int64_t now_ms(void) {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return (int64_t)ts.tv_sec * 1000 + ts.tv_nsec / 1000000;
}

static void close_fd(int &fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

static void reap(pid_t pid, int *status) {
    while (waitpid(pid, status, 0) == -1 && errno == EINTR) {
    }
}

std::string command_str(const std::string &command,
                        const std::vector<std::string> &args) {
    std::string rc = command;
    for (size_t i = 0; i < args.size(); ++i) {
        rc += " " + args[i];
    }
    return rc;
}

ProcessExecutor::ProcessExecutor(const std::vector<std::string> &prefix)
    : prefix(prefix) {}

CommandResult ProcessExecutor::run(const std::string &command,
                                   const std::vector<std::string> &args,
                                   uint32_t timeout) {
    CommandResult result;
    std::vector<std::string> words(prefix);
    words.push_back(command);
    words.insert(words.end(), args.begin(), args.end());

    std::string cmd_line = command_str(command, args);
    syslog(LOG_USER | LOG_DEBUG, "exec: %s", cmd_line.c_str());

    // Built before fork, the child only calls async-signal-safe functions
    std::vector<char *> argv;
    for (size_t i = 0; i < words.size(); ++i) {
        argv.push_back(const_cast<char *>(words[i].c_str()));
    }
    argv.push_back(NULL);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};

    if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0) {
        int e = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        throw ZvmException(ZVM_ERR_EXEC_FAILURE,
                           "Unable to create pipes for '" + cmd_line + "'",
                           strerror(e));
    }

    pid_t pid = fork();
    if (pid == -1) {
        int e = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        throw ZvmException(ZVM_ERR_EXEC_FAILURE,
                           "Unable to fork for '" + cmd_line + "'",
                           strerror(e));
    }

    if (pid == 0) {
        static const char msg[] = "exec failed: command not found\n";
        int devnull = open("/dev/null", O_RDONLY);

        setpgid(0, 0);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        execvp(argv[0], &argv[0]);
        if (write(STDERR_FILENO, msg, sizeof(msg) - 1) < 0) {
            _exit(ZVM_EXEC_NOT_FOUND);
        }
        _exit(ZVM_EXEC_NOT_FOUND);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    int64_t deadline = now_ms() + timeout;
    bool timed_out = false;
    struct pollfd fds[2];
    std::string *sinks[2] = {&result.out, &result.err};
    int open_fds = 2;

    fds[0].fd = out_pipe[0];
    fds[0].events = POLLIN;
    fds[1].fd = err_pipe[0];
    fds[1].events = POLLIN;

    while (open_fds > 0) {
        int64_t remaining = deadline - now_ms();
        if (remaining <= 0) {
            timed_out = true;
            break;
        }

        fds[0].revents = 0;
        fds[1].revents = 0;
        int rc = poll(fds, 2, (int)std::min(remaining, (int64_t)INT_MAX));
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            int e = errno;
            kill(-pid, SIGKILL);
            reap(pid, NULL);
            close_fd(fds[0].fd);
            close_fd(fds[1].fd);
            throw ZvmException(ZVM_ERR_EXEC_FAILURE,
                               "poll failed while running '" + cmd_line + "'",
                               strerror(e));
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }

            char buff[4096];
            ssize_t rd = read(fds[i].fd, buff, sizeof(buff));
            if (rd > 0) {
                sinks[i]->append(buff, rd);
            } else if (rd == 0 || (errno != EINTR && errno != EAGAIN)) {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                --open_fds;
            }
        }
    }

    int status = 0;
    while (!timed_out) {
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            break;
        }
        if (w == -1 && errno != EINTR) {
            int e = errno;
            close_fd(fds[0].fd);
            close_fd(fds[1].fd);
            throw ZvmException(ZVM_ERR_EXEC_FAILURE,
                               "waitpid failed for '" + cmd_line + "'",
                               strerror(e));
        }
        if (now_ms() >= deadline) {
            timed_out = true;
            break;
        }
        poll(NULL, 0, 10);
    }

    close_fd(fds[0].fd);
    close_fd(fds[1].fd);

    if (timed_out) {
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        reap(pid, NULL);

        syslog(LOG_USER | LOG_ERR, "exec: '%s' timed out after %u ms",
               cmd_line.c_str(), timeout);
        ZvmException e(ZVM_ERR_TIMEOUT,
                       "Command '" + cmd_line + "' timed out after " +
                           ZVM::to_string(timeout) + " ms",
                       _trim_spaces(result.err));
        e.debug_data = result.out;
        throw e;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    } else {
        result.exit_code = -1;
    }

    if (result.exit_code != 0) {
        syslog(LOG_USER | LOG_NOTICE, "exec: '%s' exited with %d: %s",
               cmd_line.c_str(), result.exit_code,
               _trim_spaces(result.err).c_str());
        ZvmException e(ZVM_ERR_EXEC_FAILURE,
                       "Command '" + cmd_line + "' exited with " +
                           ZVM::to_string(result.exit_code),
                       _trim_spaces(result.err));
        e.exit_code = result.exit_code;
        e.debug_data = result.out;
        throw e;
    }

    return result;
}

} // namespace ZVM
