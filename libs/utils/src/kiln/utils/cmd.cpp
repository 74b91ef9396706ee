/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "cmd.h"

#include "configure.h"
#include "kiln/common/error.h"
#include "kiln/common/strings.h"
#include "kiln/utils/log/log.h"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <gsl/util>
#include <sys/epoll.h>

#include <algorithm>
#include <array>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <limits>
#include <optional>
#include <thread>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace kiln::utils {

namespace {

using Clock = std::chrono::steady_clock;

void closeFd(int &fd) noexcept
{
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool setNonBlock(int fd) noexcept
{
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags != -1) {
        return fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
    }
    return false;
}

// epoll_wait timeout in milliseconds, -1 waits forever
int remainingMs(const std::optional<Clock::time_point> &deadline) noexcept
{
    if (!deadline) {
        return -1;
    }

    auto left =
      std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now()).count();
    if (left <= 0) {
        return 0;
    }
    // longer waits are split into several epoll_wait calls
    return static_cast<int>(std::min<decltype(left)>(left, std::numeric_limits<int>::max()));
}

} // namespace

std::string commandLine(const std::string &command, const std::vector<std::string> &args)
{
    std::vector<std::string> parts;
    parts.reserve(args.size() + 1);
    parts.push_back(common::strings::quoteShellArg(command));
    for (const auto &arg : args) {
        parts.push_back(common::strings::quoteShellArg(arg));
    }
    return common::strings::join(parts, ' ');
}

Cmd::Cmd(std::string command) noexcept
    : m_command(std::move(command))
{
}

Cmd::~Cmd() = default;

bool Cmd::exists() noexcept
{
    return !getCommandPath().empty();
}

std::filesystem::path Cmd::getCommandPath()
{
    std::error_code ec;
    auto isExecutable = [&ec](const std::filesystem::path &path) {
        return std::filesystem::exists(path, ec) && std::filesystem::is_regular_file(path, ec)
          && ::access(path.c_str(), X_OK) == 0;
    };

    // absolute or relative path given explicitly
    if (m_command.find('/') != std::string::npos) {
        std::filesystem::path path{ m_command };
        if (isExecutable(path)) {
            return std::filesystem::absolute(path, ec);
        }
        return {};
    }

    // Search in PATH environment variable
    std::vector<std::string> pathDirs;
    const char *pathEnv = std::getenv("PATH");
    if (pathEnv && pathEnv[0] != '\0') {
        pathDirs = common::strings::split(pathEnv, ':', common::strings::splitOption::SkipEmpty);
    } else {
        pathDirs = { "/usr/local/bin", "/usr/bin", "/bin" };
    }
    pathDirs.emplace_back(BINDIR);

    for (const auto &pathDir : pathDirs) {
        std::filesystem::path fullPath = std::filesystem::path{ pathDir } / m_command;
        if (isExecutable(fullPath)) {
            return fullPath;
        }
    }

    return {};
}

std::vector<std::string> Cmd::buildEnvironment() const
{
    std::vector<std::string> envStrings;
    for (char **env = environ; *env != nullptr; ++env) {
        envStrings.emplace_back(*env);
    }

    auto matches = [](const std::string &env, const std::string &name) {
        return env.size() > name.size() && env.compare(0, name.size(), name) == 0
          && env[name.size()] == '=';
    };

    for (const auto &[name, value] : m_envs) {
        // an empty value unsets the variable
        if (value.empty()) {
            envStrings.erase(std::remove_if(envStrings.begin(),
                                            envStrings.end(),
                                            [&name, &matches](const std::string &env) {
                                                return matches(env, name);
                                            }),
                             envStrings.end());
            continue;
        }

        std::string envVar = name + "=" + value;
        auto it = std::find_if(envStrings.begin(), envStrings.end(), [&](const std::string &env) {
            return matches(env, name);
        });
        if (it != envStrings.end()) {
            *it = std::move(envVar);
        } else {
            envStrings.push_back(std::move(envVar));
        }
    }

    return envStrings;
}

utils::error::Result<std::string> Cmd::exec(const std::vector<std::string> &args) noexcept
{
    KILN_TRACE(fmt::format("exec cmd: {} args: {}", m_command, fmt::join(args, " ")));

    auto commandPath = getCommandPath();
    if (commandPath.empty()) {
        return KILN_ERR(fmt::format("command not found: {}", m_command),
                        utils::error::ErrorCode::DependencyMissing);
    }

    const auto cmdline = commandLine(m_command, args);

    std::array<int, 2> stdoutPipe{ -1, -1 };
    std::array<int, 2> stderrPipe{ -1, -1 };
    std::array<int, 2> stdinPipe{ -1, -1 };
    auto pipesCloser = gsl::finally([&stdoutPipe, &stderrPipe, &stdinPipe]() {
        for (auto *fds : { &stdoutPipe, &stderrPipe, &stdinPipe }) {
            closeFd((*fds)[0]);
            closeFd((*fds)[1]);
        }
    });

    for (auto *fds : { &stdoutPipe, &stderrPipe, &stdinPipe }) {
        if (::pipe2(fds->data(), O_CLOEXEC) == -1) {
            return KILN_ERR(fmt::format("pipe error: {}", common::error::errorString(errno)));
        }
    }

    // everything the child needs is allocated before fork
    auto envStrings = buildEnvironment();
    std::vector<char *> envp;
    envp.reserve(envStrings.size() + 1);
    for (auto &env : envStrings) {
        envp.push_back(const_cast<char *>(env.c_str()));
    }
    envp.push_back(nullptr);

    auto filename = commandPath.filename().string();
    std::vector<char *> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char *>(filename.c_str()));
    for (const auto &arg : args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    LogD("execute {} with args [{}]", commandPath, fmt::join(args, ", "));

    std::optional<Clock::time_point> deadline;
    if (m_timeout.count() > 0) {
        deadline = Clock::now() + m_timeout;
    }

    pid_t pid = fork();
    if (pid == -1) {
        return KILN_ERR(fmt::format("fork error: {}", common::error::errorString(errno)));
    }

    // child process
    if (pid == 0) {
        if (dup2(stdoutPipe[1], STDOUT_FILENO) == -1 || dup2(stderrPipe[1], STDERR_FILENO) == -1
            || dup2(stdinPipe[0], STDIN_FILENO) == -1) {
            _exit(127);
        }

        execve(commandPath.c_str(), argv.data(), envp.data());

        dprintf(STDERR_FILENO, "execve %s failed: %s\n", commandPath.c_str(), strerror(errno));
        _exit(127);
    }

    // parent process
    bool reaped = false;
    auto childReaper = gsl::finally([&reaped, pid]() {
        if (!reaped) {
            ::kill(pid, SIGKILL);
            ::waitpid(pid, nullptr, 0);
        }
    });

    closeFd(stdoutPipe[1]);
    closeFd(stderrPipe[1]);
    closeFd(stdinPipe[0]);

    if (!setNonBlock(stdoutPipe[0]) || !setNonBlock(stderrPipe[0]) || !setNonBlock(stdinPipe[1])) {
        return KILN_ERR(
          fmt::format("set non block error: {}", common::error::errorString(errno)));
    }

    int epfd = epoll_create1(EPOLL_CLOEXEC);
    if (epfd == -1) {
        return KILN_ERR(
          fmt::format("epoll_create error: {}", common::error::errorString(errno)));
    }
    auto epfdCloser = gsl::finally([epfd]() {
        ::close(epfd);
    });

    struct epoll_event ev{};
    int activeFds = 0;

    for (int fd : { stdoutPipe[0], stderrPipe[0] }) {
        ev.events = EPOLLIN;
        ev.data.fd = fd;
        if (epoll_ctl(epfd, EPOLL_CTL_ADD, fd, &ev) == -1) {
            return KILN_ERR(
              fmt::format("epoll_ctl output error: {}", common::error::errorString(errno)));
        }
        activeFds++;
    }

    // a child that exits without reading its stdin must not kill us with SIGPIPE
    struct sigaction ignorePipe{};
    struct sigaction previousPipe{};
    ignorePipe.sa_handler = SIG_IGN;
    sigemptyset(&ignorePipe.sa_mask);
    bool pipeIgnored = false;
    if (!m_stdinContent.empty()) {
        pipeIgnored = sigaction(SIGPIPE, &ignorePipe, &previousPipe) == 0;
    }
    auto pipeRestorer = gsl::finally([&pipeIgnored, &previousPipe]() {
        if (pipeIgnored) {
            sigaction(SIGPIPE, &previousPipe, nullptr);
        }
    });

    size_t writtenBytes = 0;
    if (!m_stdinContent.empty()) {
        ev.events = EPOLLOUT;
        ev.data.fd = stdinPipe[1];
        if (epoll_ctl(epfd, EPOLL_CTL_ADD, stdinPipe[1], &ev) == -1) {
            return KILN_ERR(
              fmt::format("epoll_ctl stdin error: {}", common::error::errorString(errno)));
        }
        activeFds++;
    } else {
        // If no input, close write end immediately to send EOF to child
        closeFd(stdinPipe[1]);
    }

    std::string output;
    std::string errorOutput;
    std::vector<char> buffer(4096);

    // returns true once the descriptor reached EOF or failed
    auto drain = [this, &buffer](int fd, std::string &sink, FILE *echo) {
        while (true) {
            ssize_t n = ::read(fd, buffer.data(), buffer.size());
            if (n > 0) {
                sink.append(buffer.data(), static_cast<size_t>(n));
                if (m_streamOutput) {
                    std::fwrite(buffer.data(), 1, static_cast<size_t>(n), echo);
                    std::fflush(echo);
                }
                continue;
            }

            if (n == -1 && errno == EINTR) {
                continue;
            }

            return !(n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK));
        }
    };

    auto killOnTimeout = [&]() {
        ::kill(pid, SIGKILL);
        ::waitpid(pid, nullptr, 0);
        reaped = true;
        return KILN_ERR(fmt::format("{} timed out after {} ms", cmdline, m_timeout.count()),
                        utils::error::ErrorCode::ExternalCommandFailed);
    };

    constexpr int maxEvents = 3;
    std::array<struct epoll_event, maxEvents> events{};

    while (activeFds > 0) {
        int nfds = epoll_wait(epfd, events.data(), maxEvents, remainingMs(deadline));
        if (nfds == -1) {
            if (errno == EINTR) {
                continue;
            }
            return KILN_ERR(
              fmt::format("epoll_wait error: {}", common::error::errorString(errno)));
        }

        if (nfds == 0) {
            if (deadline && Clock::now() >= *deadline) {
                return killOnTimeout();
            }
            continue;
        }

        for (int i = 0; i < nfds; ++i) {
            int fd = events[i].data.fd;
            if (fd == stdoutPipe[0] || fd == stderrPipe[0]) {
                auto isStdout = fd == stdoutPipe[0];
                if (drain(fd, isStdout ? output : errorOutput, isStdout ? stdout : stderr)) {
                    epoll_ctl(epfd, EPOLL_CTL_DEL, fd, nullptr);
                    activeFds--;
                }
                continue;
            }

            if (fd != stdinPipe[1]) {
                continue;
            }

            bool finished = false;
            if (writtenBytes < m_stdinContent.size()) {
                ssize_t n = write(fd,
                                  m_stdinContent.data() + writtenBytes,
                                  m_stdinContent.size() - writtenBytes);
                if (n > 0) {
                    writtenBytes += n;
                } else if (n == -1 && errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
                    finished = true;
                }
            }

            if (finished || writtenBytes >= m_stdinContent.size()) {
                epoll_ctl(epfd, EPOLL_CTL_DEL, fd, nullptr);
                closeFd(stdinPipe[1]);
                activeFds--;
            }
        }
    }

    int status = 0;
    while (true) {
        pid_t ret = ::waitpid(pid, &status, deadline ? WNOHANG : 0);
        if (ret == pid) {
            reaped = true;
            break;
        }

        if (ret == -1) {
            if (errno == EINTR) {
                continue;
            }
            return KILN_ERR(fmt::format("waitpid error: {}", common::error::errorString(errno)));
        }

        if (Clock::now() >= *deadline) {
            return killOnTimeout();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    if (WIFEXITED(status)) {
        int exitCode = WEXITSTATUS(status);
        if (exitCode == 0) {
            return output;
        }

        auto detail = common::strings::trim(errorOutput.empty() ? output : errorOutput, " \t\n");
        return KILN_ERR(fmt::format("{} exited with code {}: {}", cmdline, exitCode, detail),
                        utils::error::ErrorCode::ExternalCommandFailed);
    }

    if (WIFSIGNALED(status)) {
        return KILN_ERR(fmt::format("{} killed by signal {}", cmdline, WTERMSIG(status)),
                        utils::error::ErrorCode::ExternalCommandFailed);
    }

    return KILN_ERR(fmt::format("{} exited abnormally", cmdline),
                    utils::error::ErrorCode::ExternalCommandFailed);
}

Cmd &Cmd::setEnv(const std::string &name, const std::string &value) noexcept
{
    // Store the environment variable (empty value means unset)
    m_envs[name] = value;
    return *this;
}

Cmd &Cmd::toStdin(std::string content) noexcept
{
    m_stdinContent = std::move(content);
    return *this;
}

Cmd &Cmd::setStreamOutput(bool stream) noexcept
{
    m_streamOutput = stream;
    return *this;
}

Cmd &Cmd::setTimeout(std::chrono::milliseconds timeout) noexcept
{
    m_timeout = timeout;
    return *this;
}

} // namespace kiln::utils
