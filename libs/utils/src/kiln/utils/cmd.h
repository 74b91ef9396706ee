/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "kiln/utils/error/error.h"

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace kiln::utils {

// Executes a command from the standard system PATH
// blocking until the child process exits, and the stdout of the child process is returned.
// A non-zero exit status is reported as ErrorCode::ExternalCommandFailed carrying
// the command line, the exit code and the captured stderr.
class Cmd
{
public:
    explicit Cmd(std::string command) noexcept;
    virtual ~Cmd();

    virtual bool exists() noexcept;
    virtual utils::error::Result<std::string>
    exec(const std::vector<std::string> &args = {}) noexcept;
    virtual Cmd &setEnv(const std::string &name, const std::string &value) noexcept;
    virtual Cmd &toStdin(std::string content) noexcept;

    // Forward stdout and stderr of the child to ours while it runs, they are still captured.
    Cmd &setStreamOutput(bool stream) noexcept;
    // Kill the child with SIGKILL once the timeout expires, zero means no timeout.
    Cmd &setTimeout(std::chrono::milliseconds timeout) noexcept;

    [[nodiscard]] const std::string &command() const noexcept { return m_command; }

private:
    std::filesystem::path getCommandPath();
    std::vector<std::string> buildEnvironment() const;

    std::string m_command;
    std::map<std::string, std::string> m_envs;
    std::string m_stdinContent;
    bool m_streamOutput{ false };
    std::chrono::milliseconds m_timeout{ 0 };
};

// Renders a command line for logs and error messages.
std::string commandLine(const std::string &command, const std::vector<std::string> &args);

} // namespace kiln::utils
