/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "kiln/builder/engine.h"

#include "kiln/utils/log/log.h"

#include <fmt/format.h>

#include <chrono>

namespace kiln::builder {

Engine::Engine(BuilderConfig config)
    : config(std::move(config))
{
}

std::unique_ptr<utils::Cmd> Engine::makeCmd(const std::string &tool) const
{
    auto cmd = std::make_unique<utils::Cmd>(tool);
    if (config.commandTimeout > 0) {
        cmd->setTimeout(std::chrono::seconds(config.commandTimeout));
    }
    return cmd;
}

utils::error::Result<std::string> Engine::buildah(const std::string &subcommand,
                                                  const std::vector<std::string> &args,
                                                  bool printOutput,
                                                  bool logStderr)
{
    std::vector<std::string> fullArgs;
    fullArgs.reserve(args.size() + 2);
    if (config.debug) {
        fullArgs.emplace_back("--log-level=debug");
    }
    fullArgs.push_back(subcommand);
    fullArgs.insert(fullArgs.end(), args.begin(), args.end());

    LogD("running command: {} {}", config.buildTool, subcommand);
    return run(config.buildTool, fullArgs, printOutput, logStderr);
}

utils::error::Result<std::string> Engine::podman(const std::string &subcommand,
                                                 const std::vector<std::string> &args,
                                                 bool logStderr)
{
    std::vector<std::string> fullArgs;
    fullArgs.reserve(args.size() + 1);
    fullArgs.push_back(subcommand);
    fullArgs.insert(fullArgs.end(), args.begin(), args.end());

    LogD("running command: {} {}", config.runTool, subcommand);
    return run(config.runTool, fullArgs, false, logStderr);
}

utils::error::Result<std::string> Engine::run(const std::string &tool,
                                              const std::vector<std::string> &args,
                                              bool printOutput,
                                              bool logStderr)
{
    KILN_TRACE(fmt::format("run {}", tool));

    auto cmd = makeCmd(tool);
    cmd->setStreamOutput(printOutput);
    auto output = cmd->exec(args);
    if (!output) {
        if (logStderr) {
            LogE("{}", output.error().message());
        } else {
            LogD("{}", output.error().message());
        }
        return KILN_ERR(std::move(output));
    }

    return output;
}

bool Engine::buildToolExists()
{
    return makeCmd(config.buildTool)->exists();
}

bool Engine::runToolExists()
{
    return makeCmd(config.runTool)->exists();
}

} // namespace kiln::builder
