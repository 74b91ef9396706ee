/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "kiln/builder/config.h"
#include "kiln/utils/cmd.h"
#include "kiln/utils/error/error.h"

#include <memory>
#include <string>
#include <vector>

namespace kiln::builder {

// Invokes the external build tool (buildah) and run tool (podman).
// Every interaction with the container engine goes through this class.
class Engine
{
public:
    Engine() = default;
    explicit Engine(BuilderConfig config);
    Engine(const Engine &) = delete;
    Engine &operator=(const Engine &) = delete;
    virtual ~Engine() = default;

    // Runs `<buildTool> [--log-level=debug] <subcommand> <args...>`.
    // printOutput streams the output of long running steps to the terminal.
    virtual utils::error::Result<std::string> buildah(const std::string &subcommand,
                                                      const std::vector<std::string> &args,
                                                      bool printOutput = false,
                                                      bool logStderr = true);
    // Runs `<runTool> <subcommand> <args...>`.
    virtual utils::error::Result<std::string>
    podman(const std::string &subcommand, const std::vector<std::string> &args, bool logStderr = true);

    virtual bool buildToolExists();
    virtual bool runToolExists();

    [[nodiscard]] const std::string &buildTool() const noexcept { return config.buildTool; }

    [[nodiscard]] const std::string &runTool() const noexcept { return config.runTool; }

    [[nodiscard]] bool debug() const noexcept { return config.debug; }

protected:
    virtual std::unique_ptr<utils::Cmd> makeCmd(const std::string &tool) const;

private:
    utils::error::Result<std::string> run(const std::string &tool,
                                          const std::vector<std::string> &args,
                                          bool printOutput,
                                          bool logStderr);

    BuilderConfig config;
};

} // namespace kiln::builder
