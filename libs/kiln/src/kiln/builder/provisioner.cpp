/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "kiln/builder/provisioner.h"

#include "kiln/utils/log/log.h"

#include <fmt/format.h>

namespace kiln::builder {

PlaybookProvisioner::PlaybookProvisioner(std::filesystem::path playbook,
                                         std::vector<std::string> extraArgs)
    : playbook(std::move(playbook))
    , extraArgs(std::move(extraArgs))
{
}

std::unique_ptr<utils::Cmd> PlaybookProvisioner::makeCmd() const
{
    return std::make_unique<utils::Cmd>("ansible-playbook");
}

std::vector<std::string> PlaybookProvisioner::arguments(const ProvisionContext &context) const
{
    // the trailing comma makes ansible treat the inventory as a host list
    std::vector<std::string> args{
        "-c",
        "buildah",
        "-i",
        context.containerName + ",",
        "-e",
        "ansible_python_interpreter=" + context.interpreter,
    };
    args.insert(args.end(), extraArgs.begin(), extraArgs.end());
    args.push_back(playbook.string());
    return args;
}

utils::error::Result<void> PlaybookProvisioner::provision(const ProvisionContext &context) noexcept
{
    KILN_TRACE(fmt::format("run playbook {} in {}", playbook.string(), context.containerName));

    auto cmd = makeCmd();
    if (!cmd->exists()) {
        return KILN_ERR(fmt::format("{} command doesn't seem to be available on your system",
                                    cmd->command()),
                        utils::error::ErrorCode::DependencyMissing);
    }

    LogI("provisioning {} with {}", context.containerName, playbook);
    cmd->setStreamOutput(true);
    auto ret = cmd->exec(arguments(context));
    if (!ret) {
        return KILN_ERR(ret);
    }

    return KILN_OK;
}

} // namespace kiln::builder
