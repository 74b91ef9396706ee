/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "kiln/builder/build_spec.h"
#include "kiln/utils/cmd.h"
#include "kiln/utils/error/error.h"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace kiln::builder {

struct ProvisionContext
{
    std::string interpreter;
    std::string containerName;
    const BuildSpec &spec;
};

// Runs the provisioning steps against the working container.
class Provisioner
{
public:
    virtual ~Provisioner() = default;
    virtual utils::error::Result<void> provision(const ProvisionContext &context) noexcept = 0;
};

// Applies an ansible playbook through the buildah connection plugin.
class PlaybookProvisioner : public Provisioner
{
public:
    explicit PlaybookProvisioner(std::filesystem::path playbook,
                                 std::vector<std::string> extraArgs = {});

    utils::error::Result<void> provision(const ProvisionContext &context) noexcept override;

    [[nodiscard]] std::vector<std::string> arguments(const ProvisionContext &context) const;

protected:
    virtual std::unique_ptr<utils::Cmd> makeCmd() const;

private:
    std::filesystem::path playbook;
    std::vector<std::string> extraArgs;
};

} // namespace kiln::builder
