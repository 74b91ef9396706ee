/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "kiln/builder/buildah_builder.h"
#include "kiln/builder/provisioner.h"
#include "kiln/utils/error/error.h"

#include <string>
#include <vector>

namespace kiln::builder {

struct BuildOptions
{
    // bind mounts for the working container, host:container[:options]
    std::vector<std::string> buildVolumes;
    bool forcePull{ false };
    bool pullIfMissing{ true };
    bool keepContainer{ false };
};

// Runs a whole build and returns the id of the committed target image.
// When provisioning fails the working container is kept for inspection.
utils::error::Result<std::string>
runBuild(BuildahBuilder &builder, Provisioner &provisioner, const BuildOptions &options) noexcept;

} // namespace kiln::builder
