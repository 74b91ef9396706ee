/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "kiln/builder/build_runner.h"

#include "kiln/utils/log/log.h"

#include <fmt/format.h>

namespace kiln::builder {

namespace {

utils::error::Result<void>
pullBaseImage(BuildahBuilder &builder, const BuildOptions &options) noexcept
{
    KILN_TRACE("prepare base image");

    const auto &baseImage = builder.spec().baseImage;
    if (!options.forcePull) {
        if (!options.pullIfMissing) {
            return KILN_OK;
        }

        auto present = builder.isImagePresent(baseImage);
        if (!present) {
            return KILN_ERR(present);
        }

        if (*present) {
            LogD("base image {} is present", baseImage);
            return KILN_OK;
        }
    }

    auto ret = builder.pull();
    if (!ret) {
        return KILN_ERR(ret);
    }

    return KILN_OK;
}

} // namespace

utils::error::Result<std::string>
runBuild(BuildahBuilder &builder, Provisioner &provisioner, const BuildOptions &options) noexcept
{
    const auto &spec = builder.spec();
    KILN_TRACE(fmt::format("build {} from {}", spec.targetImage, spec.baseImage));

    LogI("Building {} from {}", spec.targetImage, spec.baseImage);

    auto checked = builder.checkDependencies();
    if (!checked) {
        return KILN_ERR(checked);
    }

    auto pulled = pullBaseImage(builder, options);
    if (!pulled) {
        return KILN_ERR(pulled);
    }

    auto interpreter = builder.findInterpreter();
    if (!interpreter) {
        return KILN_ERR(interpreter);
    }

    auto ret = builder.create(options.buildVolumes);
    if (!ret) {
        return KILN_ERR(ret);
    }

    ret = provisioner.provision(ProvisionContext{ *interpreter, builder.containerName(), spec });
    if (!ret) {
        LogE("provisioning failed, working container {} is kept for inspection",
             builder.containerName());
        return KILN_ERR(ret);
    }

    ret = builder.markProvisioned();
    if (!ret) {
        return KILN_ERR(ret);
    }

    auto imageId = builder.commit(spec.targetImage);
    if (!imageId) {
        return KILN_ERR(imageId);
    }

    if (options.keepContainer) {
        LogI("working container {} is kept", builder.containerName());
    } else {
        builder.clean();
    }

    LogI("Image {} built: {}", spec.targetImage, *imageId);
    return imageId;
}

} // namespace kiln::builder
