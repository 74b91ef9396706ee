/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "kiln/builder/dependencies.h"

#include <fmt/format.h>

namespace kiln::builder {

utils::error::Result<void> checkBuildToolExists(Engine &engine) noexcept
{
    KILN_TRACE("check build tool");

    if (!engine.buildToolExists()) {
        return KILN_ERR(fmt::format("{} command doesn't seem to be available on your system",
                                    engine.buildTool()),
                        utils::error::ErrorCode::DependencyMissing);
    }

    return KILN_OK;
}

utils::error::Result<void> checkRunToolExists(Engine &engine) noexcept
{
    KILN_TRACE("check run tool");

    if (!engine.runToolExists()) {
        return KILN_ERR(fmt::format("{} command doesn't seem to be available on your system",
                                    engine.runTool()),
                        utils::error::ErrorCode::DependencyMissing);
    }

    return KILN_OK;
}

utils::error::Result<void> checkDependencies(Engine &engine) noexcept
{
    KILN_TRACE("check dependencies");

    auto ret = checkBuildToolExists(engine);
    if (!ret) {
        return KILN_ERR(ret);
    }

    ret = checkRunToolExists(engine);
    if (!ret) {
        return KILN_ERR(ret);
    }

    return KILN_OK;
}

} // namespace kiln::builder
