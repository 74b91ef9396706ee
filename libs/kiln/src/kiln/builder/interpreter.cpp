/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "kiln/builder/interpreter.h"

#include "kiln/utils/log/log.h"

#include <fmt/format.h>

namespace kiln::builder {

utils::error::Result<std::string> findInterpreter(Engine &engine,
                                                  const std::string &image,
                                                  const std::vector<std::string> &candidates) noexcept
{
    KILN_TRACE(fmt::format("find interpreter in {}", image));

    for (const auto &candidate : candidates) {
        auto ret = engine.podman("run", { "--rm", image, "ls", candidate }, false);
        if (!ret) {
            if (ret.error().code()
                != static_cast<int>(utils::error::ErrorCode::ExternalCommandFailed)) {
                return KILN_ERR(std::move(ret));
            }

            LogI("interpreter {} does not exist", candidate);
            continue;
        }

        LogI("using interpreter {}", candidate);
        return candidate;
    }

    return KILN_ERR(fmt::format("no interpreter found in image {}", image),
                    utils::error::ErrorCode::NoInterpreterFound);
}

} // namespace kiln::builder
