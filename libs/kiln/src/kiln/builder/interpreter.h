/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "kiln/builder/engine.h"
#include "kiln/utils/error/error.h"

#include <string>
#include <vector>

namespace kiln::builder {

// Probes the image with `podman run --rm <image> ls <path>` for every candidate
// in order and returns the first one that exists.
utils::error::Result<std::string> findInterpreter(Engine &engine,
                                                  const std::string &image,
                                                  const std::vector<std::string> &candidates) noexcept;

} // namespace kiln::builder
