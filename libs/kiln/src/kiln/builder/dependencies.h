/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "kiln/builder/engine.h"
#include "kiln/utils/error/error.h"

namespace kiln::builder {

// Fail with ErrorCode::DependencyMissing naming the binary which cannot be found.
utils::error::Result<void> checkBuildToolExists(Engine &engine) noexcept;
utils::error::Result<void> checkRunToolExists(Engine &engine) noexcept;
utils::error::Result<void> checkDependencies(Engine &engine) noexcept;

} // namespace kiln::builder
