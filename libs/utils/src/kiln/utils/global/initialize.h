/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "kiln/utils/log/log.h"

namespace kiln::utils::global {

// KILN_LOG_LEVEL and KILN_LOG_BACKEND override the defaults, the console
// backend is always added when stderr is a tty.
void initKilnLogSystem(log::LogBackend backend);

} // namespace kiln::utils::global
