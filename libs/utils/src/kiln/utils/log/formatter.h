/*
 * SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */
#pragma once

#include "kiln/utils/error/error.h"

#include <fmt/format.h>

#include <filesystem>
#include <string_view>

template <>
struct fmt::formatter<kiln::utils::error::Error> : fmt::formatter<std::string_view>
{
    auto format(const kiln::utils::error::Error &error, fmt::format_context &ctx) const
      -> fmt::format_context::iterator;
};

template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string_view>
{
    auto format(const std::filesystem::path &path, fmt::format_context &ctx) const
      -> fmt::format_context::iterator;
};
