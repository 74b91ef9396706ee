/*
 * SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "formatter.h"

auto fmt::formatter<kiln::utils::error::Error>::format(const kiln::utils::error::Error &error,
                                                       fmt::format_context &ctx) const
  -> fmt::format_context::iterator
{
    return formatter<std::string_view>::format(
      fmt::format("[code {}] {}", error.code(), error.message()),
      ctx);
}

auto fmt::formatter<std::filesystem::path>::format(const std::filesystem::path &path,
                                                   fmt::format_context &ctx) const
  -> fmt::format_context::iterator
{
    return formatter<std::string_view>::format(path.string(), ctx);
}
