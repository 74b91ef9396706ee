/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "kiln/utils/error/error.h"

#include <nlohmann/json.hpp>

#include <string>

namespace kiln::utils::serialize {

template <typename T, typename Source>
error::Result<T> LoadJSON(const Source &content) noexcept
{
    KILN_TRACE("load json");

    try {
        auto json = nlohmann::json::parse(content);
        return json.template get<T>();
    } catch (const std::exception &e) {
        return KILN_ERR(e);
    }
}

} // namespace kiln::utils::serialize
