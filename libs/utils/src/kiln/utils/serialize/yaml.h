/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "kiln/utils/error/error.h"
#include "ytj/ytj.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <exception>
#include <filesystem>
#include <fstream>
#include <string>

namespace kiln::utils::serialize {

// YAML documents are converted to json first, so every type with a
// from_json overload can be loaded from YAML as well.
template <typename T, typename Source>
error::Result<T> LoadYAML(Source &content) noexcept
{
    KILN_TRACE("load yaml");
    try {
        YAML::Node node = YAML::Load(content);
        nlohmann::json json = ytj::to_json(node);
        return json.template get<T>();
    } catch (...) {
        return KILN_ERR(std::current_exception());
    }
}

template <typename T>
error::Result<T> LoadYAMLFile(const std::filesystem::path &filename) noexcept
{
    KILN_TRACE("load yaml from " + filename.string());

    std::ifstream fileStream(filename);
    if (!fileStream.is_open()) {
        return KILN_ERR("failed to open file");
    }

    return LoadYAML<T>(fileStream);
}

} // namespace kiln::utils::serialize
