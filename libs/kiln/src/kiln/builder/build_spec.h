/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "kiln/utils/error/error.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kiln::builder {

// Interpreters probed in the base image when the build file lists none.
const std::vector<std::string> &defaultInterpreters() noexcept;

// What to build: the base image, the target image and the metadata the
// target carries.
struct BuildSpec
{
    std::string baseImage;
    std::string targetImage;
    std::optional<std::string> workingDir;
    std::map<std::string, std::string> envVars;
    std::map<std::string, std::string> labels;
    std::vector<std::string> ports;
    std::vector<std::string> volumes;
    std::optional<std::string> cmd;
    std::optional<std::string> user;
    std::vector<std::string> interpreters{ defaultInterpreters() };
};

void from_json(const nlohmann::json &json, BuildSpec &spec);
void to_json(nlohmann::json &json, const BuildSpec &spec);

// Rejects empty image references, empty env or label names and relative
// volume or interpreter paths with ErrorCode::InvalidBuildSpec.
utils::error::Result<void> validate(const BuildSpec &spec) noexcept;

utils::error::Result<BuildSpec> loadBuildSpec(const std::filesystem::path &path) noexcept;

} // namespace kiln::builder
