/*
 * SPDX-FileCopyrightText: 2022 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "kiln/utils/error/error.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace kiln::builder {

// Upper bound of command_timeout, one year in seconds.
constexpr int64_t maxCommandTimeout = 365LL * 24 * 60 * 60;

// Tool configuration shared by every build, read from config.yaml.
struct BuilderConfig
{
    int64_t version{ 1 };
    std::string buildTool{ "buildah" };
    std::string runTool{ "podman" };
    bool debug{ false };
    // seconds, 0 disables the deadline
    int64_t commandTimeout{ 0 };
};

void from_json(const nlohmann::json &json, BuilderConfig &config);
void to_json(nlohmann::json &json, const BuilderConfig &config);

auto loadConfig(const std::filesystem::path &file) noexcept -> utils::error::Result<BuilderConfig>;
auto loadConfig(const std::vector<std::filesystem::path> &files) noexcept
  -> utils::error::Result<BuilderConfig>;
auto saveConfig(const BuilderConfig &cfg, const std::filesystem::path &path) noexcept
  -> utils::error::Result<void>;

// $XDG_CONFIG_HOME/kiln/config.yaml, ~/.config/kiln/config.yaml, SYSCONFDIR/kiln/config.yaml
std::vector<std::filesystem::path> defaultConfigPaths();

} // namespace kiln::builder
