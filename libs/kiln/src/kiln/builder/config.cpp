/*
 * SPDX-FileCopyrightText: 2022 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "kiln/builder/config.h"

#include "configure.h"
#include "kiln/utils/log/log.h"
#include "kiln/utils/serialize/yaml.h"

#include <fmt/format.h>

#include <cstdlib>
#include <fstream>

namespace kiln::builder {

void from_json(const nlohmann::json &json, BuilderConfig &config)
{
    config.version = json.at("version").get<int64_t>();
    config.buildTool = json.value("build_tool", std::string{ "buildah" });
    config.runTool = json.value("run_tool", std::string{ "podman" });
    config.debug = json.value("debug", false);
    config.commandTimeout = json.value("command_timeout", int64_t{ 0 });
}

void to_json(nlohmann::json &json, const BuilderConfig &config)
{
    json = nlohmann::json{
        { "version", config.version },
        { "build_tool", config.buildTool },
        { "run_tool", config.runTool },
        { "debug", config.debug },
        { "command_timeout", config.commandTimeout },
    };
}

auto loadConfig(const std::filesystem::path &file) noexcept -> utils::error::Result<BuilderConfig>
{
    KILN_TRACE(fmt::format("load build config from {}", file.string()));

    LogD("read build config file {}", file);
    auto config = utils::serialize::LoadYAMLFile<BuilderConfig>(file);
    if (!config) {
        return KILN_ERR("parse build config", config);
    }

    if (config->version != 1) {
        return KILN_ERR(fmt::format("wrong configuration file version {}", config->version));
    }

    if (config->buildTool.empty() || config->runTool.empty()) {
        return KILN_ERR("build_tool and run_tool must not be empty");
    }

    if (config->commandTimeout < 0 || config->commandTimeout > maxCommandTimeout) {
        return KILN_ERR(fmt::format("invalid command_timeout {}", config->commandTimeout));
    }

    return config;
}

auto loadConfig(const std::vector<std::filesystem::path> &files) noexcept
  -> utils::error::Result<BuilderConfig>
{
    KILN_TRACE("load build config");

    for (const auto &file : files) {
        auto config = loadConfig(file);
        if (!config) {
            LogD("Failed to load build config from {}: {}", file, config.error());
            continue;
        }

        LogD("Load build config from {}", file);
        return config;
    }

    return KILN_ERR("all failed");
}

auto saveConfig(const BuilderConfig &cfg, const std::filesystem::path &path) noexcept
  -> utils::error::Result<void>
{
    KILN_TRACE(fmt::format("save config to {}", path.string()));

    try {
        std::ofstream ofs(path);
        if (!ofs.is_open()) {
            return KILN_ERR("open failed");
        }

        auto node = ytj::to_yaml(nlohmann::json(cfg));
        ofs << node;

        return KILN_OK;
    } catch (const std::exception &e) {
        return KILN_ERR(e);
    }
}

std::vector<std::filesystem::path> defaultConfigPaths()
{
    std::vector<std::filesystem::path> paths;

    const char *xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome != nullptr && xdgConfigHome[0] != '\0') {
        paths.emplace_back(std::filesystem::path{ xdgConfigHome } / "kiln" / "config.yaml");
    }

    const char *home = std::getenv("HOME");
    if (home != nullptr && home[0] != '\0') {
        paths.emplace_back(std::filesystem::path{ home } / ".config" / "kiln" / "config.yaml");
    }

    paths.emplace_back(std::filesystem::path{ SYSCONFDIR } / "kiln" / "config.yaml");
    return paths;
}

} // namespace kiln::builder
