/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "kiln/builder/metadata.h"

namespace kiln::builder {

namespace {

// ExposedPorts and Volumes are stored as objects with empty values
std::vector<std::string> keysOf(const std::optional<nlohmann::json> &object)
{
    std::vector<std::string> keys;
    if (!object || !object->is_object()) {
        return keys;
    }

    for (const auto &item : object->items()) {
        keys.push_back(item.key());
    }
    return keys;
}

} // namespace

ResourceMetadata::ResourceMetadata(nlohmann::json document)
    : document(std::move(document))
{
}

ImageConfig ResourceMetadata::config() const noexcept
{
    ImageConfig config;
    config.user = get<std::string>("OCIv1", "config", "User");
    config.workingDir = get<std::string>("OCIv1", "config", "WorkingDir");
    config.env = get<std::vector<std::string>>("OCIv1", "config", "Env").value_or(config.env);
    config.cmd = get<std::vector<std::string>>("OCIv1", "config", "Cmd").value_or(config.cmd);
    config.labels = get<std::map<std::string, std::string>>("OCIv1", "config", "Labels")
                      .value_or(config.labels);
    config.exposedPorts = keysOf(get<nlohmann::json>("OCIv1", "config", "ExposedPorts"));
    config.volumes = keysOf(get<nlohmann::json>("OCIv1", "config", "Volumes"));

    // an empty string is how the engine reports an unset field
    if (config.user && config.user->empty()) {
        config.user.reset();
    }
    if (config.workingDir && config.workingDir->empty()) {
        config.workingDir.reset();
    }

    return config;
}

} // namespace kiln::builder
