/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include <nlohmann/json.hpp>

#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiln::builder {

// The OCI runtime config of an image or working container (OCIv1.config).
struct ImageConfig
{
    std::optional<std::string> user;
    std::optional<std::string> workingDir;
    std::vector<std::string> env;
    std::vector<std::string> cmd;
    std::map<std::string, std::string> labels;
    std::vector<std::string> exposedPorts;
    std::vector<std::string> volumes;
};

// Parsed output of `buildah inspect`.
class ResourceMetadata
{
public:
    explicit ResourceMetadata(nlohmann::json document);

    // Walks the nested keys and converts the value found there. A missing key,
    // a non object on the path or a value of another type yields std::nullopt.
    template <typename T, typename... Keys>
    [[nodiscard]] std::optional<T> get(const Keys &...keys) const noexcept
    {
        const std::array<std::string_view, sizeof...(Keys)> path{ keys... };
        const nlohmann::json *node = &document;
        for (const auto &key : path) {
            if (!node->is_object()) {
                return std::nullopt;
            }

            auto it = node->find(std::string{ key });
            if (it == node->end()) {
                return std::nullopt;
            }
            node = &*it;
        }

        try {
            return node->template get<T>();
        } catch (const nlohmann::json::exception &) {
            return std::nullopt;
        }
    }

    [[nodiscard]] ImageConfig config() const noexcept;

    [[nodiscard]] const nlohmann::json &json() const noexcept { return document; }

private:
    nlohmann::json document;
};

} // namespace kiln::builder
