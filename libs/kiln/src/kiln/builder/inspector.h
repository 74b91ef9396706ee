/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "kiln/builder/engine.h"
#include "kiln/builder/metadata.h"
#include "kiln/utils/error/error.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kiln::builder {

enum class ResourceType : uint8_t {
    Image,
    Container,
};

std::string_view toString(ResourceType type) noexcept;

// Runs `buildah inspect -t <type> <id>`. A failing inspect means the resource
// does not exist and results in std::nullopt, output that is not a json object
// is an error.
auto inspectResource(Engine &engine, ResourceType type, const std::string &id) noexcept
  -> utils::error::Result<std::optional<ResourceMetadata>>;

// FromImageID of the image, std::nullopt when the image or the field is absent.
auto getImageId(Engine &engine, const std::string &imageReference) noexcept
  -> utils::error::Result<std::optional<std::string>>;

} // namespace kiln::builder
