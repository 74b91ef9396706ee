/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "kiln/builder/inspector.h"

#include "kiln/utils/log/log.h"
#include "kiln/utils/serialize/json.h"

#include <fmt/format.h>

namespace kiln::builder {

std::string_view toString(ResourceType type) noexcept
{
    switch (type) {
    case ResourceType::Image:
        return "image";
    case ResourceType::Container:
        return "container";
    }
    return "unknown";
}

auto inspectResource(Engine &engine, ResourceType type, const std::string &id) noexcept
  -> utils::error::Result<std::optional<ResourceMetadata>>
{
    KILN_TRACE(fmt::format("inspect {} {}", toString(type), id));

    auto output = engine.buildah("inspect", { "-t", std::string{ toString(type) }, id }, false, false);
    if (!output) {
        if (output.error().code()
            != static_cast<int>(utils::error::ErrorCode::ExternalCommandFailed)) {
            return KILN_ERR(std::move(output));
        }

        LogI("no such {} {}", toString(type), id);
        return std::nullopt;
    }

    auto document = utils::serialize::LoadJSON<nlohmann::json>(*output);
    if (!document) {
        return KILN_ERR("parse inspect output", document);
    }

    if (!document->is_object()) {
        return KILN_ERR(fmt::format("unexpected inspect output: {}", document->dump()));
    }

    return ResourceMetadata{ std::move(*document) };
}

auto getImageId(Engine &engine, const std::string &imageReference) noexcept
  -> utils::error::Result<std::optional<std::string>>
{
    KILN_TRACE(fmt::format("get image id of {}", imageReference));

    auto metadata = inspectResource(engine, ResourceType::Image, imageReference);
    if (!metadata) {
        return KILN_ERR(std::move(metadata));
    }

    if (!*metadata) {
        return std::nullopt;
    }

    auto imageId = (*metadata)->get<std::string>("FromImageID");
    if (imageId && imageId->empty()) {
        return std::nullopt;
    }
    return imageId;
}

} // namespace kiln::builder
