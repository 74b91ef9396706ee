/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "kiln/builder/buildah_builder.h"

#include "kiln/builder/dependencies.h"
#include "kiln/builder/inspector.h"
#include "kiln/builder/interpreter.h"
#include "kiln/utils/log/log.h"

#include <fmt/format.h>

namespace kiln::builder {

std::string_view toString(ContainerState state) noexcept
{
    switch (state) {
    case ContainerState::Absent:
        return "absent";
    case ContainerState::Created:
        return "created";
    case ContainerState::Configured:
        return "configured";
    case ContainerState::Provisioned:
        return "provisioned";
    case ContainerState::Committed:
        return "committed";
    }
    return "unknown";
}

auto BuildahBuilder::New(BuildSpec spec, Engine &engine) noexcept
  -> utils::error::Result<std::unique_ptr<BuildahBuilder>>
{
    KILN_TRACE("create buildah builder");

    auto ret = checkBuildToolExists(engine);
    if (!ret) {
        return KILN_ERR(ret);
    }

    return std::unique_ptr<BuildahBuilder>(new BuildahBuilder(std::move(spec), engine));
}

BuildahBuilder::BuildahBuilder(BuildSpec spec, Engine &engine)
    : m_spec(std::move(spec))
    , m_engine(engine)
    , m_containerName(m_spec.targetImage + "-cont")
{
}

utils::error::Result<void>
BuildahBuilder::configure(const std::vector<std::string> &configArgs) noexcept
{
    KILN_TRACE(fmt::format("configure {}", m_containerName));

    if (configArgs.empty()) {
        return KILN_OK;
    }

    auto args = configArgs;
    args.push_back(m_containerName);
    auto ret = m_engine.buildah("config", args);
    if (!ret) {
        return KILN_ERR(ret);
    }

    return KILN_OK;
}

utils::error::Result<void> BuildahBuilder::create(const std::vector<std::string> &buildVolumes) noexcept
{
    KILN_TRACE(fmt::format("create working container {}", m_containerName));

    if (m_state != ContainerState::Absent) {
        return KILN_ERR(fmt::format("working container is {}", toString(m_state)),
                        utils::error::ErrorCode::InvalidState);
    }

    std::vector<std::string> args;
    for (const auto &volume : buildVolumes) {
        args.emplace_back("-v");
        args.push_back(volume);
    }
    args.insert(args.end(), { "--name", m_containerName, m_spec.baseImage });

    auto ret = m_engine.buildah("from", args);
    if (!ret) {
        return KILN_ERR(ret);
    }
    m_state = ContainerState::Created;
    LogD("working container {} created from {}", m_containerName, m_spec.baseImage);

    // user, cmd and volumes are applied right before commit so that they
    // don't affect provisioning
    std::vector<std::string> configArgs;
    if (m_spec.workingDir) {
        configArgs.insert(configArgs.end(), { "--workingdir", *m_spec.workingDir });
    }
    for (const auto &[name, value] : m_spec.envVars) {
        configArgs.insert(configArgs.end(), { "-e", name + "=" + value });
    }
    for (const auto &[key, value] : m_spec.labels) {
        configArgs.insert(configArgs.end(), { "-l", key + "=" + value });
    }
    for (const auto &port : m_spec.ports) {
        configArgs.insert(configArgs.end(), { "-p", port });
    }

    auto configured = configure(configArgs);
    if (!configured) {
        return KILN_ERR(configured);
    }
    m_state = ContainerState::Configured;

    return KILN_OK;
}

utils::error::Result<void> BuildahBuilder::markProvisioned() noexcept
{
    KILN_TRACE("mark provisioned");

    if (m_state != ContainerState::Configured) {
        return KILN_ERR(fmt::format("working container is {}", toString(m_state)),
                        utils::error::ErrorCode::InvalidState);
    }

    m_state = ContainerState::Provisioned;
    return KILN_OK;
}

utils::error::Result<std::string> BuildahBuilder::commit(const std::string &imageName) noexcept
{
    KILN_TRACE(fmt::format("commit {} to {}", m_containerName, imageName));

    if (m_state != ContainerState::Provisioned && m_state != ContainerState::Configured) {
        return KILN_ERR(fmt::format("working container is {}", toString(m_state)),
                        utils::error::ErrorCode::InvalidState);
    }

    std::vector<std::string> configArgs;
    if (m_spec.user) {
        configArgs.insert(configArgs.end(), { "--user", *m_spec.user });
    }
    if (m_spec.cmd) {
        configArgs.insert(configArgs.end(), { "--cmd", *m_spec.cmd });
    }
    for (const auto &volume : m_spec.volumes) {
        configArgs.insert(configArgs.end(), { "-v", volume });
    }

    auto ret = configure(configArgs);
    if (!ret) {
        return KILN_ERR(ret);
    }

    auto output = m_engine.buildah("commit", { m_containerName, imageName }, true);
    if (!output) {
        return KILN_ERR(output);
    }
    m_state = ContainerState::Committed;

    auto imageId = getImageId(imageName);
    if (!imageId) {
        return KILN_ERR(imageId);
    }

    if (!*imageId) {
        return KILN_ERR(fmt::format("image {} not found after commit", imageName),
                        utils::error::ErrorCode::ImageNotFound);
    }

    LogI("committed {} as {}", imageName, **imageId);
    return **imageId;
}

void BuildahBuilder::clean() noexcept
{
    // also removes a container left behind by an earlier build of the same target
    auto ret = m_engine.buildah("rm", { m_containerName }, false, false);
    if (!ret) {
        if (m_state == ContainerState::Absent) {
            LogD("no working container {} to clean: {}", m_containerName, ret.error());
        } else {
            LogW("failed to remove working container {}: {}", m_containerName, ret.error());
        }
    }

    m_state = ContainerState::Absent;
}

utils::error::Result<void> BuildahBuilder::swapWorkingContainer() noexcept
{
    KILN_TRACE("swap working container");

    clean();
    auto ret = create();
    if (!ret) {
        return KILN_ERR(ret);
    }

    return KILN_OK;
}

utils::error::Result<void> BuildahBuilder::pull() noexcept
{
    KILN_TRACE(fmt::format("pull {}", m_spec.baseImage));

    LogI("pulling base image: {}", m_spec.baseImage);
    auto ret = checkRunToolExists(m_engine);
    if (!ret) {
        return KILN_ERR(ret);
    }

    auto output = m_engine.podman("pull", { m_spec.baseImage });
    if (!output) {
        return KILN_ERR(output);
    }

    return KILN_OK;
}

utils::error::Result<void> BuildahBuilder::checkDependencies() noexcept
{
    return builder::checkDependencies(m_engine);
}

utils::error::Result<std::optional<std::string>>
BuildahBuilder::getImageId(const std::string &imageReference) noexcept
{
    return builder::getImageId(m_engine, imageReference);
}

utils::error::Result<bool> BuildahBuilder::isImagePresent(const std::string &imageReference) noexcept
{
    KILN_TRACE(fmt::format("check image {}", imageReference));

    auto imageId = getImageId(imageReference);
    if (!imageId) {
        return KILN_ERR(imageId);
    }

    return imageId->has_value();
}

utils::error::Result<std::optional<ResourceMetadata>> BuildahBuilder::inspectContainer() noexcept
{
    return inspectResource(m_engine, ResourceType::Container, m_containerName);
}

utils::error::Result<std::string> BuildahBuilder::findInterpreter() noexcept
{
    return builder::findInterpreter(m_engine, m_spec.baseImage, m_spec.interpreters);
}

} // namespace kiln::builder
