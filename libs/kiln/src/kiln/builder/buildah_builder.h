/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "kiln/builder/build_spec.h"
#include "kiln/builder/engine.h"
#include "kiln/builder/metadata.h"
#include "kiln/utils/error/error.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiln::builder {

enum class ContainerState : uint8_t {
    Absent,
    Created,
    Configured,
    Provisioned,
    Committed,
};

std::string_view toString(ContainerState state) noexcept;

// Drives the working container of one build through
// create -> configure -> provision -> commit -> clean.
//
// The working container is named `<target image>-cont`, so two builders with
// the same target image must not run at the same time.
class BuildahBuilder
{
public:
    static auto New(BuildSpec spec, Engine &engine) noexcept
      -> utils::error::Result<std::unique_ptr<BuildahBuilder>>;

    BuildahBuilder(const BuildahBuilder &) = delete;
    BuildahBuilder &operator=(const BuildahBuilder &) = delete;
    ~BuildahBuilder() = default;

    [[nodiscard]] const BuildSpec &spec() const noexcept { return m_spec; }

    [[nodiscard]] const std::string &containerName() const noexcept { return m_containerName; }

    [[nodiscard]] ContainerState state() const noexcept { return m_state; }

    // `buildah from` the base image, then apply working dir, env, labels and
    // ports. The engine pulls the base image when it is not present.
    utils::error::Result<void> create(const std::vector<std::string> &buildVolumes = {}) noexcept;
    utils::error::Result<void> markProvisioned() noexcept;
    // Applies user, cmd and volumes, then commits and returns the image id.
    utils::error::Result<std::string> commit(const std::string &imageName) noexcept;
    // Removes the working container, failures are only logged.
    void clean() noexcept;
    // Bind mounts given to create() are not carried over.
    utils::error::Result<void> swapWorkingContainer() noexcept;
    utils::error::Result<void> pull() noexcept;
    // Both the build tool and the run tool must be installed.
    utils::error::Result<void> checkDependencies() noexcept;

    utils::error::Result<std::optional<std::string>>
    getImageId(const std::string &imageReference) noexcept;
    utils::error::Result<bool> isImagePresent(const std::string &imageReference) noexcept;
    utils::error::Result<std::optional<ResourceMetadata>> inspectContainer() noexcept;
    utils::error::Result<std::string> findInterpreter() noexcept;

private:
    BuildahBuilder(BuildSpec spec, Engine &engine);

    utils::error::Result<void> configure(const std::vector<std::string> &configArgs) noexcept;

    const BuildSpec m_spec;
    Engine &m_engine;
    std::string m_containerName;
    ContainerState m_state{ ContainerState::Absent };
};

} // namespace kiln::builder
