// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "kiln/builder/build_runner.h"
#include "kiln/common/strings.h"
#include "kiln/mocks/fake_engine.h"
#include "kiln/mocks/provisioner_mock.h"

using namespace kiln::builder;
using kiln::common::strings::contains;
using kiln::test::FakeEngine;
using kiln::test::MockProvisioner;
using kiln::utils::error::ErrorCode;
using kiln::utils::error::Result;
using ::testing::_;
using ::testing::AllOf;
using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::IsEmpty;

namespace {

class BuildRunnerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        spec.baseImage = "fedora:39";
        spec.targetImage = "myapp:latest";
        spec.user = "app";
    }

    std::unique_ptr<BuildahBuilder> newBuilder()
    {
        auto builder = BuildahBuilder::New(spec, engine);
        if (!builder) {
            ADD_FAILURE() << builder.error().message();
            return nullptr;
        }
        return std::move(*builder);
    }

    void expectProvisionSucceeds()
    {
        EXPECT_CALL(provisioner, provision(_)).WillOnce([](const ProvisionContext &) {
            return Result<void>{};
        });
    }

    FakeEngine engine;
    MockProvisioner provisioner;
    BuildSpec spec;
};

TEST_F(BuildRunnerTest, Build)
{
    engine.addImage("fedora:39", { "/usr/bin/python3" });
    auto builder = newBuilder();

    EXPECT_CALL(provisioner,
                provision(AllOf(Field(&ProvisionContext::interpreter, "/usr/bin/python3"),
                                Field(&ProvisionContext::containerName, "myapp:latest-cont"))))
      .WillOnce([this](const ProvisionContext &context) -> Result<void> {
          // provisioning runs against a configured working container
          EXPECT_EQ(engine.containers.count(context.containerName), 1U);
          EXPECT_EQ(context.spec.targetImage, "myapp:latest");
          return {};
      });

    auto imageId = runBuild(*builder, provisioner, BuildOptions{});
    ASSERT_TRUE(imageId) << imageId.error().message();

    auto lookedUp = builder->getImageId("myapp:latest");
    ASSERT_TRUE(lookedUp) << lookedUp.error().message();
    EXPECT_EQ(*lookedUp, *imageId);

    EXPECT_EQ(engine.images.at("myapp:latest").config["User"], "app");
    EXPECT_THAT(engine.containers, IsEmpty());
    EXPECT_EQ(builder->state(), ContainerState::Absent);
    // the base image is present
    EXPECT_THAT(engine.callsOf("podman", "pull"), IsEmpty());
}

TEST_F(BuildRunnerTest, PullsMissingBaseImage)
{
    engine.addRemoteImage("fedora:39", { "/usr/bin/python3" });
    auto builder = newBuilder();
    expectProvisionSucceeds();

    auto imageId = runBuild(*builder, provisioner, BuildOptions{});
    ASSERT_TRUE(imageId) << imageId.error().message();
    EXPECT_THAT(engine.callsOf("podman", "pull"),
                ElementsAre(ElementsAre("podman", "pull", "fedora:39")));
}

TEST_F(BuildRunnerTest, ForcePull)
{
    engine.addImage("fedora:39", { "/usr/bin/python3" });
    auto builder = newBuilder();
    expectProvisionSucceeds();

    BuildOptions options;
    options.forcePull = true;
    ASSERT_TRUE(runBuild(*builder, provisioner, options));
    EXPECT_EQ(engine.callsOf("podman", "pull").size(), 1U);
}

TEST_F(BuildRunnerTest, NoPullWhenDisabled)
{
    engine.addRemoteImage("fedora:39", { "/usr/bin/python3" });
    auto builder = newBuilder();
    EXPECT_CALL(provisioner, provision(_)).Times(0);

    BuildOptions options;
    options.pullIfMissing = false;
    auto imageId = runBuild(*builder, provisioner, options);
    ASSERT_FALSE(imageId.has_value());
    EXPECT_EQ(imageId.error().code(), int(ErrorCode::NoInterpreterFound));
    EXPECT_THAT(engine.callsOf("podman", "pull"), IsEmpty());
    EXPECT_THAT(engine.callsOf("buildah", "from"), IsEmpty());
}

TEST_F(BuildRunnerTest, BuildVolumes)
{
    engine.addImage("fedora:39", { "/usr/bin/python3" });
    auto builder = newBuilder();
    expectProvisionSucceeds();

    BuildOptions options;
    options.buildVolumes = { "/home/user/src:/src:Z" };
    ASSERT_TRUE(runBuild(*builder, provisioner, options));

    auto froms = engine.callsOf("buildah", "from");
    ASSERT_EQ(froms.size(), 1U);
    EXPECT_EQ(froms[0][2], "-v");
    EXPECT_EQ(froms[0][3], "/home/user/src:/src:Z");
}

TEST_F(BuildRunnerTest, ProvisionFailureKeepsContainer)
{
    engine.addImage("fedora:39", { "/usr/bin/python3" });
    auto builder = newBuilder();

    EXPECT_CALL(provisioner, provision(_)).WillOnce([](const ProvisionContext &) -> Result<void> {
        KILN_TRACE("provision");
        return KILN_ERR("ansible-playbook exited with code 2: task failed",
                        ErrorCode::ExternalCommandFailed);
    });

    auto imageId = runBuild(*builder, provisioner, BuildOptions{});
    ASSERT_FALSE(imageId.has_value());
    EXPECT_EQ(imageId.error().code(), int(ErrorCode::ExternalCommandFailed));
    EXPECT_TRUE(contains(imageId.error().message(), "task failed")) << imageId.error().message();

    EXPECT_EQ(builder->state(), ContainerState::Configured);
    EXPECT_EQ(engine.containers.count("myapp:latest-cont"), 1U);
    EXPECT_THAT(engine.callsOf("buildah", "commit"), IsEmpty());
    EXPECT_EQ(engine.images.count("myapp:latest"), 0U);
}

TEST_F(BuildRunnerTest, KeepContainer)
{
    engine.addImage("fedora:39", { "/usr/bin/python3" });
    auto builder = newBuilder();
    expectProvisionSucceeds();

    BuildOptions options;
    options.keepContainer = true;
    ASSERT_TRUE(runBuild(*builder, provisioner, options));
    EXPECT_EQ(builder->state(), ContainerState::Committed);
    EXPECT_EQ(engine.containers.count("myapp:latest-cont"), 1U);
    EXPECT_THAT(engine.callsOf("buildah", "rm"), IsEmpty());
}

TEST_F(BuildRunnerTest, MissingRunTool)
{
    engine.addImage("fedora:39", { "/usr/bin/python3" });
    auto builder = newBuilder();
    engine.runToolPresent = false;
    EXPECT_CALL(provisioner, provision(_)).Times(0);

    auto imageId = runBuild(*builder, provisioner, BuildOptions{});
    ASSERT_FALSE(imageId.has_value());
    EXPECT_EQ(imageId.error().code(), int(ErrorCode::DependencyMissing));
    EXPECT_TRUE(engine.calls.empty());
}

} // namespace
