// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "kiln/builder/provisioner.h"
#include "kiln/common/strings.h"

#include <memory>

using namespace kiln::builder;
using kiln::common::strings::contains;
using kiln::utils::error::ErrorCode;
using ::testing::ElementsAre;

namespace {

// Runs the given tool in place of ansible-playbook.
class PlaybookProvisionerWithTool : public PlaybookProvisioner
{
public:
    PlaybookProvisionerWithTool(std::string tool,
                                std::filesystem::path playbook,
                                std::vector<std::string> extraArgs = {})
        : PlaybookProvisioner(std::move(playbook), std::move(extraArgs))
        , tool(std::move(tool))
    {
    }

protected:
    std::unique_ptr<kiln::utils::Cmd> makeCmd() const override
    {
        return std::make_unique<kiln::utils::Cmd>(tool);
    }

private:
    std::string tool;
};

class PlaybookProvisionerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        spec.baseImage = "fedora:39";
        spec.targetImage = "myapp:latest";
    }

    ProvisionContext context() const
    {
        return ProvisionContext{ "/usr/bin/python3", "myapp:latest-cont", spec };
    }

    BuildSpec spec;
};

TEST_F(PlaybookProvisionerTest, Arguments)
{
    PlaybookProvisioner provisioner("site.yaml");
    EXPECT_THAT(provisioner.arguments(context()),
                ElementsAre("-c",
                            "buildah",
                            "-i",
                            "myapp:latest-cont,",
                            "-e",
                            "ansible_python_interpreter=/usr/bin/python3",
                            "site.yaml"));
}

TEST_F(PlaybookProvisionerTest, ExtraArguments)
{
    PlaybookProvisioner provisioner("site.yaml", { "-vv", "--tags", "install" });
    auto args = provisioner.arguments(context());
    ASSERT_EQ(args.size(), 10U);
    EXPECT_EQ(args[6], "-vv");
    EXPECT_EQ(args[8], "install");
    EXPECT_EQ(args.back(), "site.yaml");
}

TEST_F(PlaybookProvisionerTest, Provision)
{
    PlaybookProvisionerWithTool provisioner("true", "site.yaml");
    auto ret = provisioner.provision(context());
    EXPECT_TRUE(ret.has_value()) << ret.error().message();
}

TEST_F(PlaybookProvisionerTest, ProvisionFailure)
{
    PlaybookProvisionerWithTool provisioner("false", "site.yaml");
    auto ret = provisioner.provision(context());
    ASSERT_FALSE(ret.has_value());
    EXPECT_EQ(ret.error().code(), int(ErrorCode::ExternalCommandFailed));
}

TEST_F(PlaybookProvisionerTest, MissingPlaybookTool)
{
    PlaybookProvisionerWithTool provisioner("kiln-missing-ansible-playbook", "site.yaml");
    auto ret = provisioner.provision(context());
    ASSERT_FALSE(ret.has_value());
    EXPECT_EQ(ret.error().code(), int(ErrorCode::DependencyMissing));
    EXPECT_TRUE(contains(ret.error().message(), "kiln-missing-ansible-playbook"))
      << ret.error().message();
}

} // namespace
