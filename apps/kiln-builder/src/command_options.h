// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "kiln/builder/build_runner.h"

#include <string>
#include <vector>

struct GlobalOptions
{
    std::string configFile;
    bool debug = false;
};

struct BuildCommandOptions
{
    std::string specFile;
    std::string playbook;
    std::vector<std::string> playbookArgs;
    kiln::builder::BuildOptions builderSpecificOptions;
};

struct ImageIdCommandOptions
{
    std::string imageReference;
};

struct PullCommandOptions
{
    std::string specFile;
};

struct InterpreterCommandOptions
{
    std::string specFile;
};
