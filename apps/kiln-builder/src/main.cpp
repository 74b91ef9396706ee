/*
 * SPDX-FileCopyrightText: 2022 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "command_options.h"
#include "configure.h"
#include "kiln/builder/build_runner.h"
#include "kiln/builder/build_spec.h"
#include "kiln/builder/buildah_builder.h"
#include "kiln/builder/config.h"
#include "kiln/builder/engine.h"
#include "kiln/builder/inspector.h"
#include "kiln/builder/provisioner.h"
#include "kiln/utils/error/error.h"
#include "kiln/utils/global/initialize.h"
#include "kiln/utils/log/log.h"

#include <CLI/CLI.hpp>
#include <fmt/format.h>

#include <filesystem>
#include <memory>
#include <string>

namespace {

using kiln::builder::BuildahBuilder;
using kiln::builder::Engine;

kiln::utils::error::Result<kiln::builder::BuilderConfig> loadBuilderConfig(const GlobalOptions &opts)
{
    if (!opts.configFile.empty()) {
        return kiln::builder::loadConfig(std::filesystem::path{ opts.configFile });
    }

    auto config = kiln::builder::loadConfig(kiln::builder::defaultConfigPaths());
    if (!config) {
        LogD("no usable config file, using defaults: {}", config.error());
        return kiln::builder::BuilderConfig{};
    }
    return config;
}

kiln::utils::error::Result<std::unique_ptr<BuildahBuilder>> makeBuilder(const std::string &specFile,
                                                                       Engine &engine)
{
    KILN_TRACE("prepare builder");

    auto spec = kiln::builder::loadBuildSpec(specFile);
    if (!spec) {
        return KILN_ERR(spec);
    }

    return BuildahBuilder::New(std::move(*spec), engine);
}

int handleBuild(Engine &engine, const BuildCommandOptions &options)
{
    auto builder = makeBuilder(options.specFile, engine);
    if (!builder) {
        LogE("{}", builder.error());
        return -1;
    }

    kiln::builder::PlaybookProvisioner provisioner(options.playbook, options.playbookArgs);
    auto imageId =
      kiln::builder::runBuild(**builder, provisioner, options.builderSpecificOptions);
    if (!imageId) {
        LogE("{}", imageId.error());
        return -1;
    }

    fmt::print("{}\n", *imageId);
    return 0;
}

int handleImageId(Engine &engine, const ImageIdCommandOptions &options)
{
    auto imageId = kiln::builder::getImageId(engine, options.imageReference);
    if (!imageId) {
        LogE("{}", imageId.error());
        return -1;
    }

    if (!*imageId) {
        LogE("image {} not found", options.imageReference);
        return 1;
    }

    fmt::print("{}\n", **imageId);
    return 0;
}

int handlePull(Engine &engine, const PullCommandOptions &options)
{
    auto builder = makeBuilder(options.specFile, engine);
    if (!builder) {
        LogE("{}", builder.error());
        return -1;
    }

    auto ret = (*builder)->pull();
    if (!ret) {
        LogE("{}", ret.error());
        return -1;
    }

    return 0;
}

int handleInterpreter(Engine &engine, const InterpreterCommandOptions &options)
{
    auto builder = makeBuilder(options.specFile, engine);
    if (!builder) {
        LogE("{}", builder.error());
        return -1;
    }

    auto interpreter = (*builder)->findInterpreter();
    if (!interpreter) {
        LogE("{}", interpreter.error());
        return -1;
    }

    fmt::print("{}\n", *interpreter);
    return 0;
}

} // namespace

int main(int argc, char **argv)
{
    // builder prints logs in non-tty environments as well
    kiln::utils::global::initKilnLogSystem(kiln::utils::log::LogBackend::Console);

    CLI::App commandParser{ "kiln builder CLI \n"
                            "Build container images with buildah and an ansible playbook\n" };
    commandParser.get_help_ptr()->description("Print this help message and exit");
    commandParser.set_help_all_flag("--help-all", "Expand all help");
    commandParser.usage("Usage: kiln-builder [OPTIONS] [SUBCOMMAND]");
    commandParser.require_subcommand(0, 1);

    GlobalOptions globalOpts;
    BuildCommandOptions buildOpts;
    ImageIdCommandOptions imageIdOpts;
    PullCommandOptions pullOpts;
    InterpreterCommandOptions interpreterOpts;

    bool versionFlag = false;
    commandParser.add_flag("--version", versionFlag, "Show version");
    commandParser.add_option("-c, --config", globalOpts.configFile, "Builder config file")
      ->type_name("FILE")
      ->check(CLI::ExistingFile);
    commandParser.add_flag("--debug", globalOpts.debug, "Run the build tool with debug output");

    auto *buildCmd = commandParser.add_subcommand("build", "Build the target image");
    buildCmd->usage("Usage: kiln-builder build [OPTIONS] SPEC PLAYBOOK");
    buildCmd->add_option("SPEC", buildOpts.specFile, "Build spec file")
      ->required()
      ->check(CLI::ExistingFile);
    buildCmd->add_option("PLAYBOOK", buildOpts.playbook, "Playbook to provision the container")
      ->required()
      ->check(CLI::ExistingFile);
    buildCmd
      ->add_option("-v, --volume",
                   buildOpts.builderSpecificOptions.buildVolumes,
                   "Bind mount for the working container, host:container[:options]")
      ->type_name("SPEC");
    buildCmd->add_option("--playbook-arg",
                         buildOpts.playbookArgs,
                         "Extra argument passed to ansible-playbook");
    buildCmd->add_flag("--pull",
                       buildOpts.builderSpecificOptions.forcePull,
                       "Pull the base image before building");
    buildCmd->add_flag("!--no-pull-missing",
                       buildOpts.builderSpecificOptions.pullIfMissing,
                       "Don't pull the base image when it is missing");
    buildCmd->add_flag("--keep-container",
                       buildOpts.builderSpecificOptions.keepContainer,
                       "Keep the working container after commit");

    auto *imageIdCmd = commandParser.add_subcommand("image-id", "Show the id of an image");
    imageIdCmd->add_option("IMAGE", imageIdOpts.imageReference, "Image reference")->required();

    auto *pullCmd = commandParser.add_subcommand("pull", "Pull the base image of a build spec");
    pullCmd->add_option("SPEC", pullOpts.specFile, "Build spec file")
      ->required()
      ->check(CLI::ExistingFile);

    auto *interpreterCmd =
      commandParser.add_subcommand("interpreter", "Find the interpreter in the base image");
    interpreterCmd->add_option("SPEC", interpreterOpts.specFile, "Build spec file")
      ->required()
      ->check(CLI::ExistingFile);

    CLI11_PARSE(commandParser, argc, argv);

    if (versionFlag) {
        fmt::print("kiln builder version {}\n", KILN_VERSION);
        return 0;
    }

    auto builderCfg = loadBuilderConfig(globalOpts);
    if (!builderCfg) {
        LogE("{}", builderCfg.error());
        return -1;
    }
    if (globalOpts.debug) {
        builderCfg->debug = true;
    }

    Engine engine(*builderCfg);

    if (buildCmd->parsed()) {
        return handleBuild(engine, buildOpts);
    }

    if (imageIdCmd->parsed()) {
        return handleImageId(engine, imageIdOpts);
    }

    if (pullCmd->parsed()) {
        return handlePull(engine, pullOpts);
    }

    if (interpreterCmd->parsed()) {
        return handleInterpreter(engine, interpreterOpts);
    }

    fmt::print("{}\n", commandParser.help());
    return 0;
}
