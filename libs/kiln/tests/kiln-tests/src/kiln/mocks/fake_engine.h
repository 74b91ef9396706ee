// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "kiln/builder/engine.h"
#include "kiln/mocks/engine_mock.h"
#include "kiln/utils/error/error.h"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace kiln::test {

// In-memory stand-in for buildah and podman. It keeps images and working
// containers with their OCI config and records every invocation.
class FakeEngine : public builder::Engine
{
public:
    struct Image
    {
        std::string id;
        nlohmann::json config = nlohmann::json::object();
        std::set<std::string> files;
    };

    struct Container
    {
        std::string image;
        nlohmann::json config = nlohmann::json::object();
        std::vector<std::string> mounts;
    };

    using Invocation = std::vector<std::string>;

    bool buildToolPresent = true;
    bool runToolPresent = true;
    // local image storage, keyed by reference
    std::map<std::string, Image> images;
    // images podman pull and buildah from can fetch
    std::map<std::string, Image> registry;
    std::map<std::string, Container> containers;
    // subcommand -> stderr of a failing invocation
    std::map<std::string, std::string> failures;
    // tool, subcommand and arguments of every invocation
    std::vector<Invocation> calls;

    Image &addImage(const std::string &reference, std::set<std::string> files = {})
    {
        return images[reference] = Image{ nextId(), nlohmann::json::object(), std::move(files) };
    }

    Image &addRemoteImage(const std::string &reference, std::set<std::string> files = {})
    {
        return registry[reference] = Image{ nextId(), nlohmann::json::object(), std::move(files) };
    }

    std::vector<Invocation> callsOf(const std::string &tool, const std::string &subcommand) const
    {
        std::vector<Invocation> result;
        std::copy_if(calls.begin(),
                     calls.end(),
                     std::back_inserter(result),
                     [&](const Invocation &call) {
                         return call[0] == tool && call[1] == subcommand;
                     });
        return result;
    }

    utils::error::Result<std::string> buildah(const std::string &subcommand,
                                              const std::vector<std::string> &args,
                                              [[maybe_unused]] bool printOutput,
                                              [[maybe_unused]] bool logStderr) override
    {
        record("buildah", subcommand, args);
        if (!buildToolPresent) {
            return commandNotFound(buildTool());
        }

        if (auto failure = failures.find(subcommand); failure != failures.end()) {
            return commandFailed("buildah " + subcommand, failure->second);
        }

        if (subcommand == "from") {
            return from(args);
        }
        if (subcommand == "config") {
            return config(args);
        }
        if (subcommand == "commit") {
            return commit(args);
        }
        if (subcommand == "rm") {
            return rm(args);
        }
        if (subcommand == "inspect") {
            return inspect(args);
        }

        return commandFailed("buildah " + subcommand, "unknown command");
    }

    utils::error::Result<std::string> podman(const std::string &subcommand,
                                             const std::vector<std::string> &args,
                                             [[maybe_unused]] bool logStderr) override
    {
        record("podman", subcommand, args);
        if (!runToolPresent) {
            return commandNotFound(runTool());
        }

        if (auto failure = failures.find("podman " + subcommand); failure != failures.end()) {
            return commandFailed("podman " + subcommand, failure->second);
        }

        if (subcommand == "pull") {
            if (!pullImage(args.at(0))) {
                return commandFailed("podman pull", "Error: initializing source: manifest unknown");
            }
            return fmt::format("{}\n", images.at(args.at(0)).id);
        }

        if (subcommand == "run") {
            // run --rm <image> ls <path>
            auto image = images.find(args.at(1));
            if (image == images.end()) {
                return commandFailed("podman run", "Error: image not known");
            }

            const auto &path = args.back();
            if (image->second.files.count(path) == 0) {
                return commandFailed("podman run",
                                     fmt::format("ls: cannot access '{}': No such file or directory",
                                                 path),
                                     2);
            }
            return path + "\n";
        }

        return commandFailed("podman " + subcommand, "unknown command");
    }

    bool buildToolExists() override { return buildToolPresent; }

    bool runToolExists() override { return runToolPresent; }

private:
    std::string nextId() { return fmt::format("{:064x}", ++idCounter); }

    void record(const std::string &tool,
                const std::string &subcommand,
                const std::vector<std::string> &args)
    {
        Invocation call{ tool, subcommand };
        call.insert(call.end(), args.begin(), args.end());
        calls.push_back(std::move(call));
    }

    bool pullImage(const std::string &reference)
    {
        if (images.count(reference) != 0) {
            return true;
        }

        auto remote = registry.find(reference);
        if (remote == registry.end()) {
            return false;
        }
        images[reference] = remote->second;
        return true;
    }

    utils::error::Result<std::string> from(const std::vector<std::string> &args)
    {
        Container container;
        std::string name;
        size_t i = 0;
        for (; i + 1 < args.size(); i += 2) {
            if (args[i] == "-v") {
                container.mounts.push_back(args[i + 1]);
            } else if (args[i] == "--name") {
                name = args[i + 1];
            } else {
                return commandFailed("buildah from", "unknown flag: " + args[i]);
            }
        }
        if (i + 1 != args.size() || name.empty()) {
            return commandFailed("buildah from", "invalid arguments");
        }

        const auto &base = args.back();
        if (containers.count(name) != 0) {
            return commandFailed(
              "buildah from",
              fmt::format("Error: the container name \"{}\" is already in use", name));
        }
        if (!pullImage(base)) {
            return commandFailed("buildah from",
                                 fmt::format("Error: {}: image not known", base));
        }

        container.image = base;
        container.config = images.at(base).config;
        containers[name] = std::move(container);
        return name + "\n";
    }

    utils::error::Result<std::string> config(const std::vector<std::string> &args)
    {
        if (args.size() % 2 != 1) {
            return commandFailed("buildah config", "invalid arguments");
        }

        auto container = containers.find(args.back());
        if (container == containers.end()) {
            return commandFailed("buildah config",
                                 fmt::format("Error: {}: container not known", args.back()));
        }

        auto &config = container->second.config;
        for (size_t i = 0; i + 1 < args.size(); i += 2) {
            const auto &flag = args[i];
            const auto &value = args[i + 1];
            if (flag == "--workingdir") {
                config["WorkingDir"] = value;
            } else if (flag == "-e") {
                config["Env"].push_back(value);
            } else if (flag == "-l") {
                auto pos = value.find('=');
                config["Labels"][value.substr(0, pos)] = value.substr(pos + 1);
            } else if (flag == "-p") {
                config["ExposedPorts"][value] = nlohmann::json::object();
            } else if (flag == "--user") {
                config["User"] = value;
            } else if (flag == "--cmd") {
                config["Cmd"] = nlohmann::json::array({ value });
            } else if (flag == "-v") {
                config["Volumes"][value] = nlohmann::json::object();
            } else {
                return commandFailed("buildah config", "unknown flag: " + flag);
            }
        }
        return std::string{};
    }

    utils::error::Result<std::string> commit(const std::vector<std::string> &args)
    {
        auto container = containers.find(args.at(0));
        if (container == containers.end()) {
            return commandFailed("buildah commit",
                                 fmt::format("Error: {}: container not known", args.at(0)));
        }

        auto &image = images[args.at(1)];
        image.id = nextId();
        image.config = container->second.config;
        image.files = images[container->second.image].files;
        return image.id + "\n";
    }

    utils::error::Result<std::string> rm(const std::vector<std::string> &args)
    {
        if (containers.erase(args.at(0)) == 0) {
            return commandFailed("buildah rm",
                                 fmt::format("Error: {}: container not known", args.at(0)));
        }
        return args.at(0) + "\n";
    }

    utils::error::Result<std::string> inspect(const std::vector<std::string> &args)
    {
        // inspect -t <type> <id>
        const auto &type = args.at(1);
        const auto &id = args.at(2);
        if (type == "container") {
            auto container = containers.find(id);
            if (container == containers.end()) {
                return commandFailed("buildah inspect",
                                     fmt::format("Error: {}: container not known", id));
            }

            nlohmann::json document{
                { "Type", "buildah 0.0.1" },
                { "Container", id },
                { "FromImage", container->second.image },
                { "FromImageID", images[container->second.image].id },
                { "OCIv1", { { "config", container->second.config } } },
            };
            return document.dump();
        }

        auto image = std::find_if(images.begin(), images.end(), [&id](const auto &item) {
            return item.first == id || item.second.id == id;
        });
        if (image == images.end()) {
            return commandFailed("buildah inspect", fmt::format("Error: {}: image not known", id));
        }

        nlohmann::json document{
            { "Type", "buildah 0.0.1" },
            { "FromImage", image->first },
            { "FromImageID", image->second.id },
            { "OCIv1", { { "config", image->second.config } } },
        };
        return document.dump();
    }

    uint64_t idCounter{ 0 };
};

} // namespace kiln::test
