/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "kiln/utils/global/initialize.h"

#include "kiln/common/strings.h"

#include <cstdlib>
#include <string>
#include <vector>

#include <unistd.h>

namespace kiln::utils::global {

using namespace kiln::common;
using kiln::utils::log::LogBackend;
using kiln::utils::log::LogLevel;

namespace {

LogLevel parseLogLevel(const char *level)
{
    if (strings::stringEqual(level, "debug")) {
        return LogLevel::Debug;
    }

    if (strings::stringEqual(level, "info")) {
        return LogLevel::Info;
    }

    if (strings::stringEqual(level, "warning")) {
        return LogLevel::Warning;
    }

    if (strings::stringEqual(level, "error")) {
        return LogLevel::Error;
    }

    if (strings::stringEqual(level, "fatal")) {
        return LogLevel::Fatal;
    }

    return LogLevel::Info;
}

LogBackend parseLogBackend(const char *backends)
{
    LogBackend logBackend = LogBackend::None;

    const std::vector<std::string> backendsList =
      strings::split(backends, ',', strings::splitOption::TrimWhitespace);
    for (const auto &backend : backendsList) {
        if (strings::stringEqual(backend, "console")) {
            logBackend = logBackend | LogBackend::Console;
        } else if (strings::stringEqual(backend, "journal")) {
            logBackend = logBackend | LogBackend::Journal;
        }
    }

    return logBackend;
}

} // namespace

void initKilnLogSystem(LogBackend backend)
{
    LogLevel logLevel = LogLevel::Info;
    LogBackend logBackend = LogBackend::None;

    const char *logLevelEnv = getenv("KILN_LOG_LEVEL");
    if (logLevelEnv) {
        logLevel = parseLogLevel(logLevelEnv);
    }

    const char *logBackendEnv = getenv("KILN_LOG_BACKEND");
    if (logBackendEnv) {
        logBackend = parseLogBackend(logBackendEnv);
    } else {
        logBackend = backend;

        if (isatty(STDERR_FILENO)) {
            logBackend = logBackend | LogBackend::Console;
        }
    }

    log::setLogLevel(logLevel);
    log::setLogBackend(logBackend);
}

} // namespace kiln::utils::global
