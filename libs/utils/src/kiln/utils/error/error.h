/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "kiln/utils/error/details/error_impl.h"

#include <tl/expected.hpp>

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace kiln::utils::error {

enum class ErrorCode : int {
    Failed = -1, // generic failure
    Success = 0,
    Unknown = 1000,

    /* host environment */
    DependencyMissing = 1001, // a required external binary cannot be resolved

    /* external engine */
    ExternalCommandFailed = 2001, // non-zero exit, killed by signal or timed out
    ImageNotFound = 2002,         // image could not be resolved to an identifier

    /* lifecycle */
    InvalidState = 3001,
    NoInterpreterFound = 3002,

    /* build specification */
    InvalidBuildSpec = 4001,
};

class Error
{
public:
    Error() = default;

    Error(const Error &) = delete;
    Error(Error &&) = default;
    Error &operator=(const Error &) = delete;
    Error &operator=(Error &&) = default;

    [[nodiscard]] auto code() const { return pImpl->code(); };

    [[nodiscard]] auto message() const { return pImpl->message(); }

    static auto Err(const char *file,
                    int line,
                    const std::string &trace_msg,
                    const std::string &msg,
                    const ErrorCode &code) -> Error
    {
        return Error(std::make_unique<details::ErrorImpl>(file,
                                                          line,
                                                          static_cast<int>(code),
                                                          trace_msg,
                                                          msg,
                                                          nullptr));
    }

    static auto Err(const char *file,
                    int line,
                    const std::string &trace_msg,
                    const std::string &msg,
                    int code = -1) -> Error
    {
        return Error(
          std::make_unique<details::ErrorImpl>(file, line, code, trace_msg, msg, nullptr));
    }

    static auto Err(const char *file,
                    int line,
                    const std::string &trace_msg,
                    std::exception_ptr err,
                    int code = -1) -> Error
    {
        std::string what;
        try {
            std::rethrow_exception(std::move(err));
        } catch (const std::exception &e) {
            what = e.what();
        } catch (...) {
            what = "unknown";
        }

        return Error(
          std::make_unique<details::ErrorImpl>(file, line, code, trace_msg, what, nullptr));
    }

    static auto Err(const char *file,
                    int line,
                    const std::string &trace_msg,
                    const std::string &msg,
                    std::exception_ptr err,
                    int code = -1) -> Error
    {
        std::string what = msg + ": ";
        try {
            std::rethrow_exception(std::move(err));
        } catch (const std::exception &e) {
            what += e.what();
        } catch (...) {
            what += "unknown";
        }

        return Error(
          std::make_unique<details::ErrorImpl>(file, line, code, trace_msg, what, nullptr));
    }

    static auto Err(const char *file,
                    int line,
                    const std::string &trace_msg,
                    const std::exception &e) -> Error
    {
        return Error(
          std::make_unique<details::ErrorImpl>(file, line, -1, trace_msg, e.what(), nullptr));
    }

    static auto Err(const char *file,
                    int line,
                    const std::string &trace_msg,
                    const std::string &msg,
                    const std::exception &e,
                    int code = -1) -> Error
    {
        return Error(std::make_unique<details::ErrorImpl>(file,
                                                          line,
                                                          code,
                                                          trace_msg,
                                                          msg + ": " + e.what(),
                                                          nullptr));
    }

    static auto Err(const char *file,
                    int line,
                    const std::string &trace_msg,
                    const std::string &msg,
                    const std::system_error &e) -> Error
    {
        return Err(file, line, trace_msg, msg, e, e.code().value());
    }

    template <typename Value>
    static auto Err(const char *file,
                    int line,
                    const std::string &trace_msg,
                    const std::string &msg,
                    tl::expected<Value, Error> &&cause) -> Error
    {
        return Error(std::make_unique<details::ErrorImpl>(file,
                                                          line,
                                                          cause.error().code(),
                                                          trace_msg,
                                                          msg,
                                                          std::move(cause.error().pImpl)));
    }

    template <typename Value>
    static auto Err(const char *file,
                    int line,
                    const std::string &trace_msg,
                    tl::expected<Value, Error> &&cause) -> Error
    {
        return Error(std::make_unique<details::ErrorImpl>(file,
                                                          line,
                                                          cause.error().code(),
                                                          trace_msg,
                                                          std::nullopt,
                                                          std::move(cause.error().pImpl)));
    }

    static auto Err(const char *file,
                    int line,
                    const std::string &trace_msg,
                    const std::string &msg,
                    Error &&cause) -> Error
    {
        return Error(std::make_unique<details::ErrorImpl>(file,
                                                          line,
                                                          cause.code(),
                                                          trace_msg,
                                                          msg,
                                                          std::move(cause.pImpl)));
    }

    static auto Err(const char *file, int line, const std::string &trace_msg, Error &&cause)
      -> Error
    {
        return Error(std::make_unique<details::ErrorImpl>(file,
                                                          line,
                                                          cause.code(),
                                                          trace_msg,
                                                          std::nullopt,
                                                          std::move(cause.pImpl)));
    }

private:
    explicit Error(std::unique_ptr<details::ErrorImpl> pImpl)
        : pImpl(std::move(pImpl))
    {
    }

    std::unique_ptr<details::ErrorImpl> pImpl;
};

template <typename Value>
using Result = tl::expected<Value, Error>;

} // namespace kiln::utils::error

// Use this macro to define trace message at the begining of function
#define KILN_TRACE(message) const std::string kiln_trace_message{ message };

// Use this macro to create new error or wrap an existing error
// KILN_ERR(message, code = -1)
// KILN_ERR(message, /* ErrorCode */)
// KILN_ERR(message, /* std::exception_ptr */, code = -1)
// KILN_ERR(/* std::exception_ptr */)
// KILN_ERR(message, /* const std::exception & */, code = -1)
// KILN_ERR(/* const std::exception & */)
// KILN_ERR(message, /* const std::system_error & */)
// KILN_ERR(message, /* Result<Value>&& */)
// KILN_ERR(/* Result<Value>&& */)
// KILN_ERR(message, /* Error&& */)
// KILN_ERR(/* Error&& */)

#define KILN_ERR_GETMACRO(_1, _2, _3, NAME, ...) /*NOLINT*/ NAME
#define KILN_ERR(...) /*NOLINT*/ \
    KILN_ERR_GETMACRO(__VA_ARGS__, KILN_ERR_3, KILN_ERR_2, KILN_ERR_1, ...)(__VA_ARGS__)

// std::move is used for Result<Value>
#define KILN_ERR_1(_1) /*NOLINT*/                                         \
    tl::unexpected(::kiln::utils::error::Error::Err(__FILE__,             \
                                                    __LINE__,             \
                                                    kiln_trace_message,   \
                                                    std::move((_1)) /*NOLINT*/))

// std::move is used for Result<Value>
#define KILN_ERR_2(_1, _2) /*NOLINT*/                                     \
    tl::unexpected(::kiln::utils::error::Error::Err(__FILE__,             \
                                                    __LINE__,             \
                                                    kiln_trace_message,   \
                                                    (_1),                 \
                                                    std::move((_2)) /*NOLINT*/))

#define KILN_ERR_3(_1, _2, _3) /*NOLINT*/                                 \
    tl::unexpected(::kiln::utils::error::Error::Err(__FILE__,             \
                                                    __LINE__,             \
                                                    kiln_trace_message,   \
                                                    (_1),                 \
                                                    (_2),                 \
                                                    (_3)))

#define KILN_OK \
    {           \
    }
