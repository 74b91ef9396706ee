/*
 * SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "kiln/common/strings.h"

#include <algorithm>
#include <cctype>

namespace kiln::common::strings {

bool stringEqual(std::string_view str1, std::string_view str2, bool caseSensitive) noexcept
{
    if (caseSensitive) {
        return str1 == str2;
    }

    return std::equal(str1.begin(), str1.end(), str2.begin(), str2.end(), [](char ch1, char ch2) {
        return tolower(ch1) == tolower(ch2);
    });
}

std::string trim(std::string_view str, std::string_view chars) noexcept
{
    auto first = str.find_first_not_of(chars);
    if (first == std::string_view::npos) {
        return "";
    }

    auto last = str.find_last_not_of(chars);
    return std::string(str.substr(first, last - first + 1));
}

std::vector<std::string> split(const std::string &str, char delimiter, splitOption option) noexcept
{
    std::vector<std::string> result;
    std::size_t start{ 0 };
    std::size_t end{ 0 };
    auto trimWhitespace = (option & splitOption::TrimWhitespace) != splitOption::None;
    auto skipEmpty = (option & splitOption::SkipEmpty) != splitOption::None;

    while ((end = str.find(delimiter, start)) != std::string::npos) {
        auto token = str.substr(start, end - start);
        if (trimWhitespace) {
            token = trim(token);
        }

        if (!skipEmpty || !token.empty()) {
            result.push_back(std::move(token));
        }

        start = end + 1;
    }

    auto token = str.substr(start);
    if (trimWhitespace) {
        token = trim(token);
    }

    if (!skipEmpty || !token.empty()) {
        result.push_back(std::move(token));
    }

    return result;
}

std::string join(const std::vector<std::string> &strs, char delimiter) noexcept
{
    if (strs.empty()) {
        return "";
    }

    if (strs.size() == 1) {
        return strs[0];
    }

    size_t total_len = strs.size() - 1;
    for (const auto &s : strs) {
        total_len += s.size();
    }

    std::string result;
    result.reserve(total_len);
    result.append(strs[0]);
    for (size_t i = 1; i < strs.size(); ++i) {
        result.push_back(delimiter);
        result.append(strs[i]);
    }

    return result;
}

bool contains(std::string_view str, std::string_view sub) noexcept
{
    return str.find(sub) != std::string_view::npos;
}

// Example:
//   Input:  "let's go"
//   Output: "'let'\''s go'"
//   Input:  "--name"
//   Output: "--name"
std::string quoteShellArg(std::string arg) noexcept
{
    auto needQuote = arg.empty() || std::any_of(arg.begin(), arg.end(), [](char ch) {
                         return std::isspace(static_cast<unsigned char>(ch)) != 0 || ch == '\''
                           || ch == '"' || ch == '$' || ch == '\\' || ch == '`';
                     });
    if (!needQuote) {
        return arg;
    }

    const std::string quotePrefix = "'\\";
    for (auto it = arg.begin(); it != arg.end(); it++) {
        if (*it == '\'') {
            it = arg.insert(it, quotePrefix.cbegin(), quotePrefix.cend());
            it = arg.insert(it + quotePrefix.size() + 1, 1, '\'');
        }
    }
    return "'" + arg + "'";
}

} // namespace kiln::common::strings
