/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

#include "PlatformResourceUtils.h"
#include "../CoreCommon.h"

#include <filesystem>
#include <string_view>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#include <shlobj.h>  // For SHGetKnownFolderPath
#include <windows.h>
#endif

namespace Scribe::Core::IO
{

const std::string& lineBreak() {
#if defined(_WIN32)
    static const std::string lb = "\r\n";
#else
    static const std::string lb = "\n";
#endif
    return lb;
}

std::optional<std::string> getAppDataPath(const std::string& appName) {
    if (appName.empty()) {
        return std::nullopt;
    }

#if defined(__APPLE__)
    // macOS: ~/Library/Application Support/{appName}/
    auto home = safeGetEnv("HOME");
    if (!home) {
        return std::nullopt;
    }
    std::filesystem::path basePath = std::filesystem::path(*home) / "Library" / "Application Support" / appName;
    std::string result = basePath.string();
    if (!result.empty() && result.back() != '/') {
        result += '/';
    }
    return result;

#elif defined(_WIN32)
    // Windows: %APPDATA%\{appName}\
    PWSTR appDataPath = nullptr;
    if (FAILED(SHGetKnownFolderPath(FOLDERID_RoamingAppData, 0, nullptr, &appDataPath))) {
        return std::nullopt;
    }

    // Convert wide string to narrow
    int size = WideCharToMultiByte(CP_UTF8, 0, appDataPath, -1, nullptr, 0, nullptr, nullptr);
    if (size <= 0) {
        CoTaskMemFree(appDataPath);
        return std::nullopt;
    }

    std::string narrowPath(size - 1, '\0');
    WideCharToMultiByte(CP_UTF8, 0, appDataPath, -1, narrowPath.data(), size, nullptr, nullptr);
    CoTaskMemFree(appDataPath);

    std::filesystem::path basePath = std::filesystem::path(narrowPath) / appName;
    std::string result = basePath.string();
    if (!result.empty() && result.back() != '\\') {
        result += '\\';
    }
    return result;

#elif defined(__linux__)
    // Linux: $XDG_DATA_HOME/{appName}/ or ~/.local/share/{appName}/
    auto xdgDataHome = safeGetEnv("XDG_DATA_HOME");
    std::filesystem::path basePath;

    if (xdgDataHome && !xdgDataHome->empty()) {
        basePath = std::filesystem::path(*xdgDataHome) / appName;
    } else {
        auto home = safeGetEnv("HOME");
        if (!home) {
            return std::nullopt;
        }
        basePath = std::filesystem::path(*home) / ".local" / "share" / appName;
    }

    std::string result = basePath.string();
    if (!result.empty() && result.back() != '/') {
        result += '/';
    }
    return result;

#else
    return std::nullopt;
#endif
}

std::optional<std::string> resolveFilePath(const std::string& path,
                                           const std::optional<std::string>& baseDirectory) {
    if (path.empty()) {
        return std::nullopt;
    }

    std::filesystem::path candidate(path);
    if (candidate.is_absolute()) {
        return candidate.lexically_normal().string();
    }

    if (!baseDirectory || baseDirectory->empty()) {
        return std::nullopt;
    }

    std::filesystem::path result(*baseDirectory);
    std::string_view rest(path);
    while (true) {
        const auto slash = rest.find('/');
        const std::string_view segment = rest.substr(0, slash);
        if (segment.empty() || segment == "." || segment == "..") {
            return std::nullopt;
        }
        result /= std::string(segment);
        if (slash == std::string_view::npos) break;
        rest.remove_prefix(slash + 1);
    }
    return result.string();
}

}  // namespace Scribe::Core::IO
