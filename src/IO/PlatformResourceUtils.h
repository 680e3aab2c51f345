/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

#pragma once

#include <optional>
#include <string>

namespace Scribe::Core::IO
{

/**
 * Platform line terminator used when encoding written lines.
 *
 * "\r\n" on Windows, "\n" elsewhere. Initialized on first use and immutable afterwards.
 */
const std::string& lineBreak();

/**
 * Get platform-appropriate app data directory.
 *
 * Platform behavior:
 * - macOS: ~/Library/Application Support/{appName}/
 * - Linux: $XDG_DATA_HOME/{appName}/ or ~/.local/share/{appName}/
 * - Windows: %APPDATA%\{appName}\
 *
 * @param appName Application name (used as subdirectory)
 * @return Absolute path to app data directory, or nullopt on failure
 */
std::optional<std::string> getAppDataPath(const std::string& appName);

/**
 * Map a logical path to a concrete one.
 *
 * An absolute path is taken as-is (lexically normalized). Otherwise the path is split on '/'
 * and appended segment by segment to baseDirectory. Empty input, a missing base directory,
 * or an empty/"." /".." segment yields nullopt.
 *
 * @param path Absolute path, or '/'-separated path relative to baseDirectory
 * @param baseDirectory Directory relative paths are resolved against
 */
std::optional<std::string> resolveFilePath(const std::string& path,
                                           const std::optional<std::string>& baseDirectory);

}  // namespace Scribe::Core::IO
