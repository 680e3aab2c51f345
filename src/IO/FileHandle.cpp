/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

#include "FileHandle.h"
#include "FileOperationHandle.h"
#include <filesystem>

namespace Scribe::Core::IO {

FileHandle::FileHandle(std::string path) {
    _meta.path = std::move(path);
    std::filesystem::path pp(_meta.path);
    _meta.directory = pp.has_parent_path() ? pp.parent_path().string() : std::string();
    _meta.filename = pp.filename().string();
    _meta.extension = pp.has_extension() ? pp.extension().string() : std::string();
}

FileHandle FileHandle::withLeafName(std::string_view leafName) const {
    if (leafName.empty() || leafName == "." || leafName == ".." ||
        leafName.find_first_of("/\\") != std::string_view::npos ||
        leafName.find('\0') != std::string_view::npos) {
        FileErrorInfo info;
        info.code = FileError::InvalidPath;
        info.message = "Invalid leaf name '" + std::string(leafName) + "'";
        info.path = _meta.path;
        throw FileOperationException(std::move(info));
    }

    std::filesystem::path pp(_meta.path);
    return FileHandle(pp.replace_filename(std::string(leafName)).string());
}

FileHandle FileHandle::withSuffix(std::string_view suffix) const {
    return FileHandle(_meta.path + std::string(suffix));
}

} // namespace Scribe::Core::IO
