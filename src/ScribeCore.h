/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

#pragma once

/**
 * @file ScribeCore.h
 * @brief Single header that includes all ScribeCore components
 */

// Core common utilities
#include "CoreCommon.h"

// Logging
#include "Logging/ConsoleSink.h"
#include "Logging/ILogSink.h"
#include "Logging/LogEntry.h"
#include "Logging/LogLevel.h"
#include "Logging/Logger.h"

// Concurrency
#include "Concurrency/WorkContractGroup.h"
#include "Concurrency/WorkContractHandle.h"

// Diagnostics
#include "Diagnostics/TimeLine.h"

// IO
#include "IO/FileOperationHandle.h"
#include "IO/FileStream.h"
#include "IO/IFileSystemBackend.h"
#include "IO/LocalFileSystemBackend.h"
#include "IO/FileHandle.h"
#include "IO/PlatformResourceUtils.h"
#include "IO/TextCodec.h"
#include "IO/LineScanner.h"
#include "IO/ChunkedEncoder.h"
#include "IO/StreamingFileReader.h"
#include "IO/AtomicFileWriter.h"
#include "IO/FileAccess.h"
