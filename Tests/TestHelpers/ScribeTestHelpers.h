#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include "ScribeCore.h"

namespace scribe::test_helpers
{

// RAII temporary directory that gets cleaned up on destruction
class ScopedTempDir
{
public:
    ScopedTempDir() {
        namespace fs = std::filesystem;
        auto base = fs::temp_directory_path();
        // Create a reasonably unique directory name
        auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
        std::random_device rd;
        std::mt19937_64 gen(rd());
        auto rnd = gen();
        std::ostringstream oss;
        oss << "ScribeIO_Test_" << std::hex << now << "_" << rnd;
        _path = base / oss.str();
        std::error_code ec;
        fs::create_directories(_path, ec);
    }

    ~ScopedTempDir() {
        namespace fs = std::filesystem;
        std::error_code ec;
        fs::remove_all(_path, ec);  // best-effort cleanup
    }

    const std::filesystem::path& path() const noexcept {
        return _path;
    }
    std::filesystem::path join(const std::string& name) const {
        return _path / name;
    }

private:
    std::filesystem::path _path;
};

// RAII environment with a WorkContractGroup and a FileAccess over it
class ScopedWorkEnv
{
public:
    explicit ScopedWorkEnv(Scribe::Core::IO::FileAccess::Config cfg = {})
        : _group(2048, "TestIOGroup"),
          _access(&_group, std::move(cfg)) {
    }

    using BackendFactory = std::function<std::shared_ptr<Scribe::Core::IO::IFileSystemBackend>(
        Scribe::Core::Concurrency::WorkContractGroup*)>;

    // Backend built against this environment's group
    explicit ScopedWorkEnv(const BackendFactory& makeBackend, Scribe::Core::IO::FileAccess::Config cfg = {})
        : _group(2048, "TestIOGroup"),
          _access(&_group, makeBackend(&_group), std::move(cfg)) {
    }

    Scribe::Core::IO::FileAccess& access() noexcept {
        return _access;
    }
    Scribe::Core::Concurrency::WorkContractGroup& group() noexcept {
        return _group;
    }

    // Pump until no work remains
    size_t drain() {
        return _group.executeAllMainThreadWork();
    }

private:
    Scribe::Core::Concurrency::WorkContractGroup _group;
    Scribe::Core::IO::FileAccess _access;
};

// Records every invocation of a completion callback
class CompletionRecorder
{
public:
    struct State {
        int calls = 0;
        std::optional<Scribe::Core::IO::FileErrorInfo> error;
        Scribe::Core::IO::FileStat stat;
    };

    CompletionRecorder() : _state(std::make_shared<State>()) {}

    Scribe::Core::IO::CompletionCallback callback() const {
        auto state = _state;
        return [state](std::optional<Scribe::Core::IO::FileErrorInfo> err) {
            ++state->calls;
            state->error = std::move(err);
        };
    }

    Scribe::Core::IO::StatCallback statCallback() const {
        auto state = _state;
        return [state](std::optional<Scribe::Core::IO::FileErrorInfo> err, Scribe::Core::IO::FileStat st) {
            ++state->calls;
            state->error = std::move(err);
            state->stat = st;
        };
    }

    int calls() const noexcept { return _state->calls; }
    bool succeeded() const noexcept { return _state->calls == 1 && !_state->error; }
    const std::optional<Scribe::Core::IO::FileErrorInfo>& error() const noexcept { return _state->error; }
    const Scribe::Core::IO::FileStat& stat() const noexcept { return _state->stat; }

private:
    std::shared_ptr<State> _state;
};

/**
 * Decorates a real backend to count calls, capture written chunks and inject failures.
 * Streams it opens record every write payload and can fail at a chosen write index.
 */
class FaultInjectingBackend : public Scribe::Core::IO::IFileSystemBackend
{
public:
    struct Faults {
        std::optional<size_t> failWriteAt;   // 0-based write index that fails with DiskFull
        bool failFlush = false;
        bool advertiseFlush = true;
        bool failMove = false;
        bool throwOnOpen = false;            // synchronous setup failure
        bool throwOnRead = false;
        bool throwOnCopy = false;
    };

    struct Counters {
        size_t reads = 0;
        size_t opens = 0;
        size_t writes = 0;
        size_t flushes = 0;
        size_t closes = 0;
        size_t moves = 0;
        std::vector<std::string> writtenChunks;
        std::vector<std::string> openedPaths;
    };

    FaultInjectingBackend(std::shared_ptr<Scribe::Core::IO::IFileSystemBackend> inner,
                          Scribe::Core::Concurrency::WorkContractGroup* group);

    Faults& faults() noexcept { return _faults; }
    const Counters& counters() const noexcept { return *_counters; }

    Scribe::Core::IO::FileOperationHandle readFile(const std::string& path) override;
    Scribe::Core::IO::FileOperationHandle openFile(const std::string& path,
                                                   Scribe::Core::IO::OpenOptions options = {}) override;
    Scribe::Core::IO::FileOperationHandle moveFile(const std::string& src, const std::string& dst,
                                                   Scribe::Core::IO::MoveOptions options = {}) override;
    Scribe::Core::IO::FileOperationHandle copyFile(const std::string& src, const std::string& dst,
                                                   Scribe::Core::IO::CopyOptions options = {}) override;
    Scribe::Core::IO::FileOperationHandle removeFile(const std::string& path) override;
    Scribe::Core::IO::FileOperationHandle getMetadata(const std::string& path) override;

    Scribe::Core::IO::BackendCapabilities getCapabilities() const override;
    std::string getBackendType() const override { return "FaultInjecting(" + _inner->getBackendType() + ")"; }

private:
    std::shared_ptr<Scribe::Core::IO::IFileSystemBackend> _inner;
    Scribe::Core::Concurrency::WorkContractGroup* _group;
    Faults _faults;
    std::shared_ptr<Counters> _counters;
};

// Helpers
std::string readAllBytes(const std::filesystem::path& p);
void writeAllBytes(const std::filesystem::path& p, const std::string& contents);

}  // namespace scribe::test_helpers
