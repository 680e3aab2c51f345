#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "ScribeCore.h"

using namespace Scribe::Core;
using namespace Scribe::Core::Concurrency;
using namespace Scribe::Core::IO;

int main() {
    WorkContractGroup group(128, "LineStreaming");
    FileAccess access(&group, FileAccess::Config::fromEnvironment());
    access.setSpanObserver(std::make_shared<Diagnostics::TimeLine>());

    auto dir = std::filesystem::temp_directory_path().string();
    auto base = access.createFileHandle(dir);
    auto notes = access.resolveFilePath("scribe_example_notes.txt");
    if (!notes) {
        notes = base.withLeafName("scribe_example_notes.txt");
    }

    // Write a few lines through a pull source
    int next = 0;
    bool failed = false;
    access.writeToFile(*notes, [&next]() -> std::optional<std::string> {
        if (next == 5) return std::nullopt;
        return "line " + std::to_string(next++);
    }, [&failed](std::optional<FileErrorInfo> err) {
        if (err) {
            SCRIBE_LOG_ERROR("Write failed: " + err->toString());
            failed = true;
        }
    });
    group.executeAllMainThreadWork();
    if (failed) return 1;

    // Stream them back, one contract per line
    size_t count = 0;
    access.readFromFile(*notes, [&count](std::optional<std::string_view> line) {
        if (line) {
            ++count;
            SCRIBE_LOG_INFO("Read: " + std::string(*line));
        }
    }, [&failed](std::optional<FileErrorInfo> err) {
        if (err) {
            SCRIBE_LOG_ERROR("Read failed: " + err->toString());
            failed = true;
        }
    });
    group.executeAllMainThreadWork();
    SCRIBE_LOG_INFO("Lines read: " + std::to_string(count));

    access.statFile(*notes, [](std::optional<FileErrorInfo> err, FileStat st) {
        if (!err) {
            SCRIBE_LOG_INFO(std::string("Exists: ") + (st.exists ? "true" : "false") +
                            ", modified: " + std::to_string(st.lastModified));
        }
    });

    // Cleanup
    access.removeFile(*notes, [](std::optional<FileErrorInfo>) {});
    group.executeAllMainThreadWork();
    return failed ? 1 : 0;
}
