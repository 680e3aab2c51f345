#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

#include "ScribeTestHelpers.h"

using namespace Scribe::Core::IO;
using scribe::test_helpers::ScopedTempDir;
using scribe::test_helpers::ScopedWorkEnv;

namespace {
// Restores an environment variable on scope exit
class ScopedEnvVar {
public:
    ScopedEnvVar(const char* name, const char* value) : _name(name) {
        if (const char* old = std::getenv(name)) _old = old;
        ::setenv(name, value, 1);
    }
    ~ScopedEnvVar() {
        if (_old) ::setenv(_name.c_str(), _old->c_str(), 1);
        else ::unsetenv(_name.c_str());
    }

private:
    std::string _name;
    std::optional<std::string> _old;
};
}

TEST(PathResolution, EmptyPath_IsUnresolved) {
    EXPECT_FALSE(resolveFilePath("", std::string("/base")).has_value());
}

TEST(PathResolution, AbsolutePath_TakesPrecedence) {
    ScopedTempDir tmp;
    auto absolute = tmp.join("abs.txt").string();
    auto resolved = resolveFilePath(absolute, std::string("/elsewhere"));
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(*resolved, std::filesystem::path(absolute).lexically_normal().string());
}

TEST(PathResolution, RelativePath_AppendsSegmentsToBase) {
    ScopedTempDir tmp;
    auto resolved = resolveFilePath("lists/patterns.ini", tmp.path().string());
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(*resolved, (tmp.path() / "lists" / "patterns.ini").string());
}

TEST(PathResolution, RelativePathWithoutBase_IsUnresolved) {
    EXPECT_FALSE(resolveFilePath("file.txt", std::nullopt).has_value());
    EXPECT_FALSE(resolveFilePath("file.txt", std::string()).has_value());
}

TEST(PathResolution, BadSegments_AreUnresolved) {
    EXPECT_FALSE(resolveFilePath("a//b", std::string("/base")).has_value());
    EXPECT_FALSE(resolveFilePath("../escape", std::string("/base")).has_value());
    EXPECT_FALSE(resolveFilePath("a/./b", std::string("/base")).has_value());
    EXPECT_FALSE(resolveFilePath("trailing/", std::string("/base")).has_value());
}

TEST(PathResolution, FacadeUsesConfiguredProfileDirectory) {
    ScopedTempDir tmp;
    FileAccess::Config cfg;
    cfg.profileDirectory = tmp.path().string();
    ScopedWorkEnv env(cfg);

    auto fh = env.access().resolveFilePath("patterns.ini");
    ASSERT_TRUE(fh.has_value());
    EXPECT_EQ(fh->path(), (tmp.path() / "patterns.ini").string());
    EXPECT_EQ(fh->filename(), "patterns.ini");
    EXPECT_FALSE(env.access().resolveFilePath("").has_value());
}

TEST(PathResolution, DefaultProfileDirectory_IsAppDataPath) {
    ScopedEnvVar xdg("XDG_DATA_HOME", "/tmp/scribe-xdg");
    ScopedWorkEnv env;
#if defined(__linux__)
    auto dir = env.access().profileDirectory();
    ASSERT_TRUE(dir.has_value());
    EXPECT_EQ(*dir, "/tmp/scribe-xdg/ScribeCore/");
#else
    EXPECT_EQ(env.access().profileDirectory(), getAppDataPath("ScribeCore"));
#endif
}

TEST(FileAccessConfig, EnvironmentOverrides) {
    ScopedEnvVar dir("SCRIBE_PROFILE_DIR", "/tmp/scribe-profile");
    ScopedEnvVar threshold("SCRIBE_CHUNK_THRESHOLD", "1024");
    auto cfg = FileAccess::Config::fromEnvironment();
    ASSERT_TRUE(cfg.profileDirectory.has_value());
    EXPECT_EQ(*cfg.profileDirectory, "/tmp/scribe-profile");
    EXPECT_EQ(cfg.chunkThreshold, 1024u);
    EXPECT_EQ(cfg.tempSuffix, ".tmp");
}

TEST(FileAccessConfig, InvalidThreshold_KeepsDefault) {
    ScopedEnvVar threshold("SCRIBE_CHUNK_THRESHOLD", "lots");
    auto cfg = FileAccess::Config::fromEnvironment();
    EXPECT_EQ(cfg.chunkThreshold, kDefaultChunkThreshold);

    ScopedEnvVar zero("SCRIBE_CHUNK_THRESHOLD", "0");
    EXPECT_EQ(FileAccess::Config::fromEnvironment().chunkThreshold, kDefaultChunkThreshold);
}
