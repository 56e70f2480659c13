// tests/test_runtime_paths.cpp

#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>

#include "helpers/test_helpers.h"
#include "solo/runtime_paths.hpp"

using namespace test_utils;

namespace
{
// Restores an environment variable on scope exit.
class EnvGuard
{
public:
    explicit EnvGuard(const char *name) : name_(name)
    {
        if (const char *v = std::getenv(name))
        {
            had_value_ = true;
            value_ = v;
        }
    }
    ~EnvGuard()
    {
        if (had_value_)
            ::setenv(name_, value_.c_str(), 1);
        else
            ::unsetenv(name_);
    }

private:
    const char *name_;
    bool had_value_ = false;
    std::string value_;
};
} // namespace

TEST(RuntimePathsTest, OverrideWinsAndIsCreated)
{
    TempRuntimeDir dir;
    fs::path nested = dir.path() / "a" / "b";
    solo::RuntimePaths paths(nested.string());
    EXPECT_EQ(paths.dir(), fs::absolute(nested));
    EXPECT_TRUE(fs::is_directory(nested));
}

TEST(RuntimePathsTest, NamesFollowIdentity)
{
    TempRuntimeDir dir;
    solo::RuntimePaths paths(dir.str());
    EXPECT_EQ(paths.claimFile("6F9619FF-8B86-D011-B42D-00C04FC964FF"),
              paths.dir() / "6F9619FF-8B86-D011-B42D-00C04FC964FFMutex");
    EXPECT_EQ(paths.channelFile("6F9619FF-8B86-D011-B42D-00C04FC964FF"),
              paths.dir() / "6F9619FF-8B86-D011-B42D-00C04FC964FFPipe");
}

TEST(RuntimePathsTest, EnvironmentSelectsDirectory)
{
    EnvGuard solo_env("SOLO_RUNTIME_DIR");
    EnvGuard xdg_env("XDG_RUNTIME_DIR");
    TempRuntimeDir solo_dir;
    TempRuntimeDir xdg_dir;

    ::setenv("XDG_RUNTIME_DIR", xdg_dir.str().c_str(), 1);
    ::unsetenv("SOLO_RUNTIME_DIR");
    EXPECT_EQ(solo::RuntimePaths().dir(), xdg_dir.path());

    ::setenv("SOLO_RUNTIME_DIR", solo_dir.str().c_str(), 1);
    EXPECT_EQ(solo::RuntimePaths().dir(), solo_dir.path());

    ::unsetenv("SOLO_RUNTIME_DIR");
    ::unsetenv("XDG_RUNTIME_DIR");
    EXPECT_EQ(solo::RuntimePaths().dir(), fs::temp_directory_path());
}

TEST(RuntimePathsTest, RejectsIdentitiesThatCannotNameAFile)
{
    EXPECT_THROW(solo::RuntimePaths::validateIdentity(""), std::invalid_argument);
    EXPECT_THROW(solo::RuntimePaths::validateIdentity("../etc"), std::invalid_argument);
    EXPECT_THROW(solo::RuntimePaths::validateIdentity(std::string("a\0b", 3)), std::invalid_argument);
    EXPECT_NO_THROW(solo::RuntimePaths::validateIdentity("com.example.app"));
}
