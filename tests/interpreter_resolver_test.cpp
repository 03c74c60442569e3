#include <gtest/gtest.h>

#include "interpreter/interpreter_resolver.hpp"
#include "sandbox/resource_limiter.hpp"
#include "test_support.hpp"

using scriptbox::interpreter::CandidateSource;
using scriptbox::interpreter::InterpreterHandle;
using scriptbox::interpreter::InterpreterResolver;
using scriptbox::interpreter::ResolutionError;

namespace {

constexpr const char* kGoodPython = "echo \"Python 3.11.4\"";
constexpr const char* kBrokenPython = "echo \"error while loading shared libraries\" 1>&2\nexit 127";

}  // namespace

class InterpreterResolverTest : public ::testing::Test {
protected:
    // Only explicitly created candidates are visible.
    scriptbox::config::InterpreterConfig IsolatedConfig() const {
        scriptbox::config::InterpreterConfig config{};
        config.base_dir = dir_.Path().string();
        config.bundled_paths = {"resources/python/bin/python3"};
        config.venv_paths = {"venv/bin/python"};
        config.system_names = {};
        config.verify_timeout_s = 5;
        return config;
    }

    scriptbox::testing::TempDir dir_{"scriptbox_resolver"};
    scriptbox::sandbox::MonitoringResourceLimiter limiter_;
    scriptbox::sandbox::ProcessSupervisor supervisor_{limiter_, std::chrono::milliseconds(20)};
};

TEST_F(InterpreterResolverTest, CandidatesFollowPriorityOrder) {
    const auto configured = scriptbox::testing::WriteExecutable(dir_.Path() / "custom/python", kGoodPython);
    scriptbox::testing::WriteExecutable(dir_.Path() / "resources/python/bin/python3", kGoodPython);
    scriptbox::testing::WriteExecutable(dir_.Path() / "venv/bin/python", kGoodPython);

    auto config = IsolatedConfig();
    config.path = configured.string();
    InterpreterResolver resolver(config, supervisor_);
    const auto candidates = resolver.Candidates();

    ASSERT_EQ(candidates.size(), 3u);
    EXPECT_EQ(candidates[0].source, CandidateSource::Configured);
    EXPECT_EQ(candidates[1].source, CandidateSource::Bundled);
    EXPECT_EQ(candidates[2].source, CandidateSource::VirtualEnv);
    EXPECT_NE(candidates[1].path.find("resources/python/bin/python3"), std::string::npos);
}

TEST_F(InterpreterResolverTest, MissingFilesAreNotCandidates) {
    InterpreterResolver resolver(IsolatedConfig(), supervisor_);
    EXPECT_TRUE(resolver.Candidates().empty());
    EXPECT_THROW(resolver.Resolve(), ResolutionError);
}

TEST_F(InterpreterResolverTest, VerifyReturnsFirstVersionLine) {
    const auto python = scriptbox::testing::WriteExecutable(dir_.Path() / "python", kGoodPython);
    InterpreterResolver resolver(IsolatedConfig(), supervisor_);
    EXPECT_EQ(resolver.Verify(python.string()), "Python 3.11.4");
}

TEST_F(InterpreterResolverTest, VerifyFallsBackToStderr) {
    const auto python = scriptbox::testing::WriteExecutable(dir_.Path() / "python2", "echo \"Python 2.7.18\" 1>&2");
    InterpreterResolver resolver(IsolatedConfig(), supervisor_);
    EXPECT_EQ(resolver.Verify(python.string()), "Python 2.7.18");
}

TEST_F(InterpreterResolverTest, SkipsCandidateThatFailsVerification) {
    scriptbox::testing::WriteExecutable(dir_.Path() / "resources/python/bin/python3", kBrokenPython);
    const auto venv = scriptbox::testing::WriteExecutable(dir_.Path() / "venv/bin/python", kGoodPython);

    InterpreterResolver resolver(IsolatedConfig(), supervisor_);
    const auto resolved = resolver.Resolve();
    EXPECT_EQ(resolved.source, CandidateSource::VirtualEnv);
    EXPECT_EQ(resolved.version, "Python 3.11.4");
    EXPECT_NE(resolved.path.find("venv/bin/python"), std::string::npos);
}

TEST_F(InterpreterResolverTest, ErrorNamesEveryFailedCandidate) {
    scriptbox::testing::WriteExecutable(dir_.Path() / "resources/python/bin/python3", kBrokenPython);
    InterpreterResolver resolver(IsolatedConfig(), supervisor_);
    try {
        resolver.Resolve();
        FAIL() << "expected ResolutionError";
    } catch (const ResolutionError& ex) {
        EXPECT_NE(std::string(ex.what()).find("resources/python/bin/python3"), std::string::npos);
    }
}

TEST_F(InterpreterResolverTest, SystemNamesAreSearchedOnPath) {
    auto config = IsolatedConfig();
    config.system_names = {"sh"};
    InterpreterResolver resolver(config, supervisor_);
    const auto candidates = resolver.Candidates();
    ASSERT_FALSE(candidates.empty());
    EXPECT_EQ(candidates.back().source, CandidateSource::System);
}

TEST_F(InterpreterResolverTest, HandleCachesAndRevalidates) {
    const auto bundled = scriptbox::testing::WriteExecutable(
        dir_.Path() / "resources/python/bin/python3", kGoodPython);
    InterpreterHandle handle{InterpreterResolver(IsolatedConfig(), supervisor_)};
    EXPECT_EQ(handle.Get().source, CandidateSource::Bundled);

    // Nothing changed on disk.
    EXPECT_FALSE(handle.Revalidate());

    std::filesystem::remove(bundled);
    scriptbox::testing::WriteExecutable(dir_.Path() / "venv/bin/python", kGoodPython);
    EXPECT_TRUE(handle.Revalidate());
    EXPECT_EQ(handle.Get().source, CandidateSource::VirtualEnv);
}

TEST_F(InterpreterResolverTest, RevalidateKeepsPreviousWhenNothingVerifies) {
    const auto bundled = scriptbox::testing::WriteExecutable(
        dir_.Path() / "resources/python/bin/python3", kGoodPython);
    InterpreterHandle handle{InterpreterResolver(IsolatedConfig(), supervisor_)};
    const auto before = handle.Get().path;

    std::filesystem::remove(bundled);
    EXPECT_FALSE(handle.Revalidate());
    EXPECT_EQ(handle.Get().path, before);
}

TEST_F(InterpreterResolverTest, HandleConstructionThrowsWithoutInterpreter) {
    EXPECT_THROW(InterpreterHandle{InterpreterResolver(IsolatedConfig(), supervisor_)}, ResolutionError);
}
