// Szenarien mit echtem CPython. Jeder Fall läuft als Death-Test in einem eigenen
// Prozess, damit jede Ausführung ihre eigene (einzige) Interpreter-Session hat.
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "InterpreterHost.h"
#include "Logger.h"
#include "PythonSession.h"

#ifndef CLIPFIX_TEST_FIXTURES_DIR
#error "CLIPFIX_TEST_FIXTURES_DIR must point at tests/fixtures"
#endif

namespace fs = std::filesystem;
using ::testing::ExitedWithCode;

namespace {

PythonSession::Options fixtureOptions(const std::vector<std::string>& args = {},
                                      const std::string& home = {}) {
    PythonSession::Options opt;
    opt.pythonHome = home;
    opt.sysPaths   = { CLIPFIX_TEST_FIXTURES_DIR };
    opt.siteImport = false;
    opt.argv       = { "clipfix" };
    opt.argv.insert(opt.argv.end(), args.begin(), args.end());
    return opt;
}

[[noreturn]] void launchWith(const PythonSession::Options& opt, const std::string& module) {
    Logger::instance().setLogLevel(Logger::LogLevel::Debug);
    InterpreterHost host([opt] { return std::make_unique<PythonSession>(opt); });
    host.runAndExit(BootstrapUnit{ module, "main" });
}

[[noreturn]] void launch(const std::string& module,
                         const std::vector<std::string>& args = {},
                         const std::string& home = {}) {
    launchWith(fixtureOptions(args, home), module);
}

PythonSession::Options twoRootOptions(const char* first, const char* second) {
    PythonSession::Options opt = fixtureOptions();
    opt.sysPaths = { std::string(CLIPFIX_TEST_FIXTURES_DIR) + "/" + first,
                     std::string(CLIPFIX_TEST_FIXTURES_DIR) + "/" + second };
    return opt;
}

class PythonSessionDeathTest : public ::testing::Test {
protected:
    void SetUp() override { GTEST_FLAG_SET(death_test_style, "threadsafe"); }
};

TEST_F(PythonSessionDeathTest, EntryPointWithoutReturnValueExitsZero) {
    EXPECT_EXIT(launch("fixture_none"), ExitedWithCode(0), "interpreter finalized");
}

TEST_F(PythonSessionDeathTest, IntegerReturnValueBecomesExitStatus) {
    EXPECT_EXIT(launch("fixture_status"), ExitedWithCode(2), "interpreter finalized");
}

TEST_F(PythonSessionDeathTest, SameModuleGivesSameStatusInIndependentRuns) {
    EXPECT_EXIT(launch("fixture_status"), ExitedWithCode(2), "");
    EXPECT_EXIT(launch("fixture_status"), ExitedWithCode(2), "");
}

TEST_F(PythonSessionDeathTest, UnhandledExceptionIsReportedAndFails) {
    EXPECT_EXIT(launch("fixture_raise"), ExitedWithCode(kExitUnhandledFailure),
                "Traceback.*RuntimeError: bad input.*interpreter finalized.*application failure");
}

TEST_F(PythonSessionDeathTest, TracebackCanBeSuppressed) {
    // Kind prüft selbst, da ein fehlender Traceback nicht per Regex ausdrückbar ist
    EXPECT_EXIT({
        PythonSession::Options opt = fixtureOptions();
        opt.printTraceback = false;
        Logger::instance().setLogLevel(Logger::LogLevel::Error);
        InterpreterHost host([opt] { return std::make_unique<PythonSession>(opt); });

        ::testing::internal::CaptureStderr();
        const int status = host.run(BootstrapUnit{ "fixture_raise", "main" });
        const std::string err = ::testing::internal::GetCapturedStderr();
        std::cerr << err;

        const bool ok = status == kExitUnhandledFailure
                     && err.find("Traceback") == std::string::npos
                     && err.find("[clipfix][ERR]") != std::string::npos
                     && err.find("bad input") != std::string::npos;
        std::exit(ok ? 0 : 1);
    }, ExitedWithCode(0), "bad input");
}

TEST_F(PythonSessionDeathTest, FirstPackageRootWins) {
    EXPECT_EXIT(launchWith(twoRootOptions("root_first", "root_second"), "fixture_shadow"),
                ExitedWithCode(11), "");
    EXPECT_EXIT(launchWith(twoRootOptions("root_second", "root_first"), "fixture_shadow"),
                ExitedWithCode(22), "");
}

TEST_F(PythonSessionDeathTest, PackageRootsShadowStandardLibrary) {
    EXPECT_EXIT(launchWith(twoRootOptions("root_first", "root_second"), "colorsys"),
                ExitedWithCode(13), "");
}

TEST_F(PythonSessionDeathTest, SiteImportFollowsOption) {
    PythonSession::Options withSite = fixtureOptions();
    withSite.siteImport = true;
    EXPECT_EXIT(launchWith(withSite, "fixture_site"), ExitedWithCode(0), "");
    EXPECT_EXIT(launch("fixture_site"), ExitedWithCode(4), "");
}

TEST_F(PythonSessionDeathTest, SysExitInsideEntryPointIsHonoured) {
    EXPECT_EXIT(launch("fixture_sysexit"), ExitedWithCode(3), "");
}

TEST_F(PythonSessionDeathTest, NonIntegerStatusIsPrintedAndFails) {
    EXPECT_EXIT(launch("fixture_text"), ExitedWithCode(kExitUnhandledFailure), "clipboard empty");
}

TEST_F(PythonSessionDeathTest, ArgvIsForwardedToSysArgv) {
    EXPECT_EXIT(launch("fixture_argv", { "5" }), ExitedWithCode(5), "");
}

TEST_F(PythonSessionDeathTest, StatusIsTruncatedToHostWidth) {
    EXPECT_EXIT(launch("fixture_argv", { "258" }), ExitedWithCode(258 & 0xFF), "");
}

TEST_F(PythonSessionDeathTest, MissingModuleIsBootstrapFailure) {
    EXPECT_EXIT(launch("fixture_does_not_exist"), ExitedWithCode(kExitUnhandledFailure),
                "bootstrap failure.*ModuleNotFoundError");
}

TEST_F(PythonSessionDeathTest, NonCallableEntryPointIsBootstrapFailure) {
    EXPECT_EXIT(launch("fixture_noncallable"), ExitedWithCode(kExitUnhandledFailure),
                "is not callable");
}

TEST_F(PythonSessionDeathTest, EntryPointRunsWhenRuntimeStarts) {
    const fs::path marker = fs::path(::testing::TempDir()) / "clipfix_marker_ok";
    fs::remove(marker);
    EXPECT_EXIT(launch("fixture_marker", { marker.string() }), ExitedWithCode(0), "");
    EXPECT_TRUE(fs::exists(marker));
}

TEST_F(PythonSessionDeathTest, StartupFailureNeverInvokesEntryPoint) {
    const fs::path marker = fs::path(::testing::TempDir()) / "clipfix_marker_startup";
    fs::remove(marker);
    EXPECT_EXIT(launch("fixture_marker", { marker.string() }, "/nonexistent/clipfix-python-home"),
                ExitedWithCode(kExitStartupFailure), "startup failure");
    EXPECT_FALSE(fs::exists(marker));
}

TEST_F(PythonSessionDeathTest, SecondSessionInSameProcessIsRejected) {
    EXPECT_EXIT({
        const PythonSession::Options opt = fixtureOptions();
        if (PythonSession::createdInProcess()) std::exit(8);
        { PythonSession first(opt); }
        if (!PythonSession::createdInProcess()) std::exit(9);
        try {
            PythonSession second(opt);
            std::exit(0);
        } catch (const StartupError& e) {
            std::cerr << e.what() << std::endl;
            std::exit(7);
        }
    }, ExitedWithCode(7), "already created");
}

} // namespace
