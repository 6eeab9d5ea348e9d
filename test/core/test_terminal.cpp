#include <catch2/catch_test_macros.hpp>

#include <toolserve/core/terminal.hpp>

#include <cstdlib>

#ifdef _WIN32
#include <stdlib.h>  // _putenv_s
#endif

using namespace toolserve;

namespace {

void SetEnv(const char* name, const char* value) {
#ifdef _WIN32
    _putenv_s(name, value);
#else
    setenv(name, value, 1);
#endif
}

void UnsetEnv(const char* name) {
#ifdef _WIN32
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}

} // anonymous namespace

// ===========================================================================
// Terminal detection: basic smoke tests.
// ===========================================================================

TEST_CASE("IsStderrTty: returns bool without crashing", "[core][terminal]") {
    auto result = IsStderrTty();
    CHECK((result == true || result == false));
}

// ===========================================================================
// ResolveLogColor
// ===========================================================================

TEST_CASE("ResolveLogColor: --no-color always wins", "[core][terminal]") {
    UnsetEnv("NO_COLOR");
    CHECK_FALSE(ResolveLogColor(true, true));
    CHECK_FALSE(ResolveLogColor(false, true));
}

TEST_CASE("ResolveLogColor: --color forces color without NO_COLOR", "[core][terminal]") {
    UnsetEnv("NO_COLOR");
    CHECK_FALSE(NoColorEnvSet());
    CHECK(ResolveLogColor(true, false));
}

TEST_CASE("ResolveLogColor: NO_COLOR disables color", "[core][terminal]") {
    SetEnv("NO_COLOR", "1");
    CHECK(NoColorEnvSet());
    CHECK_FALSE(ResolveLogColor(true, false));
    UnsetEnv("NO_COLOR");
}
