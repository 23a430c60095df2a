// Compile-only self containment check for the application headers
#include "VecCase/App/CommandLine.hpp"
#include "VecCase/App/Harness.hpp"

namespace {
    using namespace vcase::app;

    static_assert(ExitCodeFor(HarnessStatus::Ok) == 0, "success exits with 0");
    static_assert(ExitCodeFor(HarnessStatus::InvalidConfig) == kExitArgumentError, "bad sizes exit with 2");

    void TouchApp() noexcept
    {
        (void)ParseBufferMiB("16");
        (void)HarnessStatusName(HarnessStatus::BenchFailed);
    }
}
