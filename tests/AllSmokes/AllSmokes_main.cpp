// ============================================================================
// VecCase - tests/AllSmokes/AllSmokes_main.cpp
// ----------------------------------------------------------------------------
// Purpose : Aggregate executable that runs all smoke helpers.
// Contract: Deterministic ordering; returns 0 on success. Each failing smoke
//           is named with its return code on stderr.
// Notes   : Assumes Run*Smoke helpers are linked from their respective TUs.
// ============================================================================

#include <cstdio>

int RunLoggerSmoke();
int RunAlignedBufferSmoke();
int RunClockSmoke();
int RunByteVectorSmoke();
int RunOverlapTailSmoke();
int RunAsciiUpperSmoke();
int RunFeatureProbeSmoke();
int RunVerifierSmoke();
int RunBenchRunnerSmoke();
int RunCommandLineSmoke();
int RunHarnessSmoke();

namespace
{
    struct SmokeEntry
    {
        const char* name;
        int (*fn)();
    };

    constexpr SmokeEntry kSmokes[] = {
        { "Logger",        &RunLoggerSmoke },
        { "AlignedBuffer", &RunAlignedBufferSmoke },
        { "Clock",         &RunClockSmoke },
        { "ByteVector",    &RunByteVectorSmoke },
        { "OverlapTail",   &RunOverlapTailSmoke },
        { "AsciiUpper",    &RunAsciiUpperSmoke },
        { "FeatureProbe",  &RunFeatureProbeSmoke },
        { "Verifier",      &RunVerifierSmoke },
        { "BenchRunner",   &RunBenchRunnerSmoke },
        { "CommandLine",   &RunCommandLineSmoke },
        { "Harness",       &RunHarnessSmoke },
    };
} // namespace

int main()
{
    int failures = 0;

    // Each smoke returns 0 on pass, non-zero on failure.
    for (const SmokeEntry& smoke : kSmokes)
    {
        const int rc = smoke.fn();
        if (rc != 0)
        {
            std::fprintf(stderr, "[FAIL] %s smoke returned %d\n", smoke.name, rc);
            ++failures;
        }
    }

    return (failures == 0) ? 0 : 1;
}
