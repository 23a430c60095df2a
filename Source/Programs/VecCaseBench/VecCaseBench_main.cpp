// ============================================================================
// VecCase - Programs/VecCaseBench/VecCaseBench_main.cpp
// ----------------------------------------------------------------------------
// Purpose : Command-line entry point: `veccase-bench [MiB]`.
// Contract: Exit code 0 on success, 1 when verification or a benchmark fails,
//           2 when the length argument is rejected. The report goes to stdout;
//           diagnostics go to stderr through the Logger.
// Notes   : The same source builds every flavor executable; each flavor
//           compiles all of its objects, this one included, with one set of
//           instruction-set flags.
// ============================================================================

#include "VecCase/CoreMinimal.hpp"
#include "VecCase/App/CommandLine.hpp"
#include "VecCase/App/Harness.hpp"
#include "VecCase/Cpu/CpuidFeatureProbe.hpp"
#include "VecCase/Diagnostics/ConsoleReport.hpp"
#include "VecCase/Time/SteadyClock.hpp"

#include <cstdio>
#include <exception>

int main(int argc, char** argv)
{
    using namespace vcase;

    const app::ParseResult args = app::ParseCommandLine(argc, argv);
    if (!args.Ok())
    {
        core::ReportLine(stdout, "{}", app::kParseErrorMessage);
        return app::kExitArgumentError;
    }

    try
    {
        const cpu::CpuidFeatureProbe probe{};
        const cpu::CpuFeatureInterface features = cpu::MakeCpuidFeatureInterface(probe);

        time::SteadyClock steady{};
        time::ClockInterface clock = time::MakeSteadyClockInterface(steady);

        app::HarnessConfig config{};
        config.bufferMiB = args.bufferMiB;

        const app::HarnessReport report = app::RunHarness(config, features, clock);
        if (report.status != app::HarnessStatus::Ok)
        {
            VCASE_LOG_ERROR("App", "pipeline stopped: {} ({})",
                app::HarnessStatusName(report.status),
                report.failedKernel ? report.failedKernel : "-");
        }
        std::fflush(stdout);
        return app::ExitCodeFor(report.status);
    }
    catch (const std::exception& e)
    {
        VCASE_LOG_ERROR("App", "unhandled exception: {}", e.what());
        return 1;
    }
}
