#include <cstdlib>
#include <iostream>
#include <string>
#include <wasmbox/runtime/outcome.h>
#include <wasmbox/runtime/report.h>

using namespace wasmbox;

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static void expect_report(const runtime::ExecutionOutcome& outcome, const std::string& expected)
{
    const std::string got = runtime::render_report(outcome);
    if (got != expected)
    {
        fail("report mismatch\n--- expected ---\n" + expected + "--- got ---\n" + got);
    }
}

int main()
{
    {
        runtime::Completed done;
        done.entry = runtime::EntryKind::LegacyStart;
        done.output.stdout_bytes = "Hello, world!\n";
        expect_report(done, "status: completed\n"
                            "entry: _start\n"
                            "exit code: 0\n"
                            "\n"
                            "-- stdout --\n"
                            "Hello, world!\n");
    }

    // Stderr gets its own section; a missing final newline is supplied.
    {
        runtime::Completed done;
        done.entry = runtime::EntryKind::LegacyMain;
        done.exit_code = 3;
        done.output.stdout_bytes = "out";
        done.output.stderr_bytes = "warn\n";
        expect_report(done, "status: completed\n"
                            "entry: main\n"
                            "exit code: 3\n"
                            "\n"
                            "-- stdout --\n"
                            "out\n"
                            "\n"
                            "-- stderr --\n"
                            "warn\n");
    }

    {
        runtime::Completed done;
        done.entry = runtime::EntryKind::ComponentRun;
        done.output.stdout_bytes = "0123";
        done.output.stdout_truncated = true;
        expect_report(done, "status: completed\n"
                            "entry: wasi:cli/run\n"
                            "exit code: 0\n"
                            "\n"
                            "-- stdout --\n"
                            "0123\n"
                            "(truncated)\n");
    }

    {
        runtime::Trapped trapped;
        trapped.message = "unreachable executed";
        trapped.entry = runtime::EntryKind::LegacyStart;
        trapped.output.stdout_bytes = "partial\n";
        expect_report(trapped, "status: trapped\n"
                               "entry: _start\n"
                               "trap: unreachable executed\n"
                               "\n"
                               "-- stdout --\n"
                               "partial\n");

        trapped.entry.reset();
        trapped.output.stdout_bytes.clear();
        expect_report(trapped, "status: trapped\n"
                               "entry: (instantiation)\n"
                               "trap: unreachable executed\n"
                               "\n"
                               "-- stdout --\n");
    }

    // Invalid UTF-8 from the guest is replaced, never passed through.
    {
        runtime::Completed done;
        done.output.stdout_bytes = std::string("ok \xFF\n");
        const std::string report = runtime::render_report(done);
        if (report.find("ok \xEF\xBF\xBD\n") == std::string::npos)
        {
            fail("expected U+FFFD in place of the invalid byte");
        }
    }

    {
        runtime::Failed failed{.stage = runtime::Stage::EntryResolution,
                               .message = "no entry point"};
        expect_report(failed, "WASM error: entry resolution: no entry point\n");
        failed.stage = runtime::Stage::Cancellation;
        failed.message = "deadline exceeded";
        if (runtime::render_failure(failed) != "WASM error: cancellation: deadline exceeded\n")
        {
            fail("unexpected failure line");
        }
    }

    std::cout << "OK\n";
    return 0;
}
