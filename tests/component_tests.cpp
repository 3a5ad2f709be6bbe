#include <cstdlib>
#include <iostream>
#include <string>
#include <variant>
#include <wasm_builder.h>
#include <wasmbox/engine/component.h>
#include <wasmbox/engine/engine.h>
#include <wasmbox/runtime/capabilities.h>
#include <wasmbox/runtime/outcome.h>
#include <wasmbox/runtime/output_buffer.h>
#include <wasmbox/runtime/supervisor.h>

using namespace wasmbox;

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static void expect_contains(const std::string& haystack, const std::string& needle)
{
    if (haystack.find(needle) == std::string::npos)
    {
        fail("expected to find '" + needle + "' in: " + haystack);
    }
}

static runtime::Failed expect_failed(const runtime::ExecutionOutcome& outcome, runtime::Stage stage)
{
    const auto* failed = std::get_if<runtime::Failed>(&outcome);
    if (failed == nullptr)
    {
        fail("expected a failed outcome");
    }
    if (failed->stage != stage)
    {
        fail("expected stage " + std::string(runtime::to_string(stage)) + ", got " +
             std::string(runtime::to_string(failed->stage)) + ": " + failed->message);
    }
    return *failed;
}

static const runtime::Completed& expect_completed(const runtime::ExecutionOutcome& outcome)
{
    if (const auto* f = std::get_if<runtime::Failed>(&outcome))
    {
        fail("component failed: " + f->message);
    }
    if (const auto* t = std::get_if<runtime::Trapped>(&outcome))
    {
        fail("component trapped: " + t->message);
    }
    return std::get<runtime::Completed>(outcome);
}

static void expect_completed(runtime::ExecutionOutcome&&) = delete;

int main()
{
    const runtime::SandboxLimits limits;
    const runtime::Supervisor supervisor(limits, runtime::Profile::Component);

    // Hello world through wasi:cli/stdout and wasi:io/streams.
    {
        const auto outcome = supervisor.execute(test::wasi_p2_command("hello from p2\n"), {});
        const auto& done = expect_completed(outcome);
        if (done.output.stdout_bytes != "hello from p2\n" || !done.output.stderr_bytes.empty())
        {
            fail("expected the guest's text on stdout, got: " + done.output.stdout_bytes);
        }
        if (done.exit_code != 0 || done.entry != runtime::EntryKind::ComponentRun)
        {
            fail("expected wasi:cli/run to complete with exit code 0");
        }
        if (done.fuel_consumed == 0)
        {
            fail("expected component instructions to be counted");
        }
    }

    // `run` returning err maps to exit code 1.
    {
        test::CommandOptions options;
        options.run_fails = true;
        const auto outcome = supervisor.execute(test::wasi_p2_command("x", options), {});
        const auto& done = expect_completed(outcome);
        if (done.exit_code != 1 || done.output.stdout_bytes != "x")
        {
            fail("expected an err result to complete with exit code 1");
        }
    }

    // wasi:cli/exit ends the run; output written before it is kept.
    {
        test::CommandOptions failing;
        failing.exit_with_error = true;
        const auto outcome = supervisor.execute(test::wasi_p2_command("bye", failing), {});
        const auto& done = expect_completed(outcome);
        if (done.exit_code != 1 || done.output.stdout_bytes != "bye")
        {
            fail("expected exit with an error status to complete with exit code 1");
        }

        test::CommandOptions ok;
        ok.exit_with_error = false;
        ok.run_fails = true;
        const auto clean = supervisor.execute(test::wasi_p2_command("", ok), {});
        if (expect_completed(clean).exit_code != 0)
        {
            fail("expected exit(ok) to win over the later return value");
        }
    }

    // Lowering a function that reads guest memory without the `memory` option never validates.
    {
        test::CommandOptions options;
        options.lower_with_memory = false;
        const auto failed =
            expect_failed(supervisor.execute(test::wasi_p2_command("x", options), {}),
                          runtime::Stage::Compilation);
        expect_contains(failed.message, "memory");
    }

    // Interfaces the host does not provide are link errors naming the import.
    {
        test::CommandOptions options;
        options.stdout_interface = "wasi:gpu/compute@0.2.0";
        const auto failed =
            expect_failed(supervisor.execute(test::wasi_p2_command("x", options), {}),
                          runtime::Stage::Linking);
        expect_contains(failed.message, "wasi:gpu/compute@0.2.0");

        options.stdout_interface = "acme:thing/api@1.0.0";
        const auto foreign =
            expect_failed(supervisor.execute(test::wasi_p2_command("x", options), {}),
                          runtime::Stage::Linking);
        expect_contains(foreign.message, "acme:thing/api@1.0.0");
    }

    // The profile decides the binary format; a mismatch is a compilation failure.
    {
        const auto core = expect_failed(supervisor.execute(test::preview1_writer("hi"), {}),
                                        runtime::Stage::Compilation);
        expect_contains(core.message, "not a component");

        const runtime::Supervisor modules(limits, runtime::Profile::Module);
        const auto component = expect_failed(modules.execute(test::wasi_p2_command("hi"), {}),
                                             runtime::Stage::Compilation);
        expect_contains(component.message, "not a core module");

        const auto bare = expect_failed(supervisor.execute(test::wat("(component)"), {}),
                                        runtime::Stage::EntryResolution);
        expect_contains(bare.message, "wasi:cli/run");
    }

    // Arguments and environment reach the guest's WASI context; captured output stays isolated.
    {
        runtime::ExecutionOptions options;
        options.args = {"prog", "--flag"};
        options.env = {{"GREETING", "hi"}};
        const auto first = supervisor.execute(test::wasi_p2_command("one"), options);
        const auto second = supervisor.execute(test::wasi_p2_command("two"), options);
        if (expect_completed(first).output.stdout_bytes != "one" ||
            expect_completed(second).output.stdout_bytes != "two")
        {
            fail("expected each run to capture only its own stdout");
        }
    }

    // Output past the capture capacity is dropped and flagged, never an error for the guest.
    {
        runtime::SandboxLimits small;
        small.output_capacity_bytes = 4;
        const runtime::Supervisor tight(small, runtime::Profile::Component);
        const auto outcome = tight.execute(test::wasi_p2_command("truncated"), {});
        const auto& done = expect_completed(outcome);
        if (done.output.stdout_bytes != "trun" || !done.output.stdout_truncated)
        {
            fail("expected stdout to be cut at capacity: " + done.output.stdout_bytes);
        }
    }

    {
        runtime::OutputBuffer out(64);
        runtime::OutputBuffer err(64);
        engine::Engine engine(limits);
        wasmtime::Store store(engine.handle());

        runtime::CapabilitySet inherited;
        inherited.stdio = runtime::InheritedStdio{};
        const auto refused = engine::attach_wasi(store, inherited);
        if (!refused.has_value())
        {
            fail("expected inherited stdio to be refused");
        }
        expect_contains(*refused, "inherited stdio");

        runtime::CapabilitySet half;
        half.stdio = runtime::CapturedStdio{.out = &out, .err = nullptr};
        const auto incomplete = engine::attach_wasi(store, half);
        if (!incomplete.has_value())
        {
            fail("expected captured stdio without a stderr buffer to be refused");
        }

        runtime::CapabilitySet captured;
        captured.stdio = runtime::CapturedStdio{.out = &out, .err = &err};
        if (const auto attached = engine::attach_wasi(store, captured))
        {
            fail("expected captured stdio to attach: " + *attached);
        }
    }

    std::cout << "OK\n";
    return 0;
}
