#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <variant>
#include <vector>
#include <wasm_builder.h>
#include <wasmbox/runtime/capabilities.h>
#include <wasmbox/runtime/outcome.h>
#include <wasmbox/runtime/output_buffer.h>
#include <wasmbox/runtime/supervisor.h>
#include <wasmbox/runtime/wasi_preview1.h>
#include <wasmtime.hh>

using namespace wasmbox;
using test::Code;
using test::ModuleBuilder;
using test::ValType;

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static runtime::Completed expect_completed(const runtime::ExecutionOutcome& outcome,
                                           const std::string& what)
{
    if (const auto* t = std::get_if<runtime::Trapped>(&outcome))
    {
        fail(what + ": trapped: " + t->message);
    }
    if (const auto* f = std::get_if<runtime::Failed>(&outcome))
    {
        fail(what + ": failed: " + f->message);
    }
    return std::get<runtime::Completed>(outcome);
}

/**
 * @brief `main` that calls preview1 `fn` (whose i32 parameters are `args`) and returns
 * `errno * 1000 + load32(result_at)`.
 */
static test::Bytes call_and_report(const std::string& fn, const std::vector<ValType>& params,
                         const std::vector<std::int64_t>& args, std::uint32_t result_at)
{
    ModuleBuilder b;
    const auto t_fn = b.type(params, {ValType::I32});
    const auto imported = b.import_func("wasi_snapshot_preview1", fn, t_fn);
    const auto t_main = b.type({}, {ValType::I32});
    b.memory(1);
    b.export_memory("memory");
    Code c;
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        if (params[i] == ValType::I64)
        {
            c.i64_const(args[i]);
        }
        else
        {
            c.i32_const(static_cast<std::int32_t>(args[i]));
        }
    }
    c.call(imported).i32_const(1000).i32_mul();
    c.i32_const(static_cast<std::int32_t>(result_at)).i32_load().i32_add();
    b.export_func("main", b.func(t_main, c));
    return b.build();
}

int main()
{
    const runtime::SandboxLimits limits;
    const runtime::Supervisor supervisor(limits, runtime::Profile::Module);

    // fd_write to stdout and stderr; bytes-written is stored for the guest.
    {
        const auto done =
            expect_completed(supervisor.execute(test::preview1_writer("out\n", "err\n"), {}),
                             "writer");
        if (done.output.stdout_bytes != "out\n" || done.output.stderr_bytes != "err\n")
        {
            fail("expected stdout and stderr to be captured separately");
        }
        if (done.exit_code != 0 || done.entry != runtime::EntryKind::LegacyStart)
        {
            fail("expected _start to complete with exit code 0");
        }
    }

    // Writing to stdin or an unknown descriptor is EBADF.
    {
        ModuleBuilder b;
        const auto t_fn = b.type({ValType::I32, ValType::I32, ValType::I32, ValType::I32},
                                 {ValType::I32});
        const auto fd_write = b.import_func("wasi_snapshot_preview1", "fd_write", t_fn);
        b.memory(1);
        b.export_memory("memory");
        b.export_func("main", b.func(b.type({}, {ValType::I32}),
                                     Code().i32_const(7).i32_const(0).i32_const(0).i32_const(16).call(
                                         fd_write)));
        const auto done = expect_completed(supervisor.execute(b.build(), {}), "bad fd");
        if (done.exit_code != runtime::wasi_errno::kBadf)
        {
            fail("expected EBADF for fd 7, got " + std::to_string(done.exit_code));
        }
    }

    // An iovec pointing outside memory is EFAULT, not a trap.
    {
        ModuleBuilder b;
        const auto t_fn = b.type({ValType::I32, ValType::I32, ValType::I32, ValType::I32},
                                 {ValType::I32});
        const auto fd_write = b.import_func("wasi_snapshot_preview1", "fd_write", t_fn);
        b.memory(1);
        b.export_memory("memory");
        Code c;
        c.i32_const(0).i32_const(65530).i32_store();
        c.i32_const(0).i32_const(100).i32_store(4);
        c.i32_const(1).i32_const(0).i32_const(1).i32_const(16).call(fd_write);
        b.export_func("main", b.func(b.type({}, {ValType::I32}), c));
        const auto done = expect_completed(supervisor.execute(b.build(), {}), "efault");
        if (done.exit_code != runtime::wasi_errno::kFault)
        {
            fail("expected EFAULT, got " + std::to_string(done.exit_code));
        }
    }

    // A total length that does not fit the u32 result is EOVERFLOW and writes nothing.
    {
        constexpr std::int32_t kIovecs = 65537;
        ModuleBuilder b;
        const auto t_fn = b.type({ValType::I32, ValType::I32, ValType::I32, ValType::I32},
                                 {ValType::I32});
        const auto fd_write = b.import_func("wasi_snapshot_preview1", "fd_write", t_fn);
        b.memory(10);
        b.export_memory("memory");
        // Every iovec is {base 0, len 65536}; memory starts zeroed so only the lengths are stored.
        Code c;
        c.loop();
        c.local_get(0).i32_const(65536).i32_store(4);
        c.local_get(0).i32_const(8).i32_add().local_tee(0);
        c.i32_const(kIovecs * 8).i32_lt_s().br_if(0);
        c.end();
        c.i32_const(1).i32_const(0).i32_const(kIovecs).i32_const(600000).call(fd_write);
        b.export_func("main", b.func(b.type({}, {ValType::I32}), c, {ValType::I32}));
        const auto done = expect_completed(supervisor.execute(b.build(), {}), "overflow");
        if (done.exit_code != runtime::wasi_errno::kOverflow)
        {
            fail("expected EOVERFLOW, got " + std::to_string(done.exit_code));
        }
        if (!done.output.stdout_bytes.empty())
        {
            fail("expected an overflowing write to append nothing");
        }
    }

    // Arguments and environment come only from the execution options.
    {
        runtime::ExecutionOptions options;
        options.args = {"prog", "one", "two"};
        options.env = {{"A", "1"}, {"LONGER", "value"}};

        const auto argc = expect_completed(
            supervisor.execute(call_and_report("args_sizes_get", {ValType::I32, ValType::I32}, {0, 4}, 0),
                               options),
            "args_sizes_get");
        if (argc.exit_code != 3)
        {
            fail("expected argc 3, got " + std::to_string(argc.exit_code));
        }
        const auto argv_bytes = expect_completed(
            supervisor.execute(call_and_report("args_sizes_get", {ValType::I32, ValType::I32}, {0, 4}, 4),
                               options),
            "args buffer size");
        if (argv_bytes.exit_code != 13)
        {
            fail("expected 13 bytes of argv, got " + std::to_string(argv_bytes.exit_code));
        }
        const auto envc = expect_completed(
            supervisor.execute(
                call_and_report("environ_sizes_get", {ValType::I32, ValType::I32}, {0, 4}, 0), options),
            "environ_sizes_get");
        if (envc.exit_code != 2)
        {
            fail("expected 2 environment entries");
        }

        // The host environment is never visible to the guest.
        const auto empty = expect_completed(
            supervisor.execute(
                call_and_report("environ_sizes_get", {ValType::I32, ValType::I32}, {0, 4}, 0), {}),
            "empty environ");
        if (empty.exit_code != 0)
        {
            fail("expected an empty environment by default");
        }

        // args_get writes pointers then NUL-terminated strings; load the first byte of argv[1].
        ModuleBuilder b;
        const auto t_fn = b.type({ValType::I32, ValType::I32}, {ValType::I32});
        const auto args_get = b.import_func("wasi_snapshot_preview1", "args_get", t_fn);
        b.memory(1);
        b.export_memory("memory");
        Code c;
        c.i32_const(0).i32_const(64).call(args_get).drop();
        c.i32_const(4).i32_load().i32_load8_u();
        b.export_func("main", b.func(b.type({}, {ValType::I32}), c));
        const auto first = expect_completed(supervisor.execute(b.build(), options), "args_get");
        if (first.exit_code != 'o')
        {
            fail("expected argv[1] to start with 'o'");
        }
    }

    // Filesystem and sockets are linkable but not capable.
    {
        const auto path_open = expect_completed(
            supervisor.execute(call_and_report("path_open",
                                     {ValType::I32, ValType::I32, ValType::I32, ValType::I32,
                                      ValType::I32, ValType::I64, ValType::I64, ValType::I32,
                                      ValType::I32},
                                     {3, 0, 0, 0, 0, 0, 0, 0, 100}, 100),
                               {}),
            "path_open");
        if (path_open.exit_code != runtime::wasi_errno::kBadf * 1000)
        {
            fail("expected path_open on fd 3 to be EBADF, got " +
                 std::to_string(path_open.exit_code));
        }
        const auto prestat = expect_completed(
            supervisor.execute(call_and_report("fd_prestat_get", {ValType::I32, ValType::I32}, {3, 100}, 100),
                               {}),
            "fd_prestat_get");
        if (prestat.exit_code != runtime::wasi_errno::kBadf * 1000)
        {
            fail("expected no preopened directories");
        }
        const auto sock = expect_completed(
            supervisor.execute(call_and_report("sock_shutdown", {ValType::I32, ValType::I32}, {1, 0}, 100),
                               {}),
            "sock_shutdown");
        if (sock.exit_code != runtime::wasi_errno::kNotcapable * 1000)
        {
            fail("expected sock_shutdown to be ENOTCAPABLE");
        }
    }

    // Clocks and randomness succeed.
    {
        const auto clock = expect_completed(
            supervisor.execute(call_and_report("clock_time_get", {ValType::I32, ValType::I64, ValType::I32},
                                     {1, 0, 200}, 300),
                               {}),
            "clock_time_get");
        if (clock.exit_code != 0)
        {
            fail("expected clock_time_get to succeed");
        }
        const auto random = expect_completed(
            supervisor.execute(call_and_report("random_get", {ValType::I32, ValType::I32}, {200, 64}, 300),
                               {}),
            "random_get");
        if (random.exit_code != 0)
        {
            fail("expected random_get to succeed");
        }
        const auto bad_clock = expect_completed(
            supervisor.execute(call_and_report("clock_time_get", {ValType::I32, ValType::I64, ValType::I32},
                                     {9, 0, 200}, 300),
                               {}),
            "bad clock");
        if (bad_clock.exit_code != runtime::wasi_errno::kInval * 1000)
        {
            fail("expected EINVAL for an unknown clock");
        }
    }

    // proc_exit ends the run as completed with the guest's code.
    {
        ModuleBuilder b;
        const auto t_exit = b.type({ValType::I32}, {});
        const auto proc_exit = b.import_func("wasi_snapshot_preview1", "proc_exit", t_exit);
        b.memory(1);
        b.export_memory("memory");
        b.export_func("_start", b.func(b.type({}, {}), Code().i32_const(42).call(proc_exit).unreachable()));
        const auto done = expect_completed(supervisor.execute(b.build(), {}), "proc_exit");
        if (done.exit_code != 42)
        {
            fail("expected exit code 42");
        }
    }

    // A module importing something outside preview1 fails to link.
    {
        ModuleBuilder b;
        b.import_func("env", "host_magic", b.type({}, {}));
        b.export_func("_start", b.func(b.type({}, {}), Code()));
        const auto outcome = supervisor.execute(b.build(), {});
        const auto* failed = std::get_if<runtime::Failed>(&outcome);
        if (failed == nullptr || failed->stage != runtime::Stage::Linking ||
            failed->message.find("`env::host_magic`") == std::string::npos)
        {
            fail("expected a link failure naming env::host_magic");
        }
    }

    // A preview1 function without exported memory traps instead of touching host memory.
    {
        ModuleBuilder b;
        const auto t_fn = b.type({ValType::I32, ValType::I32}, {ValType::I32});
        const auto sizes = b.import_func("wasi_snapshot_preview1", "args_sizes_get", t_fn);
        b.export_func("_start",
                      b.func(b.type({}, {}), Code().i32_const(0).i32_const(4).call(sizes).drop()));
        const auto outcome = supervisor.execute(b.build(), {});
        const auto* trapped = std::get_if<runtime::Trapped>(&outcome);
        if (trapped == nullptr || trapped->message.find("export `memory`") == std::string::npos)
        {
            fail("expected a trap when the caller exports no memory");
        }
    }

    // Inherited stdio is representable but always refused.
    {
        runtime::CapabilitySet caps;
        caps.stdio = runtime::InheritedStdio{};
        wasmtime::Engine engine;
        wasmtime::Linker linker(engine);
        runtime::ExitRecord exit;
        const auto err = runtime::link_preview1(linker, caps, exit);
        if (!err.has_value() || err->message.find("inherited stdio") == std::string::npos)
        {
            fail("expected inherited stdio to be refused");
        }

        runtime::CapabilitySet no_buffers;
        const auto missing = runtime::link_preview1(linker, no_buffers, exit);
        if (!missing.has_value())
        {
            fail("expected captured stdio without buffers to be refused");
        }
    }

    std::cout << "OK\n";
    return 0;
}
