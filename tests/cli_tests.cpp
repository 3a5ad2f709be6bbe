#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <wasm_builder.h>
#include <wasmbox/cli/cli.h>

namespace fs = std::filesystem;
using namespace wasmbox;
using test::Code;
using test::ModuleBuilder;
using test::ValType;

[[noreturn]] static void fail(const std::string& msg)
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

static int run_cli_capture(std::vector<std::string> argv_storage, std::string& out,
                           std::string& err)
{
    std::ostringstream captured_out;
    std::ostringstream captured_err;

    auto* old_out = std::cout.rdbuf(captured_out.rdbuf());
    auto* old_err = std::cerr.rdbuf(captured_err.rdbuf());

    std::vector<char*> argv;
    argv.reserve(argv_storage.size());
    for (auto& s : argv_storage)
    {
        argv.push_back(s.data());
    }

    const int rc = wasmbox::cli::run(static_cast<int>(argv.size()), argv.data());

    std::cout.rdbuf(old_out);
    std::cerr.rdbuf(old_err);

    out = captured_out.str();
    err = captured_err.str();
    return rc;
}

static fs::path write_temp(const std::string& name, const test::Bytes& bytes)
{
    const fs::path path = fs::temp_directory_path() / ("wasmbox_cli_tests_" + name);
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    if (!file)
    {
        fail("cannot write " + path.string());
    }
    return path;
}

/** @brief `main` returning `n`. */
static test::Bytes returning(std::int32_t n)
{
    ModuleBuilder b;
    b.export_func("main", b.func(b.type({}, {ValType::I32}), Code().i32_const(n)));
    return b.build();
}

/** @brief `main` returning `argc * 10 + environ count`. */
static test::Bytes count_args_and_env()
{
    ModuleBuilder b;
    const auto t_sizes = b.type({ValType::I32, ValType::I32}, {ValType::I32});
    const auto args_sizes = b.import_func("wasi_snapshot_preview1", "args_sizes_get", t_sizes);
    const auto env_sizes = b.import_func("wasi_snapshot_preview1", "environ_sizes_get", t_sizes);
    b.memory(1);
    b.export_memory("memory");
    Code c;
    c.i32_const(0).i32_const(4).call(args_sizes).drop();
    c.i32_const(8).i32_const(12).call(env_sizes).drop();
    c.i32_const(0).i32_load().i32_const(10).i32_mul();
    c.i32_const(8).i32_load().i32_add();
    b.export_func("main", b.func(b.type({}, {ValType::I32}), c));
    return b.build();
}

int main()
{
    std::string out;
    std::string err;

    {
        if (run_cli_capture({"wasmbox", "--help"}, out, err) != 0)
        {
            fail("expected --help to succeed");
        }
        expect_contains(out, "usage:");
        expect_contains(out, "wasmbox serve");

        if (run_cli_capture({"wasmbox"}, out, err) != 2 || !out.empty())
        {
            fail("expected no arguments to be a usage error");
        }
        expect_contains(err, "usage:");

        if (run_cli_capture({"wasmbox", "frobnicate"}, out, err) != 2)
        {
            fail("expected an unknown command to be a usage error");
        }
        expect_contains(err, "unknown command: frobnicate");
    }

    {
        if (run_cli_capture({"wasmbox", "run"}, out, err) != 2)
        {
            fail("expected run without a file to be a usage error");
        }
        expect_contains(err, "expected <file.wasm>");

        if (run_cli_capture({"wasmbox", "run", "--profile", "bogus", "x.wasm"}, out, err) != 2)
        {
            fail("expected a bad profile to be a usage error");
        }
        expect_contains(err, "--profile: expected 'module' or 'component', got 'bogus'");

        if (run_cli_capture({"wasmbox", "run", "--env", "NOEQUALS", "x.wasm"}, out, err) != 2)
        {
            fail("expected a malformed --env to be a usage error");
        }
        if (run_cli_capture({"wasmbox", "run", "--fuel"}, out, err) != 2)
        {
            fail("expected a missing flag value to be a usage error");
        }
        if (run_cli_capture({"wasmbox", "run", "--verbose", "x.wasm"}, out, err) != 2)
        {
            fail("expected an unknown option to be a usage error");
        }
        if (run_cli_capture({"wasmbox", "serve", "--port", "99999"}, out, err) != 2)
        {
            fail("expected an out-of-range port to be a usage error");
        }
        expect_contains(err, "--port");
    }

    {
        const std::string missing = (fs::temp_directory_path() / "wasmbox_cli_tests_absent.wasm").string();
        if (run_cli_capture({"wasmbox", "run", missing}, out, err) != 1)
        {
            fail("expected a missing file to fail");
        }
        expect_contains(err, "error: cannot read " + missing);
    }

    {
        const fs::path hello = write_temp("hello.wasm", test::preview1_writer("Hello, CLI!\n", "note\n"));
        if (run_cli_capture({"wasmbox", "run", hello.string()}, out, err) != 0)
        {
            fail("expected hello.wasm to exit 0; stderr: " + err);
        }
        expect_contains(out, "status: completed\n");
        expect_contains(out, "-- stdout --\nHello, CLI!\n");
        expect_contains(out, "-- stderr --\nnote\n");

        // The bare file form runs it too.
        if (run_cli_capture({"wasmbox", hello.string()}, out, err) != 0)
        {
            fail("expected `wasmbox file.wasm` to run the file");
        }
        expect_contains(out, "Hello, CLI!");
        fs::remove(hello);
    }

    // The guest's exit code becomes the process exit code, kept non-zero.
    {
        const fs::path seven = write_temp("seven.wasm", returning(7));
        if (run_cli_capture({"wasmbox", "run", seven.string()}, out, err) != 7)
        {
            fail("expected exit code 7");
        }
        expect_contains(out, "exit code: 7\n");
        fs::remove(seven);

        const fs::path wraps = write_temp("wraps.wasm", returning(256));
        if (run_cli_capture({"wasmbox", "run", wraps.string()}, out, err) != 1)
        {
            fail("expected exit code 256 to stay non-zero");
        }
        fs::remove(wraps);
    }

    {
        const fs::path trap = write_temp("trap.wasm", test::preview1_writer("before\n", "", true));
        if (run_cli_capture({"wasmbox", "run", trap.string()}, out, err) != 0)
        {
            fail("expected a trapped run to report and exit 0");
        }
        expect_contains(out, "status: trapped\n");
        expect_contains(out, "trap: unreachable executed\n");
        expect_contains(out, "before\n");
        fs::remove(trap);

        const fs::path junk = write_temp("junk.wasm", test::Bytes{'j', 'u', 'n', 'k'});
        if (run_cli_capture({"wasmbox", "run", junk.string()}, out, err) != 1 || !out.empty())
        {
            fail("expected a malformed module to fail with nothing on stdout");
        }
        expect_contains(err, "WASM error: compilation: ");
        fs::remove(junk);
    }

    // Arguments after the file and --env entries are the guest's only view of the world.
    {
        const fs::path counter = write_temp("counter.wasm", count_args_and_env());
        if (run_cli_capture({"wasmbox", "run", "--env", "A=1", "--env=B=2", counter.string(), "x",
                             "--not-a-flag"},
                            out, err) != 32)
        {
            fail("expected 3 arguments and 2 environment entries; got: " + out + err);
        }
        fs::remove(counter);
    }

    {
        ModuleBuilder b;
        b.export_func("_start", b.func(b.type({}, {}), Code().loop().br(0).end()));
        const fs::path spin = write_temp("spin.wasm", b.build());
        if (run_cli_capture({"wasmbox", "run", "--fuel", "5000", spin.string()}, out, err) != 1)
        {
            fail("expected fuel exhaustion to fail the run");
        }
        expect_contains(err, "WASM error: cancellation: fuel exhausted");

        if (run_cli_capture({"wasmbox", "run", "--timeout-ms=100", spin.string()}, out, err) != 1)
        {
            fail("expected the timeout to fail the run");
        }
        expect_contains(err, "deadline exceeded");
        fs::remove(spin);
    }

    std::cout << "OK\n";
    return 0;
}
