#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include <wasm_builder.h>
#include <wasmbox/runtime/cancel.h>
#include <wasmbox/runtime/outcome.h>
#include <wasmbox/runtime/supervisor.h>
#include <wasmbox/server/http.h>
#include <wasmbox/server/log.h>
#include <wasmbox/server/router.h>

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

static server::Request request(const std::string& method, const std::string& path,
                               std::string body = {})
{
    server::Request r;
    r.method = method;
    r.target = path;
    r.path = path;
    r.body = std::move(body);
    return r;
}

static std::string bytes_to_string(const std::vector<std::uint8_t>& bytes)
{
    return std::string(bytes.begin(), bytes.end());
}

int main()
{
    runtime::SandboxLimits limits;
    limits.timeout_ms = 2000;
    const runtime::Supervisor supervisor(limits, runtime::Profile::Module);
    std::ostringstream sink;
    server::DiagnosticLog log(sink);
    const server::Router router(supervisor, log);

    {
        auto req = request("GET", "/");
        const auto res = router.handle(req, nullptr);
        if (res.status != 200 || res.body != server::usage_text())
        {
            fail("expected the usage text on GET /");
        }
        expect_contains(res.body, "POST /execute-wasm");
    }

    {
        auto req = request("POST", "/log", "hello there");
        const auto res = router.handle(req, nullptr);
        if (res.status != 200 || res.body != "Message logged successfully\n")
        {
            fail("expected /log to acknowledge the message");
        }
        expect_contains(sink.str(), "[LOG] Received message: hello there\n");

        // A rejected message leaves the diagnostic stream untouched.
        const std::string before = sink.str();
        auto bad = request("POST", "/log", std::string("\xC3\x28", 2));
        const auto rejected = router.handle(bad, nullptr);
        if (rejected.status != 400 || rejected.body != "Invalid UTF-8 in request body\n")
        {
            fail("expected invalid UTF-8 to be rejected");
        }
        if (sink.str() != before)
        {
            fail("expected nothing appended after a rejection, got: " + sink.str().substr(before.size()));
        }
    }

    {
        std::ostringstream fresh;
        server::DiagnosticLog quiet(fresh);
        const server::Router strict(supervisor, quiet);
        auto bad = request("POST", "/log", std::string("\xFF\xFE", 2));
        if (strict.handle(bad, nullptr).status != 400 || !fresh.str().empty())
        {
            fail("expected an invalid message to be refused without logging anything");
        }
    }

    // Methods and paths must both match.
    {
        const std::pair<std::string, std::string> misses[] = {
            {"GET", "/log"}, {"POST", "/"}, {"GET", "/execute-wasm"}, {"POST", "/missing"}};
        for (const auto& [method, path] : misses)
        {
            auto req = request(method, path);
            const auto res = router.handle(req, nullptr);
            if (res.status != 404 || res.body != "Not Found\n")
            {
                fail("expected 404 for " + method + " " + path);
            }
        }
    }

    {
        auto req = request("POST", "/execute-wasm",
                           bytes_to_string(test::preview1_writer("Hello, World!\n")));
        const auto res = router.handle(req, nullptr);
        if (res.status != 200)
        {
            fail("expected 200 for a completed run, got " + std::to_string(res.status));
        }
        expect_contains(res.body, "status: completed\n");
        expect_contains(res.body, "-- stdout --\nHello, World!\n");
        if (!req.body.empty())
        {
            fail("expected the payload to be released after the run");
        }
        expect_contains(sink.str(), "[exec] 200 completed exit=0");
    }

    {
        auto req = request("POST", "/execute-wasm",
                           bytes_to_string(test::preview1_writer("so far", "", true)));
        const auto res = router.handle(req, nullptr);
        if (res.status != 200)
        {
            fail("expected a trapped run to answer 200");
        }
        expect_contains(res.body, "status: trapped\n");
        expect_contains(res.body, "so far");
    }

    {
        auto req = request("POST", "/execute-wasm", "not wasm");
        const auto res = router.handle(req, nullptr);
        if (res.status != 400)
        {
            fail("expected a malformed payload to answer 400");
        }
        expect_contains(res.body, "WASM error: compilation: ");
    }

    {
        runtime::CancelToken token;
        token.cancel(runtime::CancelReason::Requested);
        auto req = request("POST", "/execute-wasm", bytes_to_string(test::preview1_writer("x")));
        const auto res = router.handle(req, &token);
        if (res.status != 503 || res.body != "WASM error: cancellation: execution cancelled: "
                                              "cancellation requested\n")
        {
            fail("expected a cancelled run to answer 503, got: " + res.body);
        }
    }

    {
        if (server::http_status(runtime::Failed{.stage = runtime::Stage::Linking}) != 400 ||
            server::http_status(runtime::Failed{.stage = runtime::Stage::EntryResolution}) != 400 ||
            server::http_status(runtime::Trapped{}) != 200)
        {
            fail("unexpected status mapping");
        }
    }

    std::cout << "OK\n";
    return 0;
}
