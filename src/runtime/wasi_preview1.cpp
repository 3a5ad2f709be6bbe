#include <chrono>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <wasmbox/runtime/guest_memory.h>
#include <wasmbox/runtime/wasi_preview1.h>

namespace wasmbox::runtime
{

namespace
{

using wasmtime::ValKind;
constexpr ValKind I32 = ValKind::I32;
constexpr ValKind I64 = ValKind::I64;

constexpr std::uint8_t kFiletypeCharacterDevice = 2;
constexpr std::uint16_t kFdflagAppend = 1;
constexpr std::uint64_t kRightFdRead = 1ull << 1;
constexpr std::uint64_t kRightFdWrite = 1ull << 6;

constexpr std::uint32_t kClockRealtime = 0;
constexpr std::uint32_t kClockThreadCputime = 3;

/** @brief Per-run state shared by every preview1 function of one sandbox. */
struct Preview1State
{
    const CapabilitySet* caps = nullptr;
    OutputBuffer* out = nullptr;
    OutputBuffer* err = nullptr;
    std::vector<std::string> environ;
    std::mt19937_64 rng;
};

/** @brief Arguments, results and caller of one host function invocation. */
class HostCall
{
  public:
    HostCall(wasmtime::Caller& caller, wasmtime::Span<const wasmtime::Val> args,
             wasmtime::Span<wasmtime::Val> results)
        : caller_(caller), args_(args), results_(results)
    {
    }

    [[nodiscard]] std::int32_t i32(std::size_t i) const { return args_[i].i32(); }
    [[nodiscard]] std::uint32_t u32(std::size_t i) const
    {
        return static_cast<std::uint32_t>(args_[i].i32());
    }
    void set_i32(std::size_t i, std::int32_t v) { results_[i] = wasmtime::Val(v); }

    /** @brief The caller's exported `memory`, if it has one. */
    [[nodiscard]] std::optional<GuestMemory> memory()
    {
        auto exported = caller_.get_export("memory");
        if (!exported.has_value())
        {
            return std::nullopt;
        }
        auto* mem = std::get_if<wasmtime::Memory>(&*exported);
        if (mem == nullptr)
        {
            return std::nullopt;
        }
        auto bytes = mem->data(caller_.context());
        return GuestMemory(bytes.data(), bytes.size());
    }

  private:
    wasmtime::Caller& caller_;
    wasmtime::Span<const wasmtime::Val> args_;
    wasmtime::Span<wasmtime::Val> results_;
};

using HostFunction = std::function<std::optional<wasmtime::Trap>(HostCall&)>;

/** @brief Wraps a body that needs guest memory; missing memory is a trap. */
template <typename F>
HostFunction with_memory(F body)
{
    return [body = std::move(body)](HostCall& call) -> std::optional<wasmtime::Trap>
    {
        auto mem = call.memory();
        if (!mem.has_value())
        {
            return wasmtime::Trap("wasi function requires the caller to export `memory`");
        }
        call.set_i32(0, body(call, *mem));
        return std::nullopt;
    };
}

/** @brief Host function that only answers with an errno computed from its arguments. */
template <typename F>
HostFunction errno_only(F body)
{
    return [body = std::move(body)](HostCall& call) -> std::optional<wasmtime::Trap>
    {
        call.set_i32(0, body(call));
        return std::nullopt;
    };
}

// Layout shared by args_* and environ_*: an array of pointers plus a packed buffer of
// NUL-terminated strings.
std::int32_t write_string_list(GuestMemory& mem, const std::vector<std::string>& items,
                               std::uint32_t ptrs, std::uint32_t buf)
{
    std::uint64_t cursor = buf;
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        if (!mem.write<std::uint32_t>(ptrs + 4ull * i, static_cast<std::uint32_t>(cursor)))
        {
            return wasi_errno::kFault;
        }
        const std::string& s = items[i];
        if (!mem.write_bytes(cursor, s) || !mem.write<std::uint8_t>(cursor + s.size(), 0))
        {
            return wasi_errno::kFault;
        }
        cursor += s.size() + 1;
    }
    return wasi_errno::kSuccess;
}

std::int32_t write_list_sizes(GuestMemory& mem, const std::vector<std::string>& items,
                              std::uint32_t count_ptr, std::uint32_t size_ptr)
{
    std::uint64_t total = 0;
    for (const std::string& s : items)
    {
        total += s.size() + 1;
    }
    if (!mem.write<std::uint32_t>(count_ptr, static_cast<std::uint32_t>(items.size())) ||
        !mem.write<std::uint32_t>(size_ptr, static_cast<std::uint32_t>(total)))
    {
        return wasi_errno::kFault;
    }
    return wasi_errno::kSuccess;
}

std::uint64_t now_ns(std::uint32_t clock)
{
    using namespace std::chrono;
    if (clock == kClockRealtime)
    {
        return static_cast<std::uint64_t>(
            duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count());
    }
    return static_cast<std::uint64_t>(
        duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count());
}

struct DeniedSignature
{
    const char* name;
    std::vector<ValKind> params;
};

// Filesystem and socket surface: linkable, never usable.
const std::vector<DeniedSignature>& denied_functions()
{
    static const std::vector<DeniedSignature> table = {
        {"fd_advise", {I32, I64, I64, I32}},
        {"fd_allocate", {I32, I64, I64}},
        {"fd_datasync", {I32}},
        {"fd_sync", {I32}},
        {"fd_fdstat_set_rights", {I32, I64, I64}},
        {"fd_filestat_get", {I32, I32}},
        {"fd_filestat_set_size", {I32, I64}},
        {"fd_filestat_set_times", {I32, I64, I64, I32}},
        {"fd_pread", {I32, I32, I32, I64, I32}},
        {"fd_pwrite", {I32, I32, I32, I64, I32}},
        {"fd_readdir", {I32, I32, I32, I64, I32}},
        {"fd_renumber", {I32, I32}},
        {"path_create_directory", {I32, I32, I32}},
        {"path_filestat_get", {I32, I32, I32, I32, I32}},
        {"path_filestat_set_times", {I32, I32, I32, I32, I64, I64, I32}},
        {"path_link", {I32, I32, I32, I32, I32, I32, I32}},
        {"path_open", {I32, I32, I32, I32, I32, I64, I64, I32, I32}},
        {"path_readlink", {I32, I32, I32, I32, I32, I32}},
        {"path_remove_directory", {I32, I32, I32}},
        {"path_rename", {I32, I32, I32, I32, I32, I32}},
        {"path_symlink", {I32, I32, I32, I32, I32}},
        {"path_unlink_file", {I32, I32, I32}},
        {"sock_accept", {I32, I32, I32}},
        {"sock_recv", {I32, I32, I32, I32, I32, I32}},
        {"sock_send", {I32, I32, I32, I32, I32}},
        {"sock_shutdown", {I32, I32}},
    };
    return table;
}

/** @brief Defines functions of the preview1 module; the first failure sticks. */
class Definer
{
  public:
    explicit Definer(wasmtime::Linker& linker) : linker_(linker) {}

    void define(const char* name, const std::vector<ValKind>& params,
                const std::vector<ValKind>& results, HostFunction fn)
    {
        if (error_.has_value())
        {
            return;
        }
        const std::vector<wasmtime::ValType> p(params.begin(), params.end());
        const std::vector<wasmtime::ValType> r(results.begin(), results.end());
        auto defined = linker_.func_new(
            kPreview1Module, name, wasmtime::FuncType::from_iters(p, r),
            [fn = std::move(fn)](wasmtime::Caller caller, wasmtime::Span<const wasmtime::Val> args,
                                 wasmtime::Span<wasmtime::Val> out)
                -> wasmtime::Result<std::monostate, wasmtime::Trap>
            {
                HostCall call(caller, args, out);
                if (auto trap = fn(call))
                {
                    return std::move(*trap);
                }
                return std::monostate();
            });
        if (!defined)
        {
            error_ = LinkError{std::string(kPreview1Module) + "::" + name + ": " +
                               defined.err().message()};
        }
    }

    [[nodiscard]] std::optional<LinkError> error() const { return error_; }

  private:
    wasmtime::Linker& linker_;
    std::optional<LinkError> error_;
};

} // namespace

std::optional<LinkError> link_preview1(wasmtime::Linker& linker, const CapabilitySet& caps,
                                       ExitRecord& exit)
{
    if (std::holds_alternative<InheritedStdio>(caps.stdio))
    {
        return LinkError{"inherited stdio is not permitted"};
    }
    const auto& captured = std::get<CapturedStdio>(caps.stdio);
    if (captured.out == nullptr || captured.err == nullptr)
    {
        return LinkError{"captured stdio requires both output buffers"};
    }

    auto state = std::make_shared<Preview1State>();
    state->caps = &caps;
    state->out = captured.out;
    state->err = captured.err;
    for (const auto& [key, value] : caps.env)
    {
        state->environ.push_back(key + "=" + value);
    }
    std::random_device seed;
    state->rng.seed((static_cast<std::uint64_t>(seed()) << 32) | seed());

    Definer link(linker);

    link.define("args_sizes_get", {I32, I32}, {I32},
                with_memory([state](HostCall& call, GuestMemory& mem)
                            { return write_list_sizes(mem, state->caps->args, call.u32(0), call.u32(1)); }));
    link.define("args_get", {I32, I32}, {I32},
                with_memory([state](HostCall& call, GuestMemory& mem)
                            { return write_string_list(mem, state->caps->args, call.u32(0), call.u32(1)); }));
    link.define("environ_sizes_get", {I32, I32}, {I32},
                with_memory([state](HostCall& call, GuestMemory& mem)
                            { return write_list_sizes(mem, state->environ, call.u32(0), call.u32(1)); }));
    link.define("environ_get", {I32, I32}, {I32},
                with_memory([state](HostCall& call, GuestMemory& mem)
                            { return write_string_list(mem, state->environ, call.u32(0), call.u32(1)); }));

    link.define("fd_write", {I32, I32, I32, I32}, {I32},
                with_memory(
                    [state](HostCall& call, GuestMemory& mem) -> std::int32_t
                    {
                        OutputBuffer* target = nullptr;
                        switch (call.u32(0))
                        {
                        case 1:
                            target = state->out;
                            break;
                        case 2:
                            target = state->err;
                            break;
                        default:
                            return wasi_errno::kBadf;
                        }
                        const std::uint64_t iovs = call.u32(1);
                        const std::uint32_t count = call.u32(2);
                        // Check every iovec first so a rejected call writes nothing.
                        std::uint64_t written = 0;
                        for (std::uint32_t i = 0; i < count; ++i)
                        {
                            const auto base = mem.read<std::uint32_t>(iovs + 8ull * i);
                            const auto len = mem.read<std::uint32_t>(iovs + 8ull * i + 4);
                            if (!base || !len || !mem.in_bounds(*base, *len))
                            {
                                return wasi_errno::kFault;
                            }
                            written += *len;
                        }
                        // The count is reported as a u32.
                        if (written > std::numeric_limits<std::uint32_t>::max())
                        {
                            return wasi_errno::kOverflow;
                        }
                        for (std::uint32_t i = 0; i < count; ++i)
                        {
                            const auto base = *mem.read<std::uint32_t>(iovs + 8ull * i);
                            const auto len = *mem.read<std::uint32_t>(iovs + 8ull * i + 4);
                            // Bytes past capacity are dropped but still reported as written,
                            // so the guest does not retry forever.
                            (void)target->append(*mem.read_bytes(base, len));
                        }
                        if (!mem.write<std::uint32_t>(call.u32(3),
                                                      static_cast<std::uint32_t>(written)))
                        {
                            return wasi_errno::kFault;
                        }
                        return wasi_errno::kSuccess;
                    }));

    link.define("fd_read", {I32, I32, I32, I32}, {I32},
                with_memory(
                    [](HostCall& call, GuestMemory& mem) -> std::int32_t
                    {
                        if (call.u32(0) != 0)
                        {
                            return wasi_errno::kBadf;
                        }
                        return mem.write<std::uint32_t>(call.u32(3), 0) ? wasi_errno::kSuccess
                                                                        : wasi_errno::kFault;
                    }));

    link.define("fd_close", {I32}, {I32},
                errno_only([](HostCall& call)
                           { return call.u32(0) <= 2 ? wasi_errno::kSuccess : wasi_errno::kBadf; }));

    link.define("fd_seek", {I32, I64, I32, I32}, {I32},
                errno_only([](HostCall& call)
                           { return call.u32(0) <= 2 ? wasi_errno::kSpipe : wasi_errno::kBadf; }));
    link.define("fd_tell", {I32, I32}, {I32},
                errno_only([](HostCall& call)
                           { return call.u32(0) <= 2 ? wasi_errno::kSpipe : wasi_errno::kBadf; }));

    link.define("fd_fdstat_get", {I32, I32}, {I32},
                with_memory(
                    [](HostCall& call, GuestMemory& mem) -> std::int32_t
                    {
                        const std::uint32_t fd = call.u32(0);
                        if (fd > 2)
                        {
                            return wasi_errno::kBadf;
                        }
                        const std::uint64_t p = call.u32(1);
                        const std::uint64_t rights = fd == 0 ? kRightFdRead : kRightFdWrite;
                        const std::uint16_t flags = fd == 0 ? 0 : kFdflagAppend;
                        if (!mem.in_bounds(p, 24))
                        {
                            return wasi_errno::kFault;
                        }
                        (void)mem.write<std::uint64_t>(p, 0);
                        (void)mem.write<std::uint8_t>(p, kFiletypeCharacterDevice);
                        (void)mem.write<std::uint16_t>(p + 2, flags);
                        (void)mem.write<std::uint64_t>(p + 8, rights);
                        (void)mem.write<std::uint64_t>(p + 16, 0);
                        return wasi_errno::kSuccess;
                    }));
    link.define("fd_fdstat_set_flags", {I32, I32}, {I32},
                errno_only([](HostCall& call)
                           { return call.u32(0) <= 2 ? wasi_errno::kSuccess : wasi_errno::kBadf; }));

    // No preopened directories exist.
    link.define("fd_prestat_get", {I32, I32}, {I32},
                errno_only([](HostCall&) { return wasi_errno::kBadf; }));
    link.define("fd_prestat_dir_name", {I32, I32, I32}, {I32},
                errno_only([](HostCall&) { return wasi_errno::kBadf; }));

    link.define("clock_res_get", {I32, I32}, {I32},
                with_memory(
                    [](HostCall& call, GuestMemory& mem) -> std::int32_t
                    {
                        if (call.u32(0) > kClockThreadCputime)
                        {
                            return wasi_errno::kInval;
                        }
                        return mem.write<std::uint64_t>(call.u32(1), 1) ? wasi_errno::kSuccess
                                                                        : wasi_errno::kFault;
                    }));
    link.define("clock_time_get", {I32, I64, I32}, {I32},
                with_memory(
                    [](HostCall& call, GuestMemory& mem) -> std::int32_t
                    {
                        const std::uint32_t clock = call.u32(0);
                        if (clock > kClockThreadCputime)
                        {
                            return wasi_errno::kInval;
                        }
                        return mem.write<std::uint64_t>(call.u32(2), now_ns(clock))
                                   ? wasi_errno::kSuccess
                                   : wasi_errno::kFault;
                    }));

    link.define("random_get", {I32, I32}, {I32},
                with_memory(
                    [state](HostCall& call, GuestMemory& mem) -> std::int32_t
                    {
                        const std::uint64_t buf = call.u32(0);
                        const std::uint64_t len = call.u32(1);
                        if (!mem.in_bounds(buf, len))
                        {
                            return wasi_errno::kFault;
                        }
                        std::uint8_t* p = mem.ptr(buf);
                        for (std::uint64_t i = 0; i < len; ++i)
                        {
                            p[i] = static_cast<std::uint8_t>(state->rng());
                        }
                        return wasi_errno::kSuccess;
                    }));

    link.define("sched_yield", {}, {I32},
                errno_only([](HostCall&) { return wasi_errno::kSuccess; }));
    link.define("poll_oneoff", {I32, I32, I32, I32}, {I32},
                errno_only([](HostCall&) { return wasi_errno::kNotsup; }));
    link.define("proc_raise", {I32}, {I32},
                errno_only([](HostCall&) { return wasi_errno::kNotsup; }));
    link.define("proc_exit", {I32}, {},
                [&exit](HostCall& call) -> std::optional<wasmtime::Trap>
                {
                    exit.code = call.i32(0);
                    return wasmtime::Trap("guest exited with code " + std::to_string(call.i32(0)));
                });

    for (const DeniedSignature& denied : denied_functions())
    {
        link.define(denied.name, denied.params, {I32},
                    errno_only(
                        [](HostCall& call)
                        {
                            return call.u32(0) <= 2 ? wasi_errno::kNotcapable : wasi_errno::kBadf;
                        }));
    }
    return link.error();
}

} // namespace wasmbox::runtime
