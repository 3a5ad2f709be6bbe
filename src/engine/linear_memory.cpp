#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <memory>
#include <new>
#include <string>
#include <sys/mman.h>
#include <variant>
#include <wasmbox/engine/linear_memory.h>

namespace wasmbox::engine
{

namespace
{

constexpr std::uint64_t kWasmPage = 64 * 1024;

thread_local MemoryWatch* current_watch = nullptr;

std::uint64_t round_to_page(std::uint64_t bytes)
{
    return (bytes + kWasmPage - 1) / kWasmPage * kWasmPage;
}

void report_limit(std::string message)
{
    if (current_watch != nullptr && !current_watch->limit_exceeded)
    {
        current_watch->limit_exceeded = true;
        current_watch->message = std::move(message);
    }
}

// Callbacks handed to the engine. None of them may let an exception escape.

std::uint8_t* get_memory(void* env, std::size_t* byte_size, std::size_t* byte_capacity)
{
    auto* mem = static_cast<LinearMemory*>(env);
    *byte_size = static_cast<std::size_t>(mem->size());
    *byte_capacity = static_cast<std::size_t>(mem->reserved());
    return mem->data();
}

wasmtime_error_t* grow_memory(void* env, std::size_t new_size)
{
    auto* mem = static_cast<LinearMemory*>(env);
    switch (mem->grow_to(new_size))
    {
    case GrowOutcome::Ok:
        return nullptr;
    case GrowOutcome::LimitExceeded:
        return wasmtime_error_new("memory limit exceeded");
    case GrowOutcome::Refused:
        break;
    }
    return wasmtime_error_new("linear memory cannot grow");
}

void delete_memory(void* env)
{
    delete static_cast<LinearMemory*>(env);
}

wasmtime_error_t* new_memory(void* env, const wasm_memorytype_t*, std::size_t minimum,
                             std::size_t maximum, std::size_t reserved_size_in_bytes,
                             std::size_t guard_size_in_bytes, wasmtime_linear_memory_t* out)
{
    const auto* limits = static_cast<const runtime::SandboxLimits*>(env);
    std::variant<std::unique_ptr<LinearMemory>, std::string> created;
    try
    {
        created = LinearMemory::create(minimum, maximum, reserved_size_in_bytes,
                                       guard_size_in_bytes, *limits);
    }
    catch (const std::bad_alloc&)
    {
        return wasmtime_error_new("out of host memory while creating a linear memory");
    }
    if (auto* err = std::get_if<std::string>(&created))
    {
        return wasmtime_error_new(err->c_str());
    }
    out->env = std::get<std::unique_ptr<LinearMemory>>(created).release();
    out->get_memory = get_memory;
    out->grow_memory = grow_memory;
    out->finalizer = delete_memory;
    return nullptr;
}

} // namespace

LinearMemory::LinearMemory(std::uint64_t maximum, bool fixed, std::uint64_t guard,
                           const runtime::SandboxLimits& limits)
    : limits_(limits), maximum_(maximum), fixed_(fixed),
      guard_(round_to_page(std::max(guard, limits.guard_size_bytes)))
{
}

LinearMemory::~LinearMemory()
{
    if (base_ != nullptr)
    {
        (void)munmap(base_, reserved_ + guard_);
    }
}

std::variant<std::unique_ptr<LinearMemory>, std::string>
LinearMemory::create(std::uint64_t minimum, std::uint64_t maximum, std::uint64_t reserved,
                     std::uint64_t guard, const runtime::SandboxLimits& limits)
{
    if (minimum > limits.max_memory_bytes)
    {
        std::string message = "memory limit exceeded: initial size of " + std::to_string(minimum) +
                              " bytes exceeds the " + std::to_string(limits.max_memory_bytes) +
                              " byte maximum";
        report_limit(message);
        return message;
    }

    std::uint64_t reserve = round_to_page(std::max(reserved, limits.initial_memory_reservation_bytes));
    if (minimum > reserve)
    {
        reserve = round_to_page(minimum + limits.growth_reservation_bytes);
    }

    std::unique_ptr<LinearMemory> mem(new LinearMemory(maximum, reserved > 0, guard, limits));
    if (!mem->map(reserve))
    {
        return "failed to reserve linear memory: " + std::string(std::strerror(errno));
    }
    if (minimum > 0 && mprotect(mem->base_, minimum, PROT_READ | PROT_WRITE) != 0)
    {
        return "failed to commit linear memory: " + std::string(std::strerror(errno));
    }
    mem->size_ = minimum;
    return mem;
}

bool LinearMemory::map(std::uint64_t reserve)
{
    void* p = mmap(nullptr, reserve + guard_, PROT_NONE, MAP_PRIVATE | MAP_ANONYMOUS | MAP_NORESERVE,
                   -1, 0);
    if (p == MAP_FAILED)
    {
        return false;
    }
    base_ = static_cast<std::uint8_t*>(p);
    reserved_ = reserve;
    return true;
}

bool LinearMemory::relocate(std::uint64_t reserve)
{
    void* p = mmap(nullptr, reserve + guard_, PROT_NONE, MAP_PRIVATE | MAP_ANONYMOUS | MAP_NORESERVE,
                   -1, 0);
    if (p == MAP_FAILED)
    {
        return false;
    }
    auto* fresh = static_cast<std::uint8_t*>(p);
    if (size_ > 0)
    {
        if (mprotect(fresh, size_, PROT_READ | PROT_WRITE) != 0)
        {
            (void)munmap(fresh, reserve + guard_);
            return false;
        }
        std::memcpy(fresh, base_, size_);
    }
    (void)munmap(base_, reserved_ + guard_);
    base_ = fresh;
    reserved_ = reserve;
    ++relocations_;
    return true;
}

GrowOutcome LinearMemory::grow_to(std::uint64_t new_size)
{
    if (new_size <= size_)
    {
        return GrowOutcome::Ok;
    }
    if (new_size > maximum_)
    {
        return GrowOutcome::Refused;
    }
    if (new_size > limits_.max_memory_bytes)
    {
        report_limit("memory limit exceeded: growing to " + std::to_string(new_size) +
                     " bytes exceeds the " + std::to_string(limits_.max_memory_bytes) +
                     " byte maximum");
        return GrowOutcome::LimitExceeded;
    }

    if (new_size > reserved_)
    {
        if (fixed_ || !limits_.allow_memory_relocation)
        {
            return GrowOutcome::Refused;
        }
        if (!relocate(round_to_page(new_size + limits_.growth_reservation_bytes)))
        {
            return GrowOutcome::Refused;
        }
    }

    if (mprotect(base_ + size_, new_size - size_, PROT_READ | PROT_WRITE) != 0)
    {
        return GrowOutcome::Refused;
    }
    size_ = new_size;
    return GrowOutcome::Ok;
}

MemoryWatchScope::MemoryWatchScope(MemoryWatch& watch) : previous_(current_watch)
{
    current_watch = &watch;
}

MemoryWatchScope::~MemoryWatchScope()
{
    current_watch = previous_;
}

void install_memory_creator(wasmtime::Config& config, const runtime::SandboxLimits& limits)
{
    wasmtime_memory_creator_t creator{};
    creator.env = const_cast<runtime::SandboxLimits*>(&limits);
    creator.new_memory = new_memory;
    creator.finalizer = nullptr;
    wasmtime_config_host_memory_creator_set(config.capi(), &creator);
}

} // namespace wasmbox::engine
