#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <wasmbox/runtime/sandbox_limits.h>
#include <wasmtime.hh>

/**
 * @file linear_memory.h
 * @brief Guest linear memories allocated by wasmbox on behalf of the engine.
 */

namespace wasmbox::engine
{

enum class GrowOutcome
{
    Ok,
    /** @brief Growth not possible; `memory.grow` reports -1 to the guest. */
    Refused,
    /** @brief Growth would exceed the hard per-memory ceiling; the run is cancelled. */
    LimitExceeded,
};

/**
 * @brief One linear memory.
 *
 * The whole reservation (plus the guard region) is mapped inaccessible up front and pages are
 * made accessible as the memory grows. When growth needs more than the reservation the memory is
 * moved to a larger mapping if `allow_memory_relocation` is set; otherwise growth is refused.
 * A memory created with a fixed reservation never moves.
 */
class LinearMemory
{
  public:
    /**
     * @brief Map a memory of `minimum` bytes that may grow to `maximum` bytes.
     *
     * `reserved` is the engine's required reservation (0 when the memory may move) and `guard`
     * its required guard region; both are raised to the sandbox's own settings.
     */
    [[nodiscard]] static std::variant<std::unique_ptr<LinearMemory>, std::string>
    create(std::uint64_t minimum, std::uint64_t maximum, std::uint64_t reserved,
           std::uint64_t guard, const runtime::SandboxLimits& limits);

    ~LinearMemory();
    LinearMemory(const LinearMemory&) = delete;
    LinearMemory& operator=(const LinearMemory&) = delete;

    [[nodiscard]] std::uint8_t* data() { return base_; }
    [[nodiscard]] std::uint64_t size() const { return size_; }
    [[nodiscard]] std::uint64_t reserved() const { return reserved_; }
    [[nodiscard]] std::uint32_t relocations() const { return relocations_; }

    [[nodiscard]] GrowOutcome grow_to(std::uint64_t new_size);

  private:
    LinearMemory(std::uint64_t maximum, bool fixed, std::uint64_t guard,
                 const runtime::SandboxLimits& limits);

    bool map(std::uint64_t reserve);
    bool relocate(std::uint64_t reserve);

    const runtime::SandboxLimits& limits_;
    std::uint64_t maximum_;
    bool fixed_;
    std::uint8_t* base_ = nullptr;
    std::uint64_t size_ = 0;
    std::uint64_t reserved_ = 0;
    std::uint64_t guard_ = 0;
    std::uint32_t relocations_ = 0;
};

/** @brief What the memories of one run ran into. */
struct MemoryWatch
{
    bool limit_exceeded = false;
    std::string message;
};

/**
 * @brief Reports memory events raised on this thread to `watch` while in scope.
 *
 * Memories are created and grown on the thread that instantiates or calls into the guest, so a
 * run opens one scope around everything it does with its store.
 */
class MemoryWatchScope
{
  public:
    explicit MemoryWatchScope(MemoryWatch& watch);
    ~MemoryWatchScope();
    MemoryWatchScope(const MemoryWatchScope&) = delete;
    MemoryWatchScope& operator=(const MemoryWatchScope&) = delete;

  private:
    MemoryWatch* previous_;
};

/** @brief Make every memory of engines built from `config` a `LinearMemory`. `limits` must outlive them. */
void install_memory_creator(wasmtime::Config& config, const runtime::SandboxLimits& limits);

} // namespace wasmbox::engine
