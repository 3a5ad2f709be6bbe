#pragma once

#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include <wasmbox/engine/engine.h>
#include <wasmtime.hh>

/**
 * @file module_cache.h
 * @brief Process-wide LRU of compiled modules keyed by payload content.
 */

namespace wasmbox::runtime
{

/** @brief 64-bit FNV-1a over `data`. */
[[nodiscard]] std::uint64_t fnv1a(const std::uint8_t* data, std::size_t size);

/**
 * @brief Compiled modules shared read-only between runs.
 *
 * Lookups compare the full payload after a hash match, so a collision can never hand a run
 * another payload's module. Only compiled code is cached; every run still gets its own store.
 * A capacity of zero disables the cache.
 *
 * Compiled code belongs to the engine that produced it, so the cache serves exactly one engine:
 * the first to insert. Lookups and inserts for any other engine miss and store nothing.
 */
class ModuleCache
{
  public:
    explicit ModuleCache(std::size_t capacity) : capacity_(capacity) {}

    [[nodiscard]] std::optional<wasmtime::Module> find(const engine::Engine& engine,
                                                       const std::uint8_t* data, std::size_t size);
    void insert(const engine::Engine& engine, const std::uint8_t* data, std::size_t size,
                const wasmtime::Module& module);

    [[nodiscard]] std::size_t capacity() const { return capacity_; }
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::uint64_t hits() const;
    [[nodiscard]] std::uint64_t misses() const;

  private:
    struct Entry
    {
        std::uint64_t hash = 0;
        std::vector<std::uint8_t> bytes;
        wasmtime::Module module;
    };

    std::size_t capacity_;
    mutable std::mutex mutex_;
    const engine::Engine* owner_ = nullptr;
    // Most recently used first.
    std::list<Entry> entries_;
    std::uint64_t hits_ = 0;
    std::uint64_t misses_ = 0;

    std::list<Entry>::iterator locate(std::uint64_t hash, const std::uint8_t* data,
                                      std::size_t size);
};

} // namespace wasmbox::runtime
