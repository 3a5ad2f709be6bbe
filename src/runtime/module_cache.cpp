#include <algorithm>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <wasmbox/runtime/module_cache.h>

namespace wasmbox::runtime
{

std::uint64_t fnv1a(const std::uint8_t* data, std::size_t size)
{
    std::uint64_t hash = 0xcbf29ce484222325ULL;
    for (std::size_t i = 0; i < size; ++i)
    {
        hash ^= data[i];
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

std::list<ModuleCache::Entry>::iterator ModuleCache::locate(std::uint64_t hash,
                                                            const std::uint8_t* data,
                                                            std::size_t size)
{
    return std::find_if(entries_.begin(), entries_.end(),
                        [&](const Entry& e)
                        {
                            return e.hash == hash && e.bytes.size() == size &&
                                   std::equal(e.bytes.begin(), e.bytes.end(), data);
                        });
}

std::optional<wasmtime::Module> ModuleCache::find(const engine::Engine& engine,
                                                  const std::uint8_t* data, std::size_t size)
{
    if (capacity_ == 0)
    {
        return std::nullopt;
    }
    const std::uint64_t hash = fnv1a(data, size);
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = owner_ == &engine ? locate(hash, data, size) : entries_.end();
    if (it == entries_.end())
    {
        ++misses_;
        return std::nullopt;
    }
    ++hits_;
    entries_.splice(entries_.begin(), entries_, it);
    return entries_.front().module;
}

void ModuleCache::insert(const engine::Engine& engine, const std::uint8_t* data, std::size_t size,
                         const wasmtime::Module& module)
{
    if (capacity_ == 0)
    {
        return;
    }
    const std::uint64_t hash = fnv1a(data, size);
    std::lock_guard<std::mutex> lock(mutex_);
    if (owner_ == nullptr)
    {
        owner_ = &engine;
    }
    if (owner_ != &engine)
    {
        return;
    }
    const auto it = locate(hash, data, size);
    if (it != entries_.end())
    {
        it->module = module;
        entries_.splice(entries_.begin(), entries_, it);
        return;
    }
    entries_.push_front(Entry{.hash = hash,
                              .bytes = std::vector<std::uint8_t>(data, data + size),
                              .module = module});
    while (entries_.size() > capacity_)
    {
        entries_.pop_back();
    }
}

std::size_t ModuleCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::uint64_t ModuleCache::hits() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

std::uint64_t ModuleCache::misses() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

} // namespace wasmbox::runtime
