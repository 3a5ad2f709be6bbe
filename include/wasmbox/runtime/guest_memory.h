#pragma once

#include <cstdint>
#include <cstring>
#include <optional>
#include <string_view>

/**
 * @file guest_memory.h
 * @brief Bounds-checked little-endian accessors used by host functions.
 */

namespace wasmbox::runtime
{

/**
 * @brief View over a guest's linear memory for host code.
 *
 * Every accessor checks bounds; a failed read returns nothing and a failed write returns false.
 * Guest addresses are 32-bit; offsets are widened before adding so nothing wraps. The view is
 * only valid until the guest runs again, since growth may move the memory.
 */
class GuestMemory
{
  public:
    GuestMemory(std::uint8_t* data, std::uint64_t size) : data_(data), size_(size) {}

    [[nodiscard]] std::uint64_t size() const { return size_; }

    [[nodiscard]] bool in_bounds(std::uint64_t addr, std::uint64_t len) const
    {
        return addr <= size_ && len <= size_ - addr;
    }

    [[nodiscard]] std::uint8_t* ptr(std::uint64_t addr) { return data_ + addr; }

    template <typename T>
    [[nodiscard]] std::optional<T> read(std::uint64_t addr) const
    {
        if (!in_bounds(addr, sizeof(T)))
        {
            return std::nullopt;
        }
        T v;
        std::memcpy(&v, data_ + addr, sizeof(T));
        return v;
    }

    template <typename T>
    [[nodiscard]] bool write(std::uint64_t addr, T v)
    {
        if (!in_bounds(addr, sizeof(T)))
        {
            return false;
        }
        std::memcpy(data_ + addr, &v, sizeof(T));
        return true;
    }

    [[nodiscard]] bool write_bytes(std::uint64_t addr, std::string_view bytes)
    {
        if (!in_bounds(addr, bytes.size()))
        {
            return false;
        }
        if (!bytes.empty())
        {
            std::memcpy(data_ + addr, bytes.data(), bytes.size());
        }
        return true;
    }

    [[nodiscard]] std::optional<std::string_view> read_bytes(std::uint64_t addr,
                                                             std::uint64_t len) const
    {
        if (!in_bounds(addr, len))
        {
            return std::nullopt;
        }
        return std::string_view(reinterpret_cast<const char*>(data_ + addr), len);
    }

  private:
    std::uint8_t* data_;
    std::uint64_t size_;
};

} // namespace wasmbox::runtime
