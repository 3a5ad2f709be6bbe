#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

/**
 * @file output_buffer.h
 * @brief Bounded in-memory capture of one guest stdio stream.
 */

namespace wasmbox::runtime
{

/**
 * @brief Append-only byte buffer with a fixed capacity.
 *
 * Bytes past the capacity are dropped and the buffer is flagged truncated. The buffer belongs to
 * a single run and is only touched from the thread executing it.
 */
class OutputBuffer
{
  public:
    explicit OutputBuffer(std::size_t capacity) : capacity_(capacity) {}

    /** @brief Append as much of `bytes` as fits; returns the count kept. */
    std::size_t append(std::string_view bytes);
    std::size_t append(const std::uint8_t* data, std::size_t size);

    [[nodiscard]] const std::string& contents() const { return data_; }
    [[nodiscard]] std::string snapshot() const { return data_; }
    [[nodiscard]] std::size_t size() const { return data_.size(); }
    [[nodiscard]] std::size_t capacity() const { return capacity_; }
    [[nodiscard]] bool truncated() const { return truncated_; }
    [[nodiscard]] bool empty() const { return data_.empty(); }

  private:
    std::size_t capacity_;
    std::string data_;
    bool truncated_ = false;
};

} // namespace wasmbox::runtime
