#pragma once

#include <mutex>
#include <ostream>
#include <string_view>

/**
 * @file log.h
 * @brief Line-oriented diagnostic stream shared by the gateway's threads.
 */

namespace wasmbox::server
{

/**
 * @brief Serialises whole lines from concurrent writers onto one stream.
 *
 * Every call writes exactly one line and flushes it, so lines from different workers never
 * interleave.
 */
class DiagnosticLog
{
  public:
    explicit DiagnosticLog(std::ostream& out) : out_(out) {}

    DiagnosticLog(const DiagnosticLog&) = delete;
    DiagnosticLog& operator=(const DiagnosticLog&) = delete;

    void line(std::string_view text);
    /** @brief The `/log` route's record: `[LOG] Received message: <text>`. */
    void message(std::string_view text);

  private:
    std::mutex mutex_;
    std::ostream& out_;
};

} // namespace wasmbox::server
