#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <string_view>

/**
 * @file http.h
 * @brief Minimal HTTP/1.1 request parsing and response serialization.
 *
 * One request per connection: every response carries `Connection: close`.
 */

namespace wasmbox::server
{

/** @brief Largest accepted request line plus header block. */
constexpr std::size_t kMaxHeaderBytes = 64 * 1024;

struct Request
{
    std::string method;
    /** @brief Request target as sent, query string included. */
    std::string target;
    /** @brief Target without the query string. */
    std::string path;
    /** @brief Header names are lower-cased; repeated headers are joined with `, `. */
    std::map<std::string, std::string> headers;
    std::string body;

    [[nodiscard]] const std::string* header(const std::string& lower_name) const;
};

struct Response
{
    int status = 200;
    std::string body;
    std::string content_type = "text/plain; charset=utf-8";
};

/** @brief A request that cannot be served; `status` is the response to send. */
struct HttpError
{
    int status = 400;
    std::string message;
};

[[nodiscard]] std::string_view reason_phrase(int status);

/** @brief Status line, `Content-Type`, `Content-Length`, `Connection: close`, body. */
[[nodiscard]] std::string serialize(const Response& response);

/**
 * @brief Incremental parser for one request.
 *
 * Bytes are fed as they arrive; the parser reports when the request is complete or cannot be
 * served. Bodies are framed by `Content-Length` or chunked transfer coding and capped at
 * `max_body_bytes` (413 past it).
 */
class RequestParser
{
  public:
    enum class Status
    {
        Incomplete,
        Complete,
        Error,
    };

    explicit RequestParser(std::size_t max_body_bytes) : max_body_(max_body_bytes) {}

    Status feed(std::string_view bytes);
    /** @brief The peer closed its side; an unfinished request becomes an error. */
    Status finish();

    [[nodiscard]] Status status() const { return status_; }
    [[nodiscard]] const Request& request() const { return request_; }
    [[nodiscard]] Request& request() { return request_; }
    [[nodiscard]] const HttpError& error() const { return error_; }

  private:
    enum class Framing
    {
        None,
        Length,
        Chunked,
    };

    enum class ChunkState
    {
        Size,
        Data,
        DataEnd,
        Trailer,
    };

    std::size_t max_body_;
    Status status_ = Status::Incomplete;
    bool headers_done_ = false;
    Framing framing_ = Framing::None;
    std::size_t content_length_ = 0;
    ChunkState chunk_state_ = ChunkState::Size;
    std::size_t chunk_remaining_ = 0;
    std::string buffer_;
    Request request_;
    HttpError error_;

    Status fail(int status, std::string message);
    Status parse_head(std::string_view head);
    Status consume_body();
    Status consume_chunked();
};

} // namespace wasmbox::server
