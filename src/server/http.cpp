#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <wasmbox/runtime/sandbox_limits.h>
#include <wasmbox/server/http.h>

namespace wasmbox::server
{

namespace
{

constexpr std::size_t kMaxChunkLine = 1024;

std::string lower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view s)
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
    {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
    {
        s.remove_suffix(1);
    }
    return s;
}

bool is_token(std::string_view s)
{
    if (s.empty())
    {
        return false;
    }
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c)
                       {
                           return std::isalnum(c) != 0 ||
                                  std::string_view("!#$%&'*+-.^_`|~").find(static_cast<char>(c)) !=
                                      std::string_view::npos;
                       });
}

std::optional<std::size_t> parse_hex(std::string_view s)
{
    if (s.empty() || s.size() > 15)
    {
        return std::nullopt;
    }
    std::size_t v = 0;
    for (const char c : s)
    {
        int digit = 0;
        if (c >= '0' && c <= '9')
        {
            digit = c - '0';
        }
        else if (c >= 'a' && c <= 'f')
        {
            digit = c - 'a' + 10;
        }
        else if (c >= 'A' && c <= 'F')
        {
            digit = c - 'A' + 10;
        }
        else
        {
            return std::nullopt;
        }
        v = v * 16 + static_cast<std::size_t>(digit);
    }
    return v;
}

} // namespace

const std::string* Request::header(const std::string& lower_name) const
{
    const auto it = headers.find(lower_name);
    return it == headers.end() ? nullptr : &it->second;
}

std::string_view reason_phrase(int status)
{
    switch (status)
    {
    case 200:
        return "OK";
    case 400:
        return "Bad Request";
    case 404:
        return "Not Found";
    case 408:
        return "Request Timeout";
    case 413:
        return "Content Too Large";
    case 431:
        return "Request Header Fields Too Large";
    case 500:
        return "Internal Server Error";
    case 501:
        return "Not Implemented";
    case 503:
        return "Service Unavailable";
    case 505:
        return "HTTP Version Not Supported";
    default:
        return "Unknown";
    }
}

std::string serialize(const Response& response)
{
    std::string out;
    out.reserve(response.body.size() + 128);
    out += "HTTP/1.1 " + std::to_string(response.status) + " ";
    out += reason_phrase(response.status);
    out += "\r\nContent-Type: " + response.content_type;
    out += "\r\nContent-Length: " + std::to_string(response.body.size());
    out += "\r\nConnection: close\r\n\r\n";
    out += response.body;
    return out;
}

RequestParser::Status RequestParser::fail(int status, std::string message)
{
    error_ = HttpError{.status = status, .message = std::move(message)};
    status_ = Status::Error;
    return status_;
}

RequestParser::Status RequestParser::feed(std::string_view bytes)
{
    if (status_ != Status::Incomplete)
    {
        return status_;
    }
    buffer_.append(bytes);

    if (!headers_done_)
    {
        const std::size_t end = buffer_.find("\r\n\r\n");
        if (end == std::string::npos)
        {
            if (buffer_.size() > kMaxHeaderBytes)
            {
                return fail(431, "request header block exceeds 64K");
            }
            return status_;
        }
        if (end + 4 > kMaxHeaderBytes)
        {
            return fail(431, "request header block exceeds 64K");
        }
        if (parse_head(std::string_view(buffer_).substr(0, end)) == Status::Error)
        {
            return status_;
        }
        buffer_.erase(0, end + 4);
        headers_done_ = true;
    }
    return consume_body();
}

RequestParser::Status RequestParser::finish()
{
    if (status_ != Status::Incomplete)
    {
        return status_;
    }
    if (!headers_done_)
    {
        return fail(400, buffer_.empty() ? "empty request" : "incomplete request header");
    }
    return fail(400, "request body is shorter than its framing declares");
}

RequestParser::Status RequestParser::parse_head(std::string_view head)
{
    std::size_t line_end = head.find("\r\n");
    const std::string_view request_line = head.substr(0, line_end);

    const std::size_t sp1 = request_line.find(' ');
    const std::size_t sp2 =
        sp1 == std::string_view::npos ? std::string_view::npos : request_line.find(' ', sp1 + 1);
    if (sp1 == std::string_view::npos || sp2 == std::string_view::npos ||
        request_line.find(' ', sp2 + 1) != std::string_view::npos)
    {
        return fail(400, "malformed request line");
    }
    const std::string_view method = request_line.substr(0, sp1);
    const std::string_view target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
    const std::string_view version = request_line.substr(sp2 + 1);
    if (!is_token(method) || target.empty())
    {
        return fail(400, "malformed request line");
    }
    if (version != "HTTP/1.1" && version != "HTTP/1.0")
    {
        if (version.rfind("HTTP/", 0) == 0)
        {
            return fail(505, "unsupported HTTP version");
        }
        return fail(400, "malformed request line");
    }
    if (target.front() != '/' && target != "*")
    {
        return fail(400, "unsupported request target");
    }
    request_.method = std::string(method);
    request_.target = std::string(target);
    request_.path = std::string(target.substr(0, target.find('?')));

    while (line_end != std::string_view::npos)
    {
        const std::size_t start = line_end + 2;
        line_end = head.find("\r\n", start);
        const std::string_view line = head.substr(start, line_end == std::string_view::npos
                                                             ? std::string_view::npos
                                                             : line_end - start);
        if (line.empty())
        {
            continue;
        }
        if (line.front() == ' ' || line.front() == '\t')
        {
            return fail(400, "folded header lines are not accepted");
        }
        const std::size_t colon = line.find(':');
        if (colon == std::string_view::npos || !is_token(line.substr(0, colon)))
        {
            return fail(400, "malformed header line");
        }
        const std::string name = lower(line.substr(0, colon));
        const std::string value(trim(line.substr(colon + 1)));
        auto [it, inserted] = request_.headers.emplace(name, value);
        if (!inserted)
        {
            it->second += ", " + value;
        }
    }

    const std::string* te = request_.header("transfer-encoding");
    const std::string* cl = request_.header("content-length");
    if (te != nullptr)
    {
        if (cl != nullptr)
        {
            return fail(400, "both Content-Length and Transfer-Encoding are present");
        }
        if (lower(*te) != "chunked")
        {
            return fail(501, "unsupported transfer coding `" + *te + "`");
        }
        framing_ = Framing::Chunked;
        return status_;
    }
    if (cl != nullptr)
    {
        const auto length = runtime::parse_uint(*cl);
        if (!length.has_value())
        {
            return fail(400, "invalid Content-Length");
        }
        if (*length > max_body_)
        {
            return fail(413, "request body exceeds " + std::to_string(max_body_) + " bytes");
        }
        content_length_ = static_cast<std::size_t>(*length);
        framing_ = Framing::Length;
    }
    return status_;
}

RequestParser::Status RequestParser::consume_body()
{
    switch (framing_)
    {
    case Framing::None:
        status_ = Status::Complete;
        return status_;
    case Framing::Length:
    {
        const std::size_t take =
            std::min(content_length_ - request_.body.size(), buffer_.size());
        request_.body.append(buffer_, 0, take);
        buffer_.clear();
        if (request_.body.size() == content_length_)
        {
            status_ = Status::Complete;
        }
        return status_;
    }
    case Framing::Chunked:
        return consume_chunked();
    }
    return status_;
}

RequestParser::Status RequestParser::consume_chunked()
{
    std::size_t pos = 0;
    while (status_ == Status::Incomplete)
    {
        if (chunk_state_ == ChunkState::Data)
        {
            const std::size_t take = std::min(chunk_remaining_, buffer_.size() - pos);
            request_.body.append(buffer_, pos, take);
            pos += take;
            chunk_remaining_ -= take;
            if (chunk_remaining_ > 0)
            {
                break;
            }
            chunk_state_ = ChunkState::DataEnd;
            continue;
        }
        if (chunk_state_ == ChunkState::DataEnd)
        {
            if (buffer_.size() - pos < 2)
            {
                break;
            }
            if (buffer_.compare(pos, 2, "\r\n") != 0)
            {
                return fail(400, "chunk data is not followed by CRLF");
            }
            pos += 2;
            chunk_state_ = ChunkState::Size;
            continue;
        }

        const std::size_t eol = buffer_.find("\r\n", pos);
        if (eol == std::string::npos)
        {
            if (buffer_.size() - pos > kMaxChunkLine)
            {
                return fail(400, "chunk line too long");
            }
            break;
        }
        const std::string_view line = std::string_view(buffer_).substr(pos, eol - pos);
        pos = eol + 2;

        if (chunk_state_ == ChunkState::Trailer)
        {
            if (line.empty())
            {
                status_ = Status::Complete;
            }
            continue;
        }

        const auto size = parse_hex(trim(line.substr(0, line.find(';'))));
        if (!size.has_value())
        {
            return fail(400, "invalid chunk size");
        }
        if (*size == 0)
        {
            chunk_state_ = ChunkState::Trailer;
            continue;
        }
        if (*size > max_body_ - request_.body.size())
        {
            return fail(413, "request body exceeds " + std::to_string(max_body_) + " bytes");
        }
        chunk_remaining_ = *size;
        chunk_state_ = ChunkState::Data;
    }
    buffer_.erase(0, pos);
    return status_;
}

} // namespace wasmbox::server
