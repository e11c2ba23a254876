/**
 * @file event_stream.cpp
 * @brief Event framing over a duplex byte stream
 */

#include "event_stream.h"

#include "wws/core/wws_logger.h"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace wws {
namespace server {

using events::Event;
using events::Json;

namespace {

constexpr size_t kReadChunkBytes = 4096;

bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(),
                       [](char c) { return c == ' ' || c == '\t' || c == '\r'; });
}

bool read_length(const Json& header, const char* key, size_t& out) {
    out = 0;
    if (!header.contains(key) || header[key].is_null()) {
        return true;
    }
    if (!header[key].is_number_integer() || header[key].get<int64_t>() < 0) {
        return false;
    }
    out = header[key].get<size_t>();
    return out <= kMaxSectionBytes;
}

}  // namespace

// =============================================================================
// ENCODING
// =============================================================================

std::string encodeEvent(const Event& event) {
    Json header;
    header["type"] = event.type;
    header["version"] = events::kProtocolVersion;

    std::string data;
    if (event.data.is_object() && !event.data.empty()) {
        data = event.data.dump();
        header["data_length"] = data.size();
    }
    if (!event.payload.empty()) {
        header["payload_length"] = event.payload.size();
    }

    std::string out = header.dump();
    out.reserve(out.size() + 1 + data.size() + event.payload.size());
    out.push_back('\n');
    out += data;
    out.append(reinterpret_cast<const char*>(event.payload.data()), event.payload.size());
    return out;
}

wws_result_t decodeHeader(const std::string& line, Event& out, size_t& data_length,
                          size_t& payload_length) {
    Json header = Json::parse(line, nullptr, false);
    if (header.is_discarded() || !header.is_object()) {
        WWS_LOG_DEBUG("EventStream", "Header is not a JSON object");
        return WWS_ERROR_MALFORMED_EVENT;
    }
    if (!header.contains("type") || !header["type"].is_string()) {
        WWS_LOG_DEBUG("EventStream", "Header has no type");
        return WWS_ERROR_MALFORMED_EVENT;
    }
    if (!read_length(header, "data_length", data_length) ||
        !read_length(header, "payload_length", payload_length)) {
        WWS_LOG_DEBUG("EventStream", "Header has an invalid section length");
        return WWS_ERROR_MALFORMED_EVENT;
    }

    out.type = header["type"].get<std::string>();
    out.data = Json::object();
    out.payload.clear();
    if (header.contains("data") && header["data"].is_object()) {
        out.data = header["data"];
    }
    return WWS_SUCCESS;
}

// =============================================================================
// FD EVENT STREAM
// =============================================================================

FdEventStream::FdEventStream(int read_fd, int write_fd, bool is_socket, int cancel_fd)
    : read_fd_(read_fd), write_fd_(write_fd), is_socket_(is_socket), cancel_fd_(cancel_fd) {}

FdEventStream::FillResult FdEventStream::fill() {
    struct pollfd fds[2];
    fds[0].fd = read_fd_;
    fds[0].events = POLLIN;
    fds[0].revents = 0;
    fds[1].fd = cancel_fd_;
    fds[1].events = POLLIN;
    fds[1].revents = 0;
    const nfds_t nfds = cancel_fd_ >= 0 ? 2 : 1;

    for (;;) {
        int rc = ::poll(fds, nfds, -1);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            WWS_LOG_ERROR("EventStream", "poll failed: %s", std::strerror(errno));
            return FillResult::Error;
        }
        if (nfds == 2 && (fds[1].revents & (POLLIN | POLLHUP)) != 0) {
            return FillResult::Cancelled;
        }
        if (fds[0].revents != 0) {
            break;
        }
    }

    // Drop consumed bytes before growing the buffer
    if (pos_ > 0) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(pos_));
        pos_ = 0;
    }

    uint8_t chunk[kReadChunkBytes];
    for (;;) {
        ssize_t n = is_socket_ ? ::recv(read_fd_, chunk, sizeof(chunk), 0)
                               : ::read(read_fd_, chunk, sizeof(chunk));
        if (n > 0) {
            buffer_.insert(buffer_.end(), chunk, chunk + n);
            return FillResult::Ok;
        }
        if (n == 0) {
            return FillResult::Eof;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == ECONNRESET) {
            return FillResult::Eof;
        }
        WWS_LOG_ERROR("EventStream", "read failed: %s", std::strerror(errno));
        return FillResult::Error;
    }
}

wws_result_t FdEventStream::readLine(std::string& line) {
    for (;;) {
        auto begin = buffer_.begin() + static_cast<std::ptrdiff_t>(pos_);
        auto newline = std::find(begin, buffer_.end(), static_cast<uint8_t>('\n'));
        if (newline != buffer_.end()) {
            line.assign(begin, newline);
            pos_ = static_cast<size_t>(newline - buffer_.begin()) + 1;
            return WWS_SUCCESS;
        }

        const size_t pending = buffer_.size() - pos_;
        if (pending > kMaxHeaderBytes) {
            WWS_LOG_DEBUG("EventStream", "Header line exceeds %zu bytes", kMaxHeaderBytes);
            return WWS_ERROR_MALFORMED_EVENT;
        }

        switch (fill()) {
            case FillResult::Ok:
                break;
            case FillResult::Eof:
                return pending == 0 ? WWS_ERROR_STREAM_CLOSED : WWS_ERROR_MALFORMED_EVENT;
            case FillResult::Cancelled:
                return WWS_ERROR_STREAM_CLOSED;
            case FillResult::Error:
                return WWS_ERROR_TRANSPORT_READ;
        }
    }
}

wws_result_t FdEventStream::readExact(size_t count, std::vector<uint8_t>& out) {
    while (buffer_.size() - pos_ < count) {
        switch (fill()) {
            case FillResult::Ok:
                break;
            case FillResult::Eof:
                WWS_LOG_DEBUG("EventStream", "End of stream inside an event");
                return WWS_ERROR_MALFORMED_EVENT;
            case FillResult::Cancelled:
                return WWS_ERROR_STREAM_CLOSED;
            case FillResult::Error:
                return WWS_ERROR_TRANSPORT_READ;
        }
    }

    auto begin = buffer_.begin() + static_cast<std::ptrdiff_t>(pos_);
    out.assign(begin, begin + static_cast<std::ptrdiff_t>(count));
    pos_ += count;
    return WWS_SUCCESS;
}

wws_result_t FdEventStream::readEvent(Event& out) {
    std::string line;
    do {
        wws_result_t rc = readLine(line);
        if (WWS_FAILED(rc)) {
            return rc;
        }
    } while (is_blank(line));

    size_t data_length = 0;
    size_t payload_length = 0;
    wws_result_t rc = decodeHeader(line, out, data_length, payload_length);
    if (WWS_FAILED(rc)) {
        return rc;
    }

    if (data_length > 0) {
        std::vector<uint8_t> data_bytes;
        rc = readExact(data_length, data_bytes);
        if (WWS_FAILED(rc)) {
            return rc;
        }
        Json data = Json::parse(data_bytes.begin(), data_bytes.end(), nullptr, false);
        if (data.is_discarded() || !data.is_object()) {
            WWS_LOG_DEBUG("EventStream", "Data section of %s is not a JSON object",
                          out.type.c_str());
            return WWS_ERROR_MALFORMED_EVENT;
        }
        for (auto it = data.begin(); it != data.end(); ++it) {
            out.data[it.key()] = it.value();
        }
    }

    if (payload_length > 0) {
        rc = readExact(payload_length, out.payload);
        if (WWS_FAILED(rc)) {
            return rc;
        }
    }

    WWS_LOG_TRACE("EventStream", "Read %s (data=%zu payload=%zu)", out.type.c_str(), data_length,
                  payload_length);
    return WWS_SUCCESS;
}

wws_result_t FdEventStream::writeEvent(const Event& event) {
    std::string bytes;
    try {
        bytes = encodeEvent(event);
    } catch (const Json::exception& e) {
        WWS_LOG_ERROR("EventStream", "Failed to encode %s: %s", event.type.c_str(), e.what());
        return WWS_ERROR_TRANSPORT_WRITE;
    }

    std::lock_guard<std::mutex> lock(write_mutex_);

    size_t written = 0;
    while (written < bytes.size()) {
        const char* p = bytes.data() + written;
        const size_t remaining = bytes.size() - written;
        ssize_t n = is_socket_ ? ::send(write_fd_, p, remaining, MSG_NOSIGNAL)
                               : ::write(write_fd_, p, remaining);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            WWS_LOG_DEBUG("EventStream", "write failed: %s", std::strerror(errno));
            return WWS_ERROR_TRANSPORT_WRITE;
        }
        written += static_cast<size_t>(n);
    }

    WWS_LOG_TRACE("EventStream", "Wrote %s", event.type.c_str());
    return WWS_SUCCESS;
}

}  // namespace server
}  // namespace wws
