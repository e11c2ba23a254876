/**
 * @file event_stream.h
 * @brief Event framing over a duplex byte stream
 *
 * Wire format of one event:
 *   {"type": ..., "version": ..., "data_length": N, "payload_length": M}\n
 *   <N bytes of JSON data><M bytes of payload>
 *
 * The header may also carry an inline "data" object; data bytes are merged
 * over it. data_length and payload_length are omitted when zero.
 */

#ifndef WWS_EVENT_STREAM_INTERNAL_H
#define WWS_EVENT_STREAM_INTERNAL_H

#include "wws/server/wws_events.h"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace wws {
namespace server {

/** Longest accepted header line */
constexpr size_t kMaxHeaderBytes = 64 * 1024;

/** Largest accepted data or payload section */
constexpr size_t kMaxSectionBytes = 64 * 1024 * 1024;

/**
 * @brief Source of framed events
 */
class EventReader {
public:
    virtual ~EventReader() = default;

    /**
     * @brief Read the next event
     *
     * @return WWS_SUCCESS, WWS_ERROR_STREAM_CLOSED at a clean end of stream,
     *         WWS_ERROR_MALFORMED_EVENT or WWS_ERROR_TRANSPORT_READ
     */
    virtual wws_result_t readEvent(events::Event& out) = 0;
};

/**
 * @brief Sink for framed events
 */
class EventWriter {
public:
    virtual ~EventWriter() = default;

    /**
     * @return WWS_SUCCESS or WWS_ERROR_TRANSPORT_WRITE
     */
    virtual wws_result_t writeEvent(const events::Event& event) = 0;
};

/**
 * @brief Serialize one event to its wire form
 */
std::string encodeEvent(const events::Event& event);

/**
 * @brief Decode a header line (without the trailing newline)
 *
 * Fills type and inline data and reports the section lengths that follow.
 *
 * @return WWS_SUCCESS or WWS_ERROR_MALFORMED_EVENT
 */
wws_result_t decodeHeader(const std::string& line, events::Event& out, size_t& data_length,
                          size_t& payload_length);

/**
 * @brief Event stream over a pair of file descriptors
 *
 * Used for both stdio (fds 0/1) and accepted sockets (same fd twice). Reads
 * are buffered. When cancel_fd is given, a blocked read returns
 * WWS_ERROR_STREAM_CLOSED as soon as cancel_fd becomes readable.
 *
 * The stream does not own its descriptors.
 */
class FdEventStream : public EventReader, public EventWriter {
public:
    FdEventStream(int read_fd, int write_fd, bool is_socket, int cancel_fd = -1);

    wws_result_t readEvent(events::Event& out) override;
    wws_result_t writeEvent(const events::Event& event) override;

private:
    enum class FillResult { Ok, Eof, Cancelled, Error };

    FillResult fill();
    wws_result_t readLine(std::string& line);
    wws_result_t readExact(size_t count, std::vector<uint8_t>& out);

    int read_fd_;
    int write_fd_;
    bool is_socket_;
    int cancel_fd_;

    std::vector<uint8_t> buffer_;
    size_t pos_ = 0;

    std::mutex write_mutex_;
};

}  // namespace server
}  // namespace wws

#endif  // WWS_EVENT_STREAM_INTERNAL_H
