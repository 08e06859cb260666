#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace comserver {
namespace connection {

/**
 * @brief A timestamped string captured from the serial stream
 *
 * timestamp is Unix epoch seconds at the moment the bytes were received.
 */
struct ReceiveRecord {
    double timestamp = 0.0;
    std::string data;
};

// Post-processing applied by the connection to a received string
struct ReceiveOptions {
    std::optional<std::string> read_until;  // Terminator (excluded); nullopt = whole string
    bool strip = false;                     // Trim leading/trailing whitespace and newlines
};

/**
 * @brief Raised by a connection when the serial line itself fails
 *
 * Handlers map it to 502 with the exception message.
 */
class ConnectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Serial connection consumed by the REST builtins
 *
 * The HTTP layer shares a single instance between all worker threads and
 * performs no locking of its own. Implementations are responsible for
 * mutual exclusion on the serial line, send queuing and blocking reads.
 *
 * Timeouts and retry counts are properties of the implementation; the
 * builtins only observe the success/failure signal of each call.
 */
class IConnection {
public:
    virtual ~IConnection() = default;

    // Write an already composed payload (fragments joined + ending)
    virtual bool send(const std::string &payload) = 0;

    // num_before = 0 is the most recent record, 1 the one before it, ...
    virtual std::optional<ReceiveRecord> receive_str(std::size_t num_before, const ReceiveOptions &options) = 0;

    // Entire receive queue, oldest first
    virtual std::vector<ReceiveRecord> get_all_rcv_str(const ReceiveOptions &options) = 0;

    // First string received after the call; nullopt on timeout
    virtual std::optional<std::string> get(const ReceiveOptions &options) = 0;

    // Send payload, then return the first string received; nullopt on timeout
    virtual std::optional<std::string> get_first_response(const std::string &payload,
                                                          const ReceiveOptions &options) = 0;

    // Block until `response` is received or the connection times out
    virtual bool wait_for_response(const std::string &response, const ReceiveOptions &options) = 0;

    // Resend payload until `response` is received or retries are exhausted
    virtual bool send_for_response(const std::string &response, const std::string &payload,
                                   const ReceiveOptions &options) = 0;
};

}  // namespace connection
}  // namespace comserver
