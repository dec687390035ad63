#include "memcp/transport/stdio_transport.hpp"

#include <cerrno>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <utility>

namespace memcp {

StdioTransport::StdioTransport(StdioTransportConfig config)
    : config_(std::move(config))
{
    const bool input_is_null = (config_.input == nullptr);
    const bool output_is_null = (config_.output == nullptr);
    if ((input_is_null == true) || (output_is_null == true)) {
        throw std::invalid_argument("StdioTransport requires non-null input and output streams");
    }
}

const StdioTransportConfig& StdioTransport::config() const noexcept {
    return config_;
}

TransportResult<std::string> StdioTransport::read_line() {
    std::istream& input = *config_.input;

    std::string line;
    bool terminated = false;
    bool read_any = false;
    bool too_long = false;

    // A signal delivered during the blocking read surfaces as a failed read
    // with errno == EINTR.
    errno = 0;
    char ch = 0;
    while (input.get(ch)) {
        read_any = true;
        if (ch == '\n') {
            terminated = true;
            break;
        }
        if (line.size() < config_.max_line_length) {
            line.push_back(ch);
        } else {
            too_long = true;
        }
    }

    if (terminated == false) {
        if (errno == EINTR) {
            return tl::unexpected(TransportError{
                TransportError::Category::Interrupted,
                "read interrupted by signal"});
        }
        if (read_any == false) {
            return tl::unexpected(TransportError{
                TransportError::Category::Closed,
                "end of stream"});
        }
        // Final line without a terminator
    }

    if (too_long == true) {
        return tl::unexpected(TransportError{
            TransportError::Category::Protocol,
            "line exceeds max_line_length (" + std::to_string(config_.max_line_length) + " bytes)"});
    }

    if ((line.empty() == false) && (line.back() == '\r')) {
        line.pop_back();
    }
    return line;
}

TransportResult<void> StdioTransport::send(const Json& message) {
    std::string body = message.dump(-1, ' ', false, Json::error_handler_t::replace);
    body.push_back('\n');

    config_.output->write(body.data(), static_cast<std::streamsize>(body.size()));

    if (config_.auto_flush == true) {
        config_.output->flush();
    }

    if (config_.output->fail()) {
        return tl::unexpected(TransportError{
            TransportError::Category::Io,
            "failed to write to output stream"});
    }

    return TransportResult<void>{};
}

}  // namespace memcp
