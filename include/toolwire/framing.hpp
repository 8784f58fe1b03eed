#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace toolwire {

enum class Framing {
    Newline,        // one JSON message per line
    ContentLength   // "Content-Length: N\r\n\r\n" header followed by N bytes
};

/// Parse "line"/"newline"/"content-length"; throws std::invalid_argument.
Framing framing_from_string(std::string_view s);

/// Splits an incoming byte stream into message frames. Bytes may arrive in
/// arbitrary chunks; a frame is returned once it is complete.
class FrameDecoder {
public:
    static constexpr size_t kDefaultMaxFrame = 16 * 1024 * 1024;

    explicit FrameDecoder(Framing framing = Framing::Newline,
                          size_t max_frame = kDefaultMaxFrame);

    /// Append raw bytes read from the stream.
    void feed(std::string_view bytes);

    /// Next complete frame, or nullopt if more bytes are needed.
    /// Throws McpParseError for an oversized frame or a malformed header;
    /// the offending frame is discarded and decoding can continue.
    std::optional<std::string> next();

    /// Called at end of stream. Returns a trailing unterminated line in
    /// newline mode; throws McpParseError when a Content-Length frame was cut
    /// short.
    std::optional<std::string> finish();

    size_t buffered() const { return buffer_.size() - pos_; }
    Framing framing() const { return framing_; }

private:
    std::optional<std::string> next_line();
    std::optional<std::string> next_content_length();
    void compact();

    Framing framing_;
    size_t max_frame_;
    std::string buffer_;
    size_t pos_ = 0;
    bool discarding_line_ = false;       // skipping the rest of an oversized line
    size_t skip_bytes_ = 0;              // body of a rejected Content-Length frame
    std::optional<size_t> body_length_;  // parsed header, waiting for the body
};

/// Wrap a serialized message for the wire.
std::string encode_frame(std::string_view payload, Framing framing);

} // namespace toolwire
