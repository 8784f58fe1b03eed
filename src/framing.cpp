#include "toolwire/framing.hpp"
#include "toolwire/error.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

namespace toolwire {

namespace {

constexpr size_t kMaxHeaderBytes = 8192;
constexpr std::string_view kHeaderEnd = "\r\n\r\n";
constexpr std::string_view kContentLength = "content-length:";

bool is_blank(std::string_view s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

bool starts_with_nocase(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != prefix[i]) return false;
    }
    return true;
}

// Returns the declared body length, or nullopt if the header block has none
// or it is not a plain decimal number.
std::optional<size_t> parse_content_length(std::string_view headers) {
    std::optional<size_t> length;
    size_t start = 0;
    while (start <= headers.size()) {
        size_t end = headers.find("\r\n", start);
        if (end == std::string_view::npos) end = headers.size();
        std::string_view line = headers.substr(start, end - start);
        if (starts_with_nocase(line, kContentLength)) {
            std::string_view value = line.substr(kContentLength.size());
            while (!value.empty() && value.front() == ' ') value.remove_prefix(1);
            while (!value.empty() && value.back() == ' ') value.remove_suffix(1);
            if (value.empty() || value.size() > 12) return std::nullopt;
            size_t n = 0;
            for (char c : value) {
                if (c < '0' || c > '9') return std::nullopt;
                n = n * 10 + static_cast<size_t>(c - '0');
            }
            length = n;
        }
        start = end + 2;
    }
    return length;
}

} // anonymous namespace

Framing framing_from_string(std::string_view s) {
    if (s == "line" || s == "newline") return Framing::Newline;
    if (s == "content-length") return Framing::ContentLength;
    throw std::invalid_argument("Unknown framing: " + std::string(s));
}

FrameDecoder::FrameDecoder(Framing framing, size_t max_frame)
    : framing_(framing), max_frame_(max_frame) {
}

void FrameDecoder::feed(std::string_view bytes) {
    compact();
    buffer_.append(bytes.data(), bytes.size());
}

void FrameDecoder::compact() {
    if (pos_ == 0) return;
    buffer_.erase(0, pos_);
    pos_ = 0;
}

std::optional<std::string> FrameDecoder::next() {
    return framing_ == Framing::Newline ? next_line() : next_content_length();
}

std::optional<std::string> FrameDecoder::next_line() {
    while (true) {
        size_t nl = buffer_.find('\n', pos_);
        if (nl == std::string::npos) {
            if (discarding_line_) {
                pos_ = buffer_.size();
                return std::nullopt;
            }
            if (buffered() > max_frame_) {
                discarding_line_ = true;
                pos_ = buffer_.size();
                throw McpParseError("Frame exceeds " + std::to_string(max_frame_) + " bytes");
            }
            return std::nullopt;
        }

        std::string line = buffer_.substr(pos_, nl - pos_);
        pos_ = nl + 1;

        if (discarding_line_) {
            discarding_line_ = false;
            continue;
        }
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.size() > max_frame_) {
            throw McpParseError("Frame exceeds " + std::to_string(max_frame_) + " bytes");
        }
        if (is_blank(line)) continue;
        return line;
    }
}

std::optional<std::string> FrameDecoder::next_content_length() {
    if (skip_bytes_ > 0) {
        size_t n = std::min(skip_bytes_, buffered());
        pos_ += n;
        skip_bytes_ -= n;
        if (skip_bytes_ > 0) return std::nullopt;
    }

    if (!body_length_) {
        // Tolerate stray line breaks between frames.
        while (pos_ < buffer_.size() && (buffer_[pos_] == '\r' || buffer_[pos_] == '\n')) {
            ++pos_;
        }
        size_t header_end = buffer_.find(kHeaderEnd, pos_);
        if (header_end == std::string::npos) {
            if (buffered() > kMaxHeaderBytes) {
                pos_ = buffer_.size();
                throw McpParseError("Frame header too large");
            }
            return std::nullopt;
        }

        std::string_view headers(buffer_.data() + pos_, header_end - pos_);
        auto length = parse_content_length(headers);
        pos_ = header_end + kHeaderEnd.size();
        if (!length) {
            throw McpParseError("Missing or invalid Content-Length header");
        }
        if (*length > max_frame_) {
            skip_bytes_ = *length;
            throw McpParseError("Frame exceeds " + std::to_string(max_frame_) + " bytes");
        }
        body_length_ = *length;
    }

    if (buffered() < *body_length_) return std::nullopt;

    std::string body = buffer_.substr(pos_, *body_length_);
    pos_ += *body_length_;
    body_length_.reset();
    return body;
}

std::optional<std::string> FrameDecoder::finish() {
    std::string rest = buffer_.substr(pos_);
    buffer_.clear();
    pos_ = 0;

    if (framing_ == Framing::Newline) {
        const bool was_discarding = discarding_line_;
        discarding_line_ = false;
        if (was_discarding || is_blank(rest)) return std::nullopt;
        if (!rest.empty() && rest.back() == '\r') rest.pop_back();
        return rest;
    }

    const bool mid_frame = body_length_.has_value() || !is_blank(rest);
    body_length_.reset();
    skip_bytes_ = 0;
    if (mid_frame) {
        throw McpParseError("Stream ended inside a frame");
    }
    return std::nullopt;
}

std::string encode_frame(std::string_view payload, Framing framing) {
    std::string out;
    if (framing == Framing::ContentLength) {
        out = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";
        out.append(payload.data(), payload.size());
    } else {
        out.reserve(payload.size() + 1);
        out.append(payload.data(), payload.size());
        out += '\n';
    }
    return out;
}

} // namespace toolwire
