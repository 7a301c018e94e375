#pragma once

#include "collector/core/result.hpp"
#include "collector/network/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>

namespace collector::network {

enum class ParseState {
    METHOD,
    URL,
    VERSION,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.x request parser
 *
 * Feed bytes as they arrive; parse() yields true once a full request is
 * available. Request head is parsed byte by byte, the body is copied in bulk
 * up to Content-Length.
 *
 * Errors carry ErrorCode::InvalidRequest for malformed input and
 * ErrorCode::PayloadTooLarge when Content-Length exceeds the configured limit.
 */
class HttpParser {
public:
    static constexpr std::size_t kMaxHeadSize = 64 * 1024;

    explicit HttpParser(std::uint64_t payload_limit = 100ULL * 1024 * 1024)
        : payload_limit_(payload_limit) {
        reset();
    }

    Result<bool> parse(const char* data, std::size_t len) {
        std::size_t i = 0;
        while (i < len) {
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
            if (state_ == ParseState::PARSE_ERROR) {
                return Err<bool>(ErrorCode::InvalidRequest, "Parser in error state");
            }

            if (state_ == ParseState::BODY) {
                const std::size_t wanted = static_cast<std::size_t>(content_length_ - request_.body.size());
                const std::size_t take = std::min(wanted, len - i);
                request_.body.insert(request_.body.end(),
                                     reinterpret_cast<const uint8_t*>(data + i),
                                     reinterpret_cast<const uint8_t*>(data + i + take));
                i += take;
                if (request_.body.size() == content_length_) {
                    state_ = ParseState::COMPLETE;
                }
                continue;
            }

            const char c = data[i++];
            if (++head_size_ > kMaxHeadSize) {
                return fail(ErrorCode::InvalidRequest, "Request head too large");
            }
            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            switch (state_) {
                case ParseState::METHOD: ok = parse_method(c); break;
                case ParseState::URL: ok = parse_url(c); break;
                case ParseState::VERSION: ok = parse_version(c); break;
                case ParseState::HEADER_NAME: ok = parse_header_name(c); break;
                case ParseState::HEADER_VALUE: ok = parse_header_value(c); break;
                default: break;
            }
            if (error_) {
                state_ = ParseState::PARSE_ERROR;
                return Err<bool>(*error_);
            }
            if (!ok) {
                return fail(ErrorCode::InvalidRequest,
                            "Malformed request at line " + std::to_string(line_));
            }
        }

        return Ok(state_ == ParseState::COMPLETE);
    }

    HttpRequest get_request() const { return request_; }

    // Moves the parsed request out; the parser must be reset before reuse.
    HttpRequest take_request() { return std::move(request_); }

    bool is_complete() const { return state_ == ParseState::COMPLETE; }

    void reset() {
        state_ = ParseState::METHOD;
        request_ = HttpRequest();
        buffer_.clear();
        current_header_name_.clear();
        content_length_ = 0;
        head_size_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
        error_.reset();
    }

private:
    Result<bool> fail(ErrorCode code, std::string message) {
        state_ = ParseState::PARSE_ERROR;
        return Err<bool>(code, std::move(message));
    }

    bool parse_method(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.method = HttpMethodUtils::from_string(buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                return false;
            }
            buffer_.clear();
            state_ = ParseState::URL;
            return true;
        }
        if (!std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_url(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.url = buffer_;
            buffer_.clear();
            state_ = ParseState::VERSION;
            return true;
        }
        if (!std::isprint(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_version(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            if (buffer_ == "HTTP/1.1") {
                request_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                request_.version = HttpVersion::HTTP_1_0;
            } else {
                return false;
            }
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            return end_of_head();
        }
        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return false;
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
                buffer_.pop_back();
            }
            request_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    // Headers are complete: decide whether a body follows.
    bool end_of_head() {
        if (request_.has_header("Transfer-Encoding")) {
            error_ = Error{ErrorCode::InvalidRequest, "Transfer-Encoding is not supported"};
            return false;
        }

        const std::string header = request_.get_header("Content-Length");
        if (header.empty()) {
            state_ = ParseState::COMPLETE;
            return true;
        }

        std::uint64_t length = 0;
        for (char digit : header) {
            if (!std::isdigit(static_cast<unsigned char>(digit)) || length > payload_limit_) {
                error_ = Error{ErrorCode::InvalidRequest, "Invalid Content-Length: " + header};
                return false;
            }
            length = length * 10 + static_cast<std::uint64_t>(digit - '0');
        }
        if (length > payload_limit_) {
            error_ = Error{ErrorCode::PayloadTooLarge,
                           "Content-Length " + header + " exceeds limit of " +
                           std::to_string(payload_limit_) + " bytes"};
            return false;
        }

        content_length_ = length;
        if (content_length_ == 0) {
            state_ = ParseState::COMPLETE;
        } else {
            request_.body.reserve(static_cast<std::size_t>(content_length_));
            state_ = ParseState::BODY;
        }
        return true;
    }

    std::uint64_t payload_limit_;
    ParseState state_;
    HttpRequest request_;
    std::string buffer_;
    std::string current_header_name_;
    std::uint64_t content_length_;
    std::size_t head_size_;
    std::size_t line_;
    bool last_char_was_cr_;
    std::optional<Error> error_;
};

} // namespace collector::network
