#include "wxdown/core/http/ChunkedDecoder.h"
#include <algorithm>
#include <limits>

namespace wxdown::core::http {
namespace {
constexpr size_t kMaxLine = 4096;

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}
}

// Accumulates into line_ until CRLF; true when a full line (without CRLF) is ready.
bool ChunkedDecoder::take_line(const char* data, size_t len, size_t& off) {
    while (off < len) {
        char c = data[off++];
        line_.push_back(c);
        if (line_.size() >= 2 && line_[line_.size() - 2] == '\r' && c == '\n') {
            line_.resize(line_.size() - 2);
            return true;
        }
        if (line_.size() > kMaxLine) { state_ = State::Error; return false; }
    }
    return false;
}

bool ChunkedDecoder::apply_size_line() {
    size_t value = 0;
    bool any = false;
    for (char c : line_) {
        if (c == ';' || c == ' ' || c == '\t') break;
        int d = hex_digit(c);
        if (d < 0) return false;
        if (value > (std::numeric_limits<size_t>::max() >> 4)) return false;
        value = (value << 4) | static_cast<size_t>(d);
        any = true;
    }
    if (!any) return false;
    remaining_ = value;
    state_ = value == 0 ? State::Trailer : State::Data;
    return true;
}

size_t ChunkedDecoder::feed(const char* data, size_t len) {
    size_t off = 0;
    while (off < len && state_ != State::Done && state_ != State::Error) {
        switch (state_) {
            case State::SizeLine:
                if (take_line(data, len, off)) {
                    if (!apply_size_line()) state_ = State::Error;
                    line_.clear();
                }
                break;
            case State::Data: {
                size_t take = std::min(len - off, remaining_);
                decoded_.append(data + off, take);
                off += take; remaining_ -= take;
                if (remaining_ == 0) state_ = State::DataEnd;
                break;
            }
            case State::DataEnd:
                if (take_line(data, len, off)) {
                    state_ = line_.empty() ? State::SizeLine : State::Error;
                    line_.clear();
                }
                break;
            case State::Trailer:
                if (take_line(data, len, off)) {
                    if (line_.empty()) state_ = State::Done;
                    line_.clear();
                }
                break;
            case State::Done: case State::Error: break;
        }
    }
    return off;
}

std::string ChunkedDecoder::take_decoded() {
    std::string out; out.swap(decoded_); return out;
}

std::string decode_chunked_body(std::string_view body, bool& ok) {
    ChunkedDecoder dec;
    dec.feed(body);
    ok = dec.finished();
    if (!ok) return {};
    return dec.take_decoded();
}
}
