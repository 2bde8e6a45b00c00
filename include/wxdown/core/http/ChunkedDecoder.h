#pragma once
#include <string>
#include <string_view>
#include <cstddef>

namespace wxdown::core::http {

// Incremental decoder for HTTP/1.1 chunked transfer coding.
// feed() may be called with arbitrary slices; decoded bytes accumulate until
// take_decoded(). Chunk extensions and trailer fields are skipped.
class ChunkedDecoder {
public:
    enum class State { SizeLine, Data, DataEnd, Trailer, Done, Error };

    // Returns number of bytes consumed from input. Bytes after the final
    // CRLF are not consumed.
    size_t feed(const char* data, size_t len);
    size_t feed(std::string_view data) { return feed(data.data(), data.size()); }

    bool finished() const { return state_ == State::Done; }
    bool error() const { return state_ == State::Error; }

    std::string take_decoded();

    State state() const { return state_; }
    size_t remaining_in_chunk() const { return remaining_; }

private:
    State state_ = State::SizeLine;
    std::string line_;
    size_t remaining_ = 0;
    std::string decoded_;
    bool take_line(const char* data, size_t len, size_t& off);
    bool apply_size_line();
};

// Convenience for complete bodies; empty result with ok=false on malformed input.
std::string decode_chunked_body(std::string_view body, bool& ok);

}
