#pragma once
#include <string>
#include <string_view>
#include <optional>
#include <cstddef>

namespace wxdown::core::util {
// Forward-only reader over JSON text (RFC 8259). Every read_* leaves the
// cursor unchanged on failure only where noted; callers treat any failure as
// a malformed document.
class JsonCursor {
public:
    explicit JsonCursor(std::string_view text) : text_(text) {}

    void skip_ws();
    bool at_end() { skip_ws(); return pos_ >= text_.size(); }
    // Skips whitespace, then consumes c if it is next.
    bool consume(char c);
    char peek() { skip_ws(); return pos_ < text_.size() ? text_[pos_] : '\0'; }
    size_t position() const { return pos_; }

    std::optional<std::string> read_string();
    std::optional<double> read_number();
    bool read_literal(std::string_view literal);
    // Validates and skips one value of any type; returns its raw text.
    std::optional<std::string_view> skip_value();

private:
    std::string_view text_;
    size_t pos_{0};
    int depth_{0};
    static constexpr int kMaxDepth = 64;
    bool read_hex4(unsigned& out);
};

std::string json_escape(std::string_view in);
}
