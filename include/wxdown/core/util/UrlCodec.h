#pragma once
#include <string>
#include <string_view>
#include <optional>
#include <vector>
#include <utility>

namespace wxdown::core::util {
using QueryParam = std::pair<std::string, std::string>;

// Strict percent decoding of a path component. Malformed escapes yield nullopt.
std::optional<std::string> decode_component(std::string_view in);

// Form-style decoding used for query values: '+' is a space and malformed
// escapes are kept literally.
std::string decode_form_value(std::string_view in);

// Same character set as ECMAScript encodeURIComponent, applied bytewise.
std::string encode_component(std::string_view in);

// Splits the query of an absolute URL ("scheme://..."). Returns nullopt when
// the text is not an absolute URL.
std::optional<std::vector<QueryParam>> parse_query(std::string_view url);

// First value for name, if present and non-empty.
std::optional<std::string> find_param(const std::vector<QueryParam>& params, std::string_view name);
}
