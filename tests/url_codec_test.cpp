#include "wxdown/core/util/UrlCodec.h"
#include <cassert>
#include <string>

using namespace wxdown::core::util;

int main() {
    assert(decode_component("/a%20b/%2e%2e/c") == std::string("/a b/../c"));
    assert(decode_component("plain+text") == std::string("plain+text"));
    assert(!decode_component("%"));
    assert(!decode_component("%2"));
    assert(!decode_component("%zz"));

    assert(decode_form_value("a+b%2Bc") == "a b+c");
    assert(decode_form_value("100%") == "100%");
    assert(decode_form_value("%G1") == "%G1");

    assert(encode_component("AZaz09-_.!~*'()") == "AZaz09-_.!~*'()");
    assert(encode_component("a b&c=d/é") == "a%20b%26c%3Dd%2F%C3%A9");

    auto q = parse_query("https://mp.weixin.qq.com/s?__biz=MzA%3D%3D&uin=&key=a+b&flag#frag&x=1");
    assert(q.has_value());
    assert(q->size() == 4);
    assert(find_param(*q, "__biz") == std::string("MzA=="));
    assert(!find_param(*q, "uin"));
    assert(find_param(*q, "key") == std::string("a b"));
    assert(!find_param(*q, "flag"));
    assert(!find_param(*q, "x"));

    auto none = parse_query("https://example.com/path");
    assert(none && none->empty());
    assert(!parse_query("/relative?a=1"));
    assert(!parse_query("://missing-scheme?a=1"));
    assert(!parse_query("https://"));

    // First occurrence wins
    auto dup = parse_query("http://h/?k=1&k=2");
    assert(dup && find_param(*dup, "k") == std::string("1"));
    return 0;
}
