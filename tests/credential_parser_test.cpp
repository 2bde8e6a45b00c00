#include "wxdown/core/credential/CredentialParser.h"
#include <cassert>
#include <chrono>
#include <cstdint>
#include <limits>
#include <string>

using namespace wxdown::core::credential;
using std::chrono::milliseconds;
using std::chrono::system_clock;

namespace {
const int64_t T = 1700000000000;

std::string session_json(const std::string& biz, const std::string& url, const std::string& cookie, int64_t ts,
                         const std::string& nickname = "", const std::string& avatar = "") {
    return "{\"biz\":\"" + biz + "\",\"url\":\"" + url + "\",\"set_cookie\":\"" + cookie + "\",\"timestamp\":" + std::to_string(ts)
         + ",\"nickname\":\"" + nickname + "\",\"round_head_img\":\"" + avatar + "\"}";
}

std::string article_url(const std::string& biz) {
    return "https://mp.weixin.qq.com/mp/getappmsgext?__biz=" + biz + "&uin=MTIz&key=k3y&pass_ticket=p%2Bq&devicetype=Windows";
}

const std::string kCookie = "wxuin=1; wap_sid2=CMsid2Value; Path=/; HttpOnly";

system_clock::time_point at(int64_t ms) { return system_clock::time_point(milliseconds(ms)); }
}

int main() {
    // Complete record
    {
        std::string log = "[" + session_json("MzA5", article_url("MzA5"), kCookie, T, "Daily", "http://wx.qlogo.cn/a b?x=1") + "]";
        auto list = extract_credentials(log, at(T));
        assert(list.size() == 1);
        auto& c = list[0];
        assert(c.bizId == "MzA5");
        assert(c.secretUin == "MTIz");
        assert(c.secretKey == "k3y");
        assert(c.passTicket == "p+q");
        assert(c.sessionCookieValue == "CMsid2Value");
        assert(c.displayName == "Daily");
        assert(c.avatarProxyUrl == "https://thirsty-alligator-94.deno.dev?url=http%3A%2F%2Fwx.qlogo.cn%2Fa%20b%3Fx%3D1");
        assert(c.capturedAtFormatted == format_capture_time(T));
        assert(c.capturedAtFormatted.size() == 19);
        assert(c.isValid);
    }

    // Empty avatar stays empty
    {
        std::string log = "[" + session_json("A", article_url("A"), kCookie, T) + "]";
        auto list = extract_credentials(log, at(T));
        assert(list.size() == 1);
        assert(list[0].avatarProxyUrl.empty());
    }

    // Each missing field drops the record; output counts only complete ones
    {
        std::string log = "["
            + session_json("ok1", article_url("ok1"), kCookie, T) + ","
            + session_json("nobiz", "https://mp.weixin.qq.com/s?uin=1&key=2&pass_ticket=3", kCookie, T + 1) + ","
            + session_json("nouin", "https://mp.weixin.qq.com/s?__biz=x&key=2&pass_ticket=3", kCookie, T + 2) + ","
            + session_json("nokey", "https://mp.weixin.qq.com/s?__biz=x&uin=1&pass_ticket=3", kCookie, T + 3) + ","
            + session_json("nopt", "https://mp.weixin.qq.com/s?__biz=x&uin=1&key=2", kCookie, T + 4) + ","
            + session_json("nocookie", article_url("x"), "wxuin=1; Path=/", T + 5) + ","
            + session_json("unterminated", article_url("x"), "wap_sid2=abc", T + 6) + ","
            + session_json("emptykey", "https://mp.weixin.qq.com/s?__biz=x&uin=1&key=&pass_ticket=3", kCookie, T + 7) + ","
            + session_json("relative", "/s?__biz=x&uin=1&key=2&pass_ticket=3", kCookie, T + 8) + ","
            + session_json("ok2", article_url("ok2"), kCookie, T + 9)
            + "]";
        auto list = extract_credentials(log, at(T));
        assert(list.size() == 2);
        assert(list[0].bizId == "ok2");
        assert(list[1].bizId == "ok1");
    }

    // Validity window: [T, T + 25min) valid, expired from T + 25min
    {
        const int64_t window = 25 * 60 * 1000;
        assert(is_within_validity(T, at(T)));
        assert(is_within_validity(T, at(T + window - 1)));
        assert(!is_within_validity(T, at(T + window)));
        assert(!is_within_validity(T, at(T + window + 60000)));
        std::string log = "[" + session_json("A", article_url("A"), kCookie, T) + "]";
        assert(extract_credentials(log, at(T + window - 1))[0].isValid);
        assert(!extract_credentials(log, at(T + window))[0].isValid);
    }

    // Most recent first; equal timestamps keep input order
    {
        std::string log = "["
            + session_json("old", article_url("old"), kCookie, T) + ","
            + session_json("tieA", article_url("tieA"), kCookie, T + 500) + ","
            + session_json("new", article_url("new"), kCookie, T + 1000) + ","
            + session_json("tieB", article_url("tieB"), kCookie, T + 500) + ","
            + session_json("tieC", article_url("tieC"), kCookie, T + 500)
            + "]";
        auto list = extract_credentials(log, at(T));
        assert(list.size() == 5);
        assert(list[0].bizId == "new");
        assert(list[1].bizId == "tieA");
        assert(list[2].bizId == "tieB");
        assert(list[3].bizId == "tieC");
        assert(list[4].bizId == "old");
    }

    // Malformed input never throws and yields nothing
    {
        assert(extract_credentials("", at(T)).empty());
        assert(extract_credentials("not json", at(T)).empty());
        assert(extract_credentials("[{\"biz\":\"a\",", at(T)).empty());
        assert(extract_credentials("{\"biz\":\"a\"}", at(T)).empty());
        assert(extract_credentials("[1,2,3]", at(T)).empty());
        assert(extract_credentials("[]", at(T)).empty());
        assert(extract_credentials("[] trailing", at(T)).empty());
    }

    // Cookie capture is non-greedy up to the first ';'
    {
        auto v = find_session_cookie("wap_sid2=first; other=1; wap_sid2=second;");
        assert(v && *v == "first");
        assert(!find_session_cookie("wap_sid2=;"));
        assert(!find_session_cookie(""));
        assert(!find_session_cookie("wap_sid2=abc\n;"));
        auto later = find_session_cookie("wap_sid2=\nx; wap_sid2=kept;");
        assert(later && *later == "kept");
    }

    // Very long cookie headers are scanned without recursion
    {
        std::string value(200000, 'a');
        assert(!find_session_cookie("wap_sid2=" + value));
        auto v = find_session_cookie("wap_sid2=" + value + "; Path=/");
        assert(v && v->size() == value.size());

        std::string log = "[" + session_json("long", article_url("long"), "wap_sid2=" + value, T) + ","
            + session_json("ok", article_url("ok"), kCookie, T) + "]";
        auto list = extract_credentials(log, at(T));
        assert(list.size() == 1);
        assert(list[0].bizId == "ok");
    }

    // Extreme timestamps neither overflow nor crash
    {
        const int64_t lo = std::numeric_limits<int64_t>::min();
        const int64_t hi = std::numeric_limits<int64_t>::max();
        assert(!is_within_validity(lo, at(T)));
        assert(is_within_validity(hi, at(T)));
        assert(is_within_validity(hi, system_clock::time_point::max()));
        assert(!is_within_validity(lo, system_clock::time_point::max()));

        std::string log = std::string("[")
            + R"({"biz":"far","url":")" + article_url("far") + R"(","set_cookie":")" + kCookie + R"(","timestamp":1e300},)"
            + R"({"biz":"big","url":")" + article_url("big") + R"(","set_cookie":")" + kCookie + R"(","timestamp":9223372036854775000},)"
            + R"({"biz":"past","url":")" + article_url("past") + R"(","set_cookie":")" + kCookie + R"(","timestamp":-1e300})"
            + "]";
        auto list = extract_credentials(log, at(T));
        assert(list.size() == 3);
        assert(list[0].bizId == "far");
        assert(list[1].bizId == "big");
        assert(list[2].bizId == "past");
        assert(list[0].isValid);
        assert(!list[2].isValid);
        // 8.64e15 ms is the year 275760
        assert(list[0].capturedAtFormatted.rfind("27576", 0) == 0);

        assert(format_capture_time(-1).rfind("1969-12-31", 0) == 0 || format_capture_time(-1).rfind("1970-01-01", 0) == 0);
        format_capture_time(lo);
        format_capture_time(hi);
    }
    return 0;
}
