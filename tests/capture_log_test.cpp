#include "wxdown/core/credential/CaptureLog.h"
#include <cassert>
#include <string>

using namespace wxdown::core::credential;

int main() {
    // Known keys, escapes, unicode and unknown keys
    {
        std::string json = R"([ {"biz":"Mz\"A","url":"https:\/\/mp.weixin.qq.com/s?a=1","set_cookie":"wap_sid2=x;",
            "timestamp":1700000000123.0,"nickname":"公众号 😀","round_head_img":null,
            "appmsg":{"idx":[1,2,{"k":true}],"note":"n"},"flag":false} ])";
        auto parsed = parse_capture_log(json);
        assert(parsed.has_value());
        assert(parsed->size() == 1);
        auto& s = (*parsed)[0];
        assert(s.bizId == "Mz\"A");
        assert(s.pageUrl == "https://mp.weixin.qq.com/s?a=1");
        assert(s.setCookieHeader == "wap_sid2=x;");
        assert(s.capturedAtEpochMs == 1700000000123);
        assert(s.displayName == "\xE5\x85\xAC\xE4\xBC\x97\xE5\x8F\xB7 \xF0\x9F\x98\x80");
        assert(s.avatarUrl.empty());
        assert(s.extraFields.size() == 2);
        assert(s.extraFields[0].first == "appmsg");
        assert(s.extraFields[0].second == R"({"idx":[1,2,{"k":true}],"note":"n"})");
        assert(s.extraFields[1].second == "false");

        // Rewriting keeps the unknown keys and re-reads to the same values
        auto again = parse_capture_log(serialize_capture_log(*parsed));
        assert(again.has_value() && again->size() == 1);
        auto& r = (*again)[0];
        assert(r.bizId == s.bizId);
        assert(r.displayName == s.displayName);
        assert(r.capturedAtEpochMs == s.capturedAtEpochMs);
        assert(r.extraFields == s.extraFields);
    }

    // Missing keys default to empty / zero
    {
        auto parsed = parse_capture_log(R"([{}, {"biz":"b"}])");
        assert(parsed && parsed->size() == 2);
        assert((*parsed)[0].bizId.empty());
        assert((*parsed)[1].bizId == "b");
        assert((*parsed)[1].capturedAtEpochMs == 0);
    }

    // Malformed documents
    {
        assert(!parse_capture_log(""));
        assert(!parse_capture_log("["));
        assert(!parse_capture_log("[{\"biz\":1}]"));
        assert(!parse_capture_log("[{\"timestamp\":\"x\"}]"));
        assert(!parse_capture_log("[{\"biz\":\"a\"},]"));
        assert(!parse_capture_log("[{\"biz\":\"a\\q\"}]"));
        assert(!parse_capture_log("[{\"x\":tru}]"));
        assert(!parse_capture_log("{}"));
        assert(!parse_capture_log("[] []"));
    }

    // Timestamps are written back with their original text
    {
        std::string json = R"([{"biz":"a","timestamp":1.5e12},{"biz":"b","timestamp":1700000000000.5},{"biz":"c","timestamp":null}])";
        auto parsed = parse_capture_log(json);
        assert(parsed && parsed->size() == 3);
        assert((*parsed)[0].capturedAtEpochMs == 1500000000000);
        assert((*parsed)[1].capturedAtEpochMs == 1700000000000);
        assert((*parsed)[2].capturedAtEpochMs == 0);
        std::string out = serialize_capture_log(*parsed);
        assert(out.find("\"timestamp\":1.5e12,") != std::string::npos);
        assert(out.find("\"timestamp\":1700000000000.5,") != std::string::npos);
        assert(out.find("\"timestamp\":null,") != std::string::npos);

        CapturedSession built;
        built.bizId = "d";
        built.capturedAtEpochMs = 42;
        assert(serialize_capture_log({built}).find("\"timestamp\":42,") != std::string::npos);
    }

    // Out of range timestamps are clamped to the Date range
    {
        auto parsed = parse_capture_log(R"([{"timestamp":1e300},{"timestamp":-1e400},{"timestamp":9223372036854775000}])");
        assert(parsed && parsed->size() == 3);
        assert((*parsed)[0].capturedAtEpochMs == 8640000000000000);
        assert((*parsed)[1].capturedAtEpochMs == -8640000000000000);
        assert((*parsed)[2].capturedAtEpochMs == 8640000000000000);
        assert(serialize_capture_log(*parsed).find("\"timestamp\":1e300,") != std::string::npos);
    }

    // Unpaired surrogate escapes are written back as escapes
    {
        auto parsed = parse_capture_log(R"([{"nickname":"a\ud800b","biz":"\udc01"}])");
        assert(parsed && parsed->size() == 1);
        std::string out = serialize_capture_log(*parsed);
        assert(out.find(R"("nickname":"a\ud800b")") != std::string::npos);
        assert(out.find(R"("biz":"\udc01")") != std::string::npos);
        auto again = parse_capture_log(out);
        assert(again && (*again)[0].displayName == (*parsed)[0].displayName);

        // Paired surrogates stay literal UTF-8
        auto emoji = parse_capture_log(R"([{"nickname":"😀"}])");
        assert(emoji && serialize_capture_log(*emoji).find("\xF0\x9F\x98\x80") != std::string::npos);
    }

    assert(serialize_capture_log({}) == "[]");
    return 0;
}
