#include "wxdown/core/credential/CredentialWatcher.h"
#include "TestSupport.h"
#include <cassert>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>

using namespace wxdown::core::credential;
using namespace wxdown_test;

namespace {
class Recorder : public CredentialObserver {
public:
    void on_credentials(const std::vector<ParsedCredential>& current) override {
        std::lock_guard lock(m);
        calls++;
        last = current;
    }
    int call_count() { std::lock_guard lock(m); return calls; }
    std::vector<ParsedCredential> latest() { std::lock_guard lock(m); return last; }
private:
    std::mutex m;
    int calls{0};
    std::vector<ParsedCredential> last;
};

std::string session_json(const std::string& biz, long long ts) {
    return "{\"biz\":\"" + biz + "\",\"url\":\"https://mp.weixin.qq.com/s?__biz=" + biz +
           "&uin=U&key=K&pass_ticket=P\",\"set_cookie\":\"wap_sid2=SID; Path=/\",\"timestamp\":" + std::to_string(ts) + "}";
}
}

int main() {
    TempDir dir("watcher");
    auto log = dir.path / "credentials.json";

    // Dispatcher holds observers weakly
    {
        CredentialDispatcher d;
        auto kept = std::make_shared<Recorder>();
        d.add(kept);
        {
            auto dropped = std::make_shared<Recorder>();
            d.add(dropped);
            assert(d.observer_count() == 2);
        }
        d.publish({});
        assert(kept->call_count() == 1);
        assert(d.observer_count() == 1);
        auto logger = make_credential_log_observer(d);
        assert(d.observer_count() == 2);
        d.publish({});
        assert(kept->call_count() == 2);
    }

    // poll_once: nothing to read, then a change, then no change
    {
        CredentialWatcher w(log);
        auto rec = std::make_shared<Recorder>();
        w.dispatcher().add(rec);
        assert(!w.poll_once());
        assert(rec->call_count() == 0);

        write_text(log, "[" + session_json("A", 1000) + "," + session_json("B", 2000) + "]");
        assert(w.poll_once());
        auto list = rec->latest();
        assert(list.size() == 2);
        assert(list[0].bizId == "B");
        assert(list[1].bizId == "A");

        assert(!w.poll_once());
        assert(rec->call_count() == 1);

        // Size change is picked up even within the same mtime tick
        write_text(log, "[" + session_json("A", 1000) + "]");
        assert(w.poll_once());
        assert(rec->latest().size() == 1);

        // Malformed content publishes an empty list
        write_text(log, "[{");
        assert(w.poll_once());
        assert(rec->latest().empty());
    }

    // Background polling
    {
        write_text(log, "[]");
        WatcherConfig cfg;
        cfg.pollInterval = std::chrono::milliseconds(10);
        CredentialWatcher w(log, cfg);
        auto rec = std::make_shared<Recorder>();
        w.dispatcher().add(rec);
        assert(w.start());
        assert(w.running());
        assert(w.start());
        for (int i = 0; i < 300 && rec->call_count() == 0; ++i) std::this_thread::sleep_for(std::chrono::milliseconds(10));
        assert(rec->call_count() == 1);
        assert(rec->latest().empty());

        write_text(log, "[" + session_json("C", 3000) + "]");
        for (int i = 0; i < 300 && rec->call_count() < 2; ++i) std::this_thread::sleep_for(std::chrono::milliseconds(10));
        assert(rec->call_count() >= 2);
        assert(rec->latest().size() == 1 && rec->latest()[0].bizId == "C");

        w.stop();
        assert(!w.running());
        int after = rec->call_count();
        write_text(log, "[" + session_json("D", 4000) + "," + session_json("E", 5000) + "]");
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        assert(rec->call_count() == after);
    }
    return 0;
}
