#include "wxdown/core/credential/CredentialDispatcher.h"
#include "wxdown/core/util/Logger.h"
#include <fmt/format.h>
#include <algorithm>

namespace wxdown::core::credential {
using util::Logger;

void CredentialDispatcher::add(std::shared_ptr<CredentialObserver> obs) {
    std::lock_guard lock(guard);
    observers.push_back(obs);
}

void CredentialDispatcher::publish(const std::vector<ParsedCredential>& current) {
    std::vector<std::shared_ptr<CredentialObserver>> alive;
    {
        std::lock_guard lock(guard);
        observers.erase(std::remove_if(observers.begin(), observers.end(),
                                       [](const std::weak_ptr<CredentialObserver>& w){ return w.expired(); }),
                        observers.end());
        for (auto& w : observers) {
            if (auto s = w.lock()) alive.push_back(std::move(s));
        }
    }
    for (auto& o : alive) o->on_credentials(current);
}

size_t CredentialDispatcher::observer_count() {
    std::lock_guard lock(guard);
    return observers.size();
}

void CredentialLogObserver::on_credentials(const std::vector<ParsedCredential>& current) {
    auto valid = std::count_if(current.begin(), current.end(), [](const ParsedCredential& c){ return c.isValid; });
    Logger::instance().log(Logger::Level::info, fmt::format("credentials refreshed: {} total, {} valid", current.size(), valid));
    if (!Logger::instance().enabled(Logger::Level::debug)) return;
    for (auto& c : current) {
        Logger::instance().log(Logger::Level::debug, fmt::format("  biz {} {} captured {} {}", c.bizId, c.displayName, c.capturedAtFormatted, c.isValid ? "valid" : "expired"));
    }
}

std::shared_ptr<CredentialLogObserver> make_credential_log_observer(CredentialDispatcher& d) {
    auto o = std::make_shared<CredentialLogObserver>();
    d.add(o);
    return o;
}
}
