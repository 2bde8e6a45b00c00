#pragma once
#include <vector>
#include <memory>
#include <mutex>
#include "wxdown/core/credential/CapturedSession.h"

namespace wxdown::core::credential {
class CredentialObserver {
public:
    virtual ~CredentialObserver() = default;
    virtual void on_credentials(const std::vector<ParsedCredential>& current) = 0;
};

// Fans each refreshed credential list out to live observers. Observers are
// held weakly; expired ones are skipped and pruned.
class CredentialDispatcher {
public:
    void add(std::shared_ptr<CredentialObserver> obs);
    void publish(const std::vector<ParsedCredential>& current);
    size_t observer_count();
private:
    std::mutex guard;
    std::vector<std::weak_ptr<CredentialObserver>> observers;
};

// Reports each refresh through the logger.
class CredentialLogObserver : public CredentialObserver {
public:
    void on_credentials(const std::vector<ParsedCredential>& current) override;
};
std::shared_ptr<CredentialLogObserver> make_credential_log_observer(CredentialDispatcher& d);
}
