#pragma once
#include <string>
#include <vector>
#include "wxdown/core/proxy/SystemProxy.h"

namespace wxdown::core::proxy {
// GNOME desktop proxy (org.gnome.system.proxy) driven through the gsettings tool.
class GSettingsSystemProxy : public SystemProxy {
public:
    explicit GSettingsSystemProxy(std::string tool = "gsettings") : tool_(std::move(tool)) {}
    bool set(const http::Endpoint& endpoint) override;
    bool clear() override;
    std::optional<http::Endpoint> current() override;
private:
    std::string tool_;
    bool run_set(const std::string& schema, const std::string& key, const std::string& value);
    std::optional<std::string> run_get(const std::string& schema, const std::string& key);
};
}
