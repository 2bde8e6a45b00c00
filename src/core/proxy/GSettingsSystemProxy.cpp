#include "wxdown/core/proxy/GSettingsSystemProxy.h"
#include "wxdown/core/util/Logger.h"
#include "wxdown/core/util/Process.h"
#include <fmt/format.h>

namespace wxdown::core::proxy {
using util::log_info;
using util::log_warn;

namespace {
constexpr const char* kProxySchema = "org.gnome.system.proxy";
constexpr const char* kHttpSchema = "org.gnome.system.proxy.http";
constexpr const char* kHttpsSchema = "org.gnome.system.proxy.https";

// gsettings prints strings as 'value'.
std::string unquote(std::string v) {
    while (!v.empty() && (v.back() == '\n' || v.back() == '\r' || v.back() == ' ')) v.pop_back();
    if (v.size() >= 2 && v.front() == '\'' && v.back() == '\'') v = v.substr(1, v.size() - 2);
    return v;
}
}

bool GSettingsSystemProxy::run_set(const std::string& schema, const std::string& key, const std::string& value) {
    auto r = util::run_command({ tool_, "set", schema, key, value });
    if (!r || r->exitCode != 0) {
        log_warn(fmt::format("gsettings set {} {} failed", schema, key));
        return false;
    }
    return true;
}

std::optional<std::string> GSettingsSystemProxy::run_get(const std::string& schema, const std::string& key) {
    auto r = util::run_command({ tool_, "get", schema, key });
    if (!r || r->exitCode != 0) return std::nullopt;
    return unquote(r->output);
}

bool GSettingsSystemProxy::set(const http::Endpoint& endpoint) {
    auto port = std::to_string(endpoint.port);
    bool ok = run_set(kHttpSchema, "host", endpoint.host)
           && run_set(kHttpSchema, "port", port)
           && run_set(kHttpsSchema, "host", endpoint.host)
           && run_set(kHttpsSchema, "port", port)
           && run_set(kProxySchema, "mode", "manual");
    if (ok) log_info(fmt::format("system proxy set to {}", endpoint.to_string()));
    return ok;
}

bool GSettingsSystemProxy::clear() {
    bool ok = run_set(kProxySchema, "mode", "none");
    if (ok) log_info("system proxy cleared");
    return ok;
}

std::optional<http::Endpoint> GSettingsSystemProxy::current() {
    auto mode = run_get(kProxySchema, "mode");
    if (!mode || *mode != "manual") return std::nullopt;
    auto host = run_get(kHttpSchema, "host");
    auto port = run_get(kHttpSchema, "port");
    if (!host || host->empty() || !port) return std::nullopt;
    return http::parse_endpoint(*host + ":" + *port);
}
}
