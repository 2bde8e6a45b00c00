#include "wxdown/core/credential/CredentialDispatcher.h"
#include "wxdown/core/credential/CredentialStore.h"
#include "wxdown/core/lifecycle/AppConfig.h"
#include "wxdown/core/lifecycle/HeadlessChromeRenderer.h"
#include "wxdown/core/lifecycle/LifecycleContext.h"
#include "wxdown/core/lifecycle/PdfExport.h"
#include "wxdown/core/proxy/GSettingsSystemProxy.h"
#include "wxdown/core/proxy/MitmdumpEngine.h"
#include "wxdown/core/proxy/ProxySession.h"
#include "wxdown/core/server/FileServer.h"
#include "wxdown/core/server/IndexScan.h"
#include "wxdown/core/tls/CaTrust.h"
#include "wxdown/core/util/Logger.h"
#include <iostream>
#include <string>
#include <vector>

using namespace wxdown::core;
using util::Logger;

namespace {
void print_help() {
    std::cout << "Usage: wxdown_cli [--log-level L] [--log-file file] [--data-dir dir] [--capture-log file]" << std::endl;
    std::cout << "                  [--list] [--remove biz] [--serve dir]... [--scan dir]" << std::endl;
    std::cout << "                  [--render url --out dir] [--chrome path]" << std::endl;
    std::cout << "                  [--start-proxy] [--mitmdump path] [--verify] [--probe-url url] [--probe-sentinel text]" << std::endl;
    std::cout << "                  [--check-ca [--ca-cert path]]" << std::endl;
    std::cout << "  Servers and the proxy session keep running until a line is read from stdin." << std::endl;
}

void print_credentials(const std::vector<credential::ParsedCredential>& list) {
    if (list.empty()) { std::cout << "no credentials captured" << std::endl; return; }
    for (auto& c : list) {
        std::cout << (c.isValid ? "[valid]   " : "[expired] ") << c.capturedAtFormatted << "  " << c.bizId << "  " << c.displayName << std::endl;
        std::cout << "    uin=" << c.secretUin << " key=" << c.secretKey << " pass_ticket=" << c.passTicket << " wap_sid2=" << c.sessionCookieValue << std::endl;
        if (!c.avatarProxyUrl.empty()) std::cout << "    avatar " << c.avatarProxyUrl << std::endl;
    }
}
}

int main(int argc, char** argv) {
    auto cfg = lifecycle::default_app_config();
    std::vector<std::string> args(argv + 1, argv + argc);
    bool list = false; bool start_proxy = false; bool verify = false; bool check_ca = false;
    std::vector<std::string> serve_dirs; std::vector<std::string> remove_biz; std::vector<std::string> scan_dirs;
    std::string render_url; std::string out_dir = ".";
    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];
        bool has_value = i + 1 < args.size();
        if (a == "--help" || a == "-h") { print_help(); return 0; }
        if (a == "--log-level" && has_value) { cfg.logLevel = Logger::parse_level(args[++i]); continue; }
        if (a == "--log-file" && has_value) { cfg.logFile = args[++i]; continue; }
        if (a == "--data-dir" && has_value) { lifecycle::set_data_dir(cfg, args[++i]); continue; }
        if (a == "--capture-log" && has_value) { cfg.captureLog = args[++i]; continue; }
        if (a == "--list") { list = true; continue; }
        if (a == "--remove" && has_value) { remove_biz.push_back(args[++i]); continue; }
        if (a == "--serve" && has_value) { serve_dirs.push_back(args[++i]); continue; }
        if (a == "--scan" && has_value) { scan_dirs.push_back(args[++i]); continue; }
        if (a == "--render" && has_value) { render_url = args[++i]; continue; }
        if (a == "--out" && has_value) { out_dir = args[++i]; continue; }
        if (a == "--chrome" && has_value) { cfg.chrome.binary = args[++i]; continue; }
        if (a == "--start-proxy") { start_proxy = true; continue; }
        if (a == "--mitmdump" && has_value) { cfg.mitmdump.binary = args[++i]; continue; }
        if (a == "--verify") { verify = true; continue; }
        if (a == "--probe-url" && has_value) { cfg.probe.url = args[++i]; continue; }
        if (a == "--probe-sentinel" && has_value) { cfg.probe.sentinel = args[++i]; continue; }
        if (a == "--check-ca") { check_ca = true; continue; }
        if (a == "--ca-cert" && has_value) { cfg.caCert = args[++i]; continue; }
        std::cerr << "unknown argument " << a << std::endl;
        print_help();
        return 2;
    }
    Logger::instance().set_level(cfg.logLevel);
    if (!cfg.logFile.empty() && !Logger::instance().mirror_to_file(cfg.logFile)) {
        std::cerr << "cannot open log file " << cfg.logFile.string() << std::endl;
        return 2;
    }

    auto system_proxy = std::make_shared<proxy::GSettingsSystemProxy>();
    lifecycle::LifecycleOptions opts;
    // Only a run that points the OS proxy somewhere owns clearing it.
    if (start_proxy) opts.systemProxy = system_proxy;
    opts.browserFactory = [&cfg]{ return std::make_unique<lifecycle::HeadlessChromeRenderer>(cfg.chrome); };
    lifecycle::LifecycleContext ctx(opts);
    int rc = 0;

    credential::CredentialStore store(cfg.captureLog);
    for (auto& biz : remove_biz) {
        bool ok = store.remove_by_biz(biz);
        std::cout << "remove " << biz << ": " << (ok ? "ok" : "failed") << std::endl;
        if (!ok) rc = 1;
    }
    if (list) print_credentials(store.credentials());

    for (auto& dir : scan_dirs) {
        for (auto& p : server::find_index_html_files(dir)) std::cout << p.string() << std::endl;
    }

    if (check_ca) {
        bool installed = tls::ca_installed(cfg.caCert);
        std::cout << "CA " << cfg.caCert.string() << ": " << (installed ? "trusted" : "not trusted") << std::endl;
        auto fp = tls::ca_fingerprint_sha256(cfg.caCert);
        if (!fp.empty()) std::cout << "SHA256 " << fp << std::endl;
        if (!installed) rc = 1;
    }

    bool wait_for_stdin = false;
    for (auto& dir : serve_dirs) {
        auto fs_server = server::acquire(ctx, dir);
        if (!fs_server) { rc = 1; continue; }
        std::cout << "serving " << fs_server->root().string() << " at " << fs_server->base_url() << std::endl;
        wait_for_stdin = true;
    }

    if (!render_url.empty()) {
        auto pdf = lifecycle::generate_pdf(ctx, render_url, out_dir);
        if (pdf) std::cout << "wrote " << pdf->string() << std::endl;
        else rc = 1;
    }

    std::shared_ptr<proxy::ProxySession> session;
    std::shared_ptr<credential::CredentialLogObserver> log_obs;
    if (start_proxy || verify) {
        auto engine = std::make_shared<proxy::MitmdumpEngine>(cfg.mitmdump);
        session = std::make_shared<proxy::ProxySession>(engine, system_proxy, lifecycle::session_config(cfg));
        log_obs = credential::make_credential_log_observer(session->watcher().dispatcher());
        if (start_proxy) {
            ctx.register_proxy_session(session);
            auto port = session->start();
            if (port) {
                std::cout << "interception proxy on 127.0.0.1:" << *port << std::endl;
                wait_for_stdin = true;
            } else {
                rc = 1;
            }
        }
        if (verify) {
            bool active = session->verify_active();
            std::cout << "interception " << (active ? "active" : "not active") << std::endl;
            if (!active) rc = 1;
        }
    }
    if (wait_for_stdin) {
        std::string line;
        std::getline(std::cin, line);
    }

    auto report = ctx.shutdown();
    if (!report.ok()) rc = rc ? rc : 3;
    Logger::instance().log(Logger::Level::info, "stopped");
    return rc;
}
