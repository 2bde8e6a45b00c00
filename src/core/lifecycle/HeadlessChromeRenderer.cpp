#include "wxdown/core/lifecycle/HeadlessChromeRenderer.h"
#include "wxdown/core/util/Logger.h"
#include <fmt/format.h>
#include <thread>

namespace wxdown::core::lifecycle {
using util::log_error;
using util::log_info;

HeadlessChromeRenderer::~HeadlessChromeRenderer() { close(); }

bool HeadlessChromeRenderer::render_pdf(const std::string& url, const std::filesystem::path& out_file) {
    if (closed.load()) return false;
    std::error_code ec;
    std::filesystem::remove(out_file, ec);
    {
        std::lock_guard lock(mu);
        std::vector<std::string> argv{ config.binary, "--headless", "--disable-gpu", "--no-pdf-header-footer",
                                       "--print-to-pdf=" + out_file.string(), url };
        if (!current.spawn(argv)) {
            log_error(fmt::format("could not launch {}", config.binary));
            return false;
        }
    }
    auto deadline = std::chrono::steady_clock::now() + config.renderTimeout;
    for (;;) {
        {
            std::lock_guard lock(mu);
            if (!current.running()) break;
            if (std::chrono::steady_clock::now() >= deadline) {
                log_error(fmt::format("rendering {} timed out", url));
                current.terminate();
                return false;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    bool ok = !closed.load() && std::filesystem::exists(out_file, ec);
    if (ok) log_info(fmt::format("rendered {} to {}", url, out_file.string()));
    else log_error(fmt::format("rendering {} produced no file", url));
    return ok;
}

bool HeadlessChromeRenderer::close() {
    if (closed.exchange(true)) return true;
    std::lock_guard lock(mu);
    return current.terminate();
}
}
