#pragma once
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include "wxdown/core/lifecycle/BrowserRenderer.h"
#include "wxdown/core/util/Process.h"

namespace wxdown::core::lifecycle {
struct ChromeConfig {
    std::string binary { "chromium" };
    std::chrono::milliseconds renderTimeout { 60000 };
};

// Uses Chromium's --print-to-pdf, one browser process per render.
class HeadlessChromeRenderer : public BrowserRenderer {
public:
    explicit HeadlessChromeRenderer(ChromeConfig cfg = {}) : config(std::move(cfg)) {}
    ~HeadlessChromeRenderer() override;
    bool render_pdf(const std::string& url, const std::filesystem::path& out_file) override;
    bool close() override;
private:
    ChromeConfig config;
    std::mutex mu;
    util::ChildProcess current;
    std::atomic<bool> closed{false};
};
}
