#pragma once
#include <filesystem>
#include <string>

namespace wxdown::core::lifecycle {
// Headless browser handle that can print a page to PDF.
class BrowserRenderer {
public:
    virtual ~BrowserRenderer() = default;
    virtual bool render_pdf(const std::string& url, const std::filesystem::path& out_file) = 0;
    // Releases the browser; later render_pdf calls fail.
    virtual bool close() = 0;
};
}
