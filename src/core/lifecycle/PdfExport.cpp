#include "wxdown/core/lifecycle/PdfExport.h"
#include "wxdown/core/util/Logger.h"
#include <fmt/format.h>

namespace wxdown::core::lifecycle {
using util::log_error;

std::string pdf_file_name(const std::string& url) {
    std::string trimmed = url;
    auto pos = trimmed.find("/index.html");
    if (pos != std::string::npos) trimmed.erase(pos, std::string("/index.html").size());
    auto slash = trimmed.rfind('/');
    std::string last = slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
    return last + ".pdf";
}

std::optional<std::filesystem::path> generate_pdf(LifecycleContext& ctx, const std::string& url, const std::filesystem::path& out_dir) {
    auto* browser = ctx.ensure_browser();
    if (!browser) {
        log_error("no browser available for PDF export");
        return std::nullopt;
    }
    std::error_code ec;
    std::filesystem::create_directories(out_dir, ec);
    if (ec) {
        log_error(fmt::format("cannot create {}: {}", out_dir.string(), ec.message()));
        return std::nullopt;
    }
    auto out = out_dir / pdf_file_name(url);
    if (!browser->render_pdf(url, out)) return std::nullopt;
    return out;
}
}
