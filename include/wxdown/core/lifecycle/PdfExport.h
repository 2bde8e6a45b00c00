#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "wxdown/core/lifecycle/LifecycleContext.h"

namespace wxdown::core::lifecycle {
// "<last path segment>.pdf" with any "/index.html" removed first.
std::string pdf_file_name(const std::string& url);

// Renders url into out_dir through the context's browser, launching it on
// first use. Returns the written file.
std::optional<std::filesystem::path> generate_pdf(LifecycleContext& ctx, const std::string& url, const std::filesystem::path& out_dir);
}
