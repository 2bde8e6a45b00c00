#include "wxdown/core/util/Logger.h"
#include "TestSupport.h"
#include <cassert>
#include <string>

using wxdown::core::util::Logger;
using namespace wxdown_test;

int main() {
    assert(Logger::parse_level("debug") == Logger::Level::debug);
    assert(Logger::parse_level("warning") == Logger::Level::warn);
    assert(Logger::parse_level("critical") == Logger::Level::critical);
    assert(Logger::parse_level("DEBUG") == Logger::Level::info);
    assert(Logger::parse_level("") == Logger::Level::info);

    TempDir dir("logger");
    auto& log = Logger::instance();
    assert(log.mirror_to_file(dir.path / "wxdown.log"));
    assert(!log.mirror_to_file(dir.path / "missing-dir" / "x.log"));

    log.set_level(Logger::Level::warn);
    assert(!log.enabled(Logger::Level::info));
    assert(log.enabled(Logger::Level::error));
    wxdown::core::util::log_info("hidden line");
    wxdown::core::util::log_warn("shown line");

    auto text = read_text(dir.path / "wxdown.log");
    assert(text.find("hidden line") == std::string::npos);
    auto pos = text.find("[WARN] shown line\n");
    assert(pos != std::string::npos);
    // "YYYY-MM-DD HH:MM:SS.mmm " prefix
    assert(pos == 24);
    assert(text[4] == '-' && text[10] == ' ' && text[19] == '.');
    return 0;
}
