#include <ytarchive/config/config_helpers.h>

namespace ytarchive::config {

std::filesystem::path get_config_dir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "ytarchive";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".config" / "ytarchive";
    }
    return std::filesystem::path("~/.config") / "ytarchive";
}

} // namespace ytarchive::config
