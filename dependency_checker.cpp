#include "dependency_checker.hpp"
#include "process_runner.hpp"
#include "errors.hpp"
#include <cstdlib>
#include <filesystem>

static std::string install_hint(const std::string& tool) {
    std::string base = std::filesystem::path(tool).filename().string();
    if (base == "file") return "pkg install file";
    if (base == "tar") return "pkg install tar";
    return "pkg install android-tools";
}

void check_dependencies(const Toolchain& tools, Console& console) {
    console.status("Checking dependencies...");

    for (const auto& tool : tools.required()) {
        auto resolved = find_executable(tool);
        if (!resolved.has_value()) {
            throw ToolError(tool + " is not installed (install with: " + install_hint(tool) + ")");
        }
    }

    console.success("All dependencies are installed");
}

void check_termux_environment(Console& console) {
    const char* prefix = std::getenv("PREFIX");
    if (prefix == nullptr || *prefix == '\0') {
        console.warning("This tool was built for Termux");
        console.warning("Some features may not work as expected");
    }
}
