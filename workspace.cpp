#include "workspace.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

// Names produced by earlier runs that may be deleted on start.
bool is_stale_artifact(const std::string& name) {
    if (name == "super_raw.img") return true;
    if (name.find(".tar") != std::string::npos) return true;
    if (ends_with(name, ".img")) {
        return ends_with(name, "_super.img") || ends_with(name, "_modified.img") ||
               starts_with(name, "temp_") || starts_with(name, "work_");
    }
    return false;
}

bool same_file(const fs::path& a, const fs::path& b) {
    std::error_code ec;
    bool same = fs::equivalent(a, b, ec);
    return !ec && same;
}

}

bool path_within(const fs::path& dir, const fs::path& p) {
    std::error_code ec;
    fs::path base = fs::weakly_canonical(dir, ec);
    if (ec) base = dir.lexically_normal();
    fs::path target = fs::weakly_canonical(p, ec);
    if (ec) target = p.lexically_normal();

    fs::path rel = target.lexically_relative(base);
    if (rel.empty()) return false;
    return *rel.begin() != "..";
}

Workspace Workspace::create(const std::string& dir, const std::string& output_name, Console& console) {
    fs::path root = fs::absolute(expand_home(dir));
    console.status("Creating work directory: " + root.string());

    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec || !fs::is_directory(root)) {
        throw std::runtime_error("Could not create directory " + root.string() +
                                 (ec ? ": " + ec.message() : ""));
    }
    return Workspace(root.lexically_normal(), output_name);
}

void Workspace::clean_stale(const std::vector<fs::path>& keep, Console& console) const {
    console.status("Removing old temporary files...");

    auto protected_path = [&](const fs::path& p) {
        return std::any_of(keep.begin(), keep.end(), [&](const fs::path& k) { return same_file(p, k); });
    };

    for (const auto& dir : {extracted_dir(), package_dir()}) {
        if (!fs::exists(dir)) continue;
        bool holds_kept = std::any_of(keep.begin(), keep.end(), [&](const fs::path& k) { return path_within(dir, k); });
        if (holds_kept) {
            console.warning("Keeping " + dir.string() + ": it contains an input file");
            continue;
        }
        fs::remove_all(dir);
    }

    std::vector<fs::path> stale;
    for (const auto& entry : fs::directory_iterator(root)) {
        if (!entry.is_regular_file()) continue;
        if (!is_stale_artifact(entry.path().filename().string())) continue;
        if (protected_path(entry.path())) continue;
        stale.push_back(entry.path());
    }
    for (const auto& p : stale) {
        fs::remove(p);
    }
}

uint64_t Workspace::available_space() const {
    std::error_code ec;
    auto info = fs::space(root, ec);
    if (ec) {
        throw std::runtime_error("Cannot query free space of " + root.string() + ": " + ec.message());
    }
    return info.available;
}

bool Workspace::check_space(uint64_t required, Console& console) const {
    uint64_t available = available_space();
    if (required > available) {
        console.error("Not enough free space!");
        console.error("Required: " + format_iec_size(required));
        console.error("Available: " + format_iec_size(available));
        return false;
    }
    return true;
}

void Workspace::remove_intermediates(bool generated_super_raw, Console& console) const {
    console.status("Removing temporary files...");
    fs::remove_all(extracted_dir());
    fs::remove_all(package_dir());
    if (generated_super_raw) {
        fs::remove(super_raw());
    }
}

TempDir::TempDir(const std::string& prefix) {
    std::string tmpl = (fs::temp_directory_path() / (prefix + ".XXXXXX")).string();
    std::vector<char> buffer(tmpl.begin(), tmpl.end());
    buffer.push_back('\0');
    if (mkdtemp(buffer.data()) == nullptr) {
        throw std::runtime_error("mkdtemp failed for " + tmpl + ": " + std::strerror(errno));
    }
    dir = buffer.data();
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(dir, ec);
}
