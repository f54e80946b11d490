#include "odin_packager.hpp"
#include "errors.hpp"
#include "process_runner.hpp"
#include "utils.hpp"
#include <md5.hpp>
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

std::string md5_file(const fs::path& path, uint64_t length) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open file: " + path.string());
    }

    MD5 hasher;
    std::vector<char> buffer(1024 * 1024);
    uint64_t remaining = length;
    while (remaining > 0 && in) {
        uint64_t to_read = std::min<uint64_t>(buffer.size(), remaining);
        in.read(buffer.data(), to_read);
        auto got = static_cast<size_t>(in.gcount());
        if (got == 0) break;
        hasher.update(reinterpret_cast<const unsigned char*>(buffer.data()), got);
        remaining -= got;
    }
    hasher.finalize();

    auto raw_digest = hasher.get_raw_digest();
    return bytes_to_hex(std::vector<uint8_t>(raw_digest.begin(), raw_digest.end()));
}

std::string odin_trailer(const std::string& md5_hex, const std::string& file_name) {
    return md5_hex + "  " + file_name;
}

bool verify_odin_trailer(const fs::path& path) {
    const std::string name = path.filename().string();
    const uint64_t trailer_len = 32 + 2 + name.size();
    uint64_t total = ::file_size(path);
    if (total < trailer_len) return false;

    std::ifstream in(path, std::ios::binary);
    in.seekg(static_cast<std::streamoff>(total - trailer_len));
    std::string trailer(trailer_len, '\0');
    in.read(&trailer[0], trailer_len);
    if (!in) return false;

    std::string expected_tail = "  " + name;
    if (trailer.compare(32, std::string::npos, expected_tail) != 0) return false;

    std::string digest = trailer.substr(0, 32);
    return is_md5_hex(digest) && digest == md5_file(path, total - trailer_len);
}

fs::path OdinPackager::package(const fs::path& repacked_image) {
    console.status("Preparing the Odin package...");

    fs::remove_all(workspace.package_dir());
    fs::create_directories(workspace.package_dir());
    fs::path staged = workspace.package_dir() / "super.img";
    fs::rename(repacked_image, staged);

    console.status("Creating TAR archive for Odin...");
    fs::path tar_path = workspace.tar_file();
    fs::remove(tar_path);
    auto result = exec_command({tools.tar, "-cf", tar_path.string(), "-C", workspace.package_dir().string(),
                                staged.filename().string()});
    if (!result.ok() || !fs::exists(tar_path)) {
        console.passthrough(result.output);
        throw ToolError("Failed to create TAR archive (" + format_command({tools.tar, "-cf", tar_path.string()}) +
                        " exited with " + std::to_string(result.exit_code) + ")");
    }
    console.success("TAR archive created: " + format_iec_size(::file_size(tar_path)));

    console.status("Computing MD5 and finalizing...");
    digest = md5_file(tar_path);

    fs::path final_path = workspace.output_file();
    fs::rename(tar_path, final_path);

    std::ofstream out(final_path, std::ios::binary | std::ios::app);
    if (!out) {
        throw std::runtime_error("Failed to open " + final_path.string() + " for appending");
    }
    out << odin_trailer(digest, final_path.filename().string());
    out.close();
    if (!out) {
        throw std::runtime_error("Failed to append MD5 trailer to " + final_path.string());
    }

    console.success("MD5: " + digest);
    return final_path;
}
