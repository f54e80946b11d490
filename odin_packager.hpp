#ifndef ODIN_PACKAGER_HPP
#define ODIN_PACKAGER_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>
#include "config.hpp"
#include "console.hpp"
#include "workspace.hpp"

// Lowercase hex MD5 of the first `length` bytes of a file (the whole file by default).
std::string md5_file(const std::filesystem::path& path, uint64_t length = UINT64_MAX);

// The "<md5>  <file name>" line Odin expects at the end of a .tar.md5.
std::string odin_trailer(const std::string& md5_hex, const std::string& file_name);

// Checks that `path` ends with a trailer whose digest matches the bytes before it.
bool verify_odin_trailer(const std::filesystem::path& path);

// Turns <work>/<name>_super.img into <work>/<name>_AP.tar.md5. The archive
// itself is written by the external tar tool.
class OdinPackager {
private:
    const Workspace& workspace;
    const Toolchain& tools;
    Console& console;
    std::string digest;

public:
    OdinPackager(const Workspace& workspace, const Toolchain& tools, Console& console)
        : workspace(workspace), tools(tools), console(console) {}

    std::filesystem::path package(const std::filesystem::path& repacked_image);

    // MD5 of the tar, valid after package()
    const std::string& md5() const { return digest; }
};

#endif // ODIN_PACKAGER_HPP
