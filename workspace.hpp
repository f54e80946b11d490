#ifndef WORKSPACE_HPP
#define WORKSPACE_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <filesystem>
#include "console.hpp"

// Working directory of one run and the fixed names of its intermediate artifacts.
class Workspace {
private:
    std::filesystem::path root;
    std::string output_name;

public:
    Workspace(std::filesystem::path root, std::string output_name)
        : root(std::move(root)), output_name(std::move(output_name)) {}

    // Creates the directory (and parents) and returns it as an absolute path.
    static Workspace create(const std::string& dir, const std::string& output_name, Console& console);

    const std::filesystem::path& path() const { return root; }

    std::filesystem::path super_raw() const { return root / "super_raw.img"; }
    std::filesystem::path extracted_dir() const { return root / "extracted"; }
    std::filesystem::path package_dir() const { return root / "odin_package"; }
    std::filesystem::path repacked_image() const { return root / (output_name + "_super.img"); }
    std::filesystem::path tar_file() const { return root / (output_name + "_AP.tar"); }
    std::filesystem::path output_file() const { return root / (output_name + "_AP.tar.md5"); }
    std::filesystem::path manifest_file() const { return root / (output_name + "_AP.json"); }

    // Removes leftovers of earlier runs. Paths listed in `keep` are never touched,
    // and a stale directory holding one of them is left alone.
    void clean_stale(const std::vector<std::filesystem::path>& keep, Console& console) const;

    uint64_t available_space() const;

    // Advisory: true when `required` bytes fit in the free space of the work directory.
    bool check_space(uint64_t required, Console& console) const;

    // Deletes extracted/ and odin_package/, plus super_raw.img when it was generated here.
    void remove_intermediates(bool generated_super_raw, Console& console) const;
};

// True when `p` is `dir` itself or lies somewhere below it. Symlinks are resolved.
bool path_within(const std::filesystem::path& dir, const std::filesystem::path& p);

// Private directory under $TMPDIR, removed with everything in it on destruction.
class TempDir {
private:
    std::filesystem::path dir;

public:
    explicit TempDir(const std::string& prefix = "supergsi");
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return dir; }
};

#endif // WORKSPACE_HPP
