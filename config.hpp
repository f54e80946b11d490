#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>
#include "utils.hpp"
#include "shared_structure.hpp"

// Names or paths of the external tools.
struct Toolchain {
    std::string simg2img = "simg2img";
    std::string lpunpack = "lpunpack";
    std::string lpmake = "lpmake";
    std::string file = "file";
    std::string tar = "tar";

    // Every tool the pipeline invokes, in check order.
    std::vector<std::string> required() const { return {lpunpack, lpmake, simg2img, file, tar}; }
};

// Fixed parameters of the rebuilt super partition.
struct RepackLayout {
    uint32_t metadata_size = LP_METADATA_SIZE;
    uint32_t metadata_slots = LP_METADATA_SLOTS;
    std::string super_name = "super";
    std::string group_name = "main";
};

struct RunConfig {
    // Empty fields are asked for interactively.
    std::string super_image;
    std::string system_image;
    std::string work_dir;
    std::string output_name;

    bool assume_yes = false;
    bool write_manifest = false;

    Toolchain tools;
    RepackLayout layout;
};

// Result of command-line parsing.
struct CommandLine {
    bool show_help = false;
    RunConfig config;
};

// Merges the keys present in `doc` into `config`. Throws std::runtime_error on
// a value of the wrong type.
void apply_config_json(RunConfig& config, const json& doc);

// Reads a JSON config file and merges it into `config`.
void load_config_file(RunConfig& config, const std::filesystem::path& path);

// Parses argv[1..]. A --config file is applied first, flags override it.
// Throws std::invalid_argument on unknown options or missing option values.
CommandLine parse_command_line(const std::vector<std::string>& args);

// Rejects output base names that would escape the work directory.
void check_output_name(const std::string& name);

#endif // CONFIG_HPP
