#include "config.hpp"
#include <fstream>
#include <optional>
#include <stdexcept>

namespace {

template<typename T>
void read_key(const json& doc, const char* key, T& target) {
    if (!doc.contains(key) || doc[key].is_null()) return;
    try {
        target = doc[key].get<T>();
    } catch (const json::type_error&) {
        throw std::runtime_error(std::string("Config key '") + key + "' has the wrong type");
    }
}

// json's get<uint32_t>() wraps negative numbers, so range-check first
void read_key(const json& doc, const char* key, uint32_t& target) {
    if (!doc.contains(key) || doc[key].is_null()) return;
    const json& value = doc[key];
    if (!value.is_number_unsigned() || value.get<uint64_t>() > UINT32_MAX) {
        throw std::runtime_error(std::string("Config key '") + key + "' must be an integer between 0 and " +
                                 std::to_string(UINT32_MAX));
    }
    target = static_cast<uint32_t>(value.get<uint64_t>());
}

}

void apply_config_json(RunConfig& config, const json& doc) {
    if (!doc.is_object()) {
        throw std::runtime_error("Config file must contain a JSON object");
    }

    read_key(doc, "super_image", config.super_image);
    read_key(doc, "system_image", config.system_image);
    read_key(doc, "work_dir", config.work_dir);
    read_key(doc, "output_name", config.output_name);
    read_key(doc, "assume_yes", config.assume_yes);
    read_key(doc, "manifest", config.write_manifest);

    if (doc.contains("tools")) {
        const json& tools = doc["tools"];
        if (!tools.is_object()) throw std::runtime_error("Config key 'tools' must be an object");
        read_key(tools, "simg2img", config.tools.simg2img);
        read_key(tools, "lpunpack", config.tools.lpunpack);
        read_key(tools, "lpmake", config.tools.lpmake);
        read_key(tools, "file", config.tools.file);
        read_key(tools, "tar", config.tools.tar);
    }

    if (doc.contains("layout")) {
        const json& layout = doc["layout"];
        if (!layout.is_object()) throw std::runtime_error("Config key 'layout' must be an object");
        read_key(layout, "metadata_size", config.layout.metadata_size);
        read_key(layout, "metadata_slots", config.layout.metadata_slots);
        read_key(layout, "super_name", config.layout.super_name);
        read_key(layout, "group_name", config.layout.group_name);
    }
}

void load_config_file(RunConfig& config, const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file " + path.string());
    }

    json doc;
    try {
        doc = json::parse(in);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path.string() + ": " + e.what());
    }
    apply_config_json(config, doc);
}

CommandLine parse_command_line(const std::vector<std::string>& args) {
    CommandLine cmd;

    // Handle help options in priority
    for (const auto& arg : args) {
        if (arg == "-h" || arg == "--help") {
            cmd.show_help = true;
            return cmd;
        }
    }

    std::optional<std::string> config_path;

    struct Override {
        std::string* target;
        std::string value;
    };
    std::vector<Override> overrides;
    bool yes = false;
    bool manifest = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto next_value = [&]() -> std::string {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument(arg + " option requires an argument.");
            }
            return args[++i];
        };

        if (arg == "-y" || arg == "--yes") {
            yes = true;
        } else if (arg == "--manifest") {
            manifest = true;
        } else if (arg == "-c" || arg == "--config") {
            config_path = next_value();
        } else if (arg == "--super") {
            overrides.push_back({&cmd.config.super_image, next_value()});
        } else if (arg == "--system") {
            overrides.push_back({&cmd.config.system_image, next_value()});
        } else if (arg == "--work-dir") {
            overrides.push_back({&cmd.config.work_dir, next_value()});
        } else if (arg == "--name") {
            overrides.push_back({&cmd.config.output_name, next_value()});
        } else {
            throw std::invalid_argument("Unknown option '" + arg + "'.");
        }
    }

    if (config_path.has_value()) {
        load_config_file(cmd.config, expand_home(*config_path));
    }
    for (const auto& o : overrides) {
        *o.target = o.value;
    }
    if (yes) cmd.config.assume_yes = true;
    if (manifest) cmd.config.write_manifest = true;

    return cmd;
}

void check_output_name(const std::string& name) {
    if (name.empty()) {
        throw std::runtime_error("Output name must not be empty");
    }
    if (name.find('/') != std::string::npos || name == "." || name == "..") {
        throw std::runtime_error("Output name must be a plain file name, got '" + name + "'");
    }
}
