#include "pipeline.hpp"
#include "dependency_checker.hpp"
#include "errors.hpp"
#include "image_probe.hpp"
#include "image_transformer.hpp"
#include "input_validator.hpp"
#include "manifest_generator.hpp"
#include "odin_packager.hpp"
#include "utils.hpp"
#include "workspace.hpp"
#include <ctime>

namespace fs = std::filesystem;

namespace {

std::string ask_if_missing(Console& console, const std::string& value, const std::string& prompt) {
    if (!value.empty()) return value;
    return console.ask(prompt);
}

void print_instructions(Console& console, const fs::path& output) {
    const std::string name = output.filename().string();
    console.blank();
    console.warning("HOW TO FLASH:");
    console.warning("1. Make a FULL BACKUP of your device before flashing");
    console.warning("2. Put the device in Download mode (Vol Up + Power)");
    console.warning("3. Open Odin on the computer");
    console.warning("4. Load " + name + " in the AP slot");
    console.warning("5. Make sure Re-Partition is NOT checked");
    console.warning("6. Click Start to flash");
    console.warning("7. Consider a factory reset after flashing");
    console.blank();
    console.status("Location: " + output.string());

    std::time_t now = std::time(nullptr);
    char stamp[64];
    std::strftime(stamp, sizeof(stamp), "%c", std::localtime(&now));
    console.status(std::string("Finished at: ") + stamp);
}

}

PipelineResult run_pipeline(RunConfig config, Console& console) {
    check_dependencies(config.tools, console);
    console.blank();

    console.status("Please provide the paths of the required files:");
    console.status("Tip: use absolute paths (starting with /) or paths relative to the current directory");
    console.blank();

    InputValidator validator(config.tools, console);

    config.super_image = ask_if_missing(console, config.super_image, "Path to super.img: ");
    fs::path super_path = validator.resolve(config.super_image, "Super image");

    config.system_image = ask_if_missing(console, config.system_image, "Path to the GSI (system.img): ");
    fs::path gsi_path = validator.resolve(config.system_image, "GSI");

    console.blank();
    console.status("FILE INTEGRITY CHECKS");
    console.status("================================================");

    ImageFile super_image = validator.validate_super(super_path, "Original super image");
    console.blank();
    ImageFile gsi = validator.validate_gsi(gsi_path);

    console.blank();
    console.success("Initial validation completed");
    console.blank();

    config.work_dir = ask_if_missing(console, config.work_dir, "Work directory (created if missing): ");
    if (trim(config.work_dir).empty()) {
        throw std::runtime_error("No work directory given");
    }
    config.output_name = trim(ask_if_missing(console, config.output_name, "Output file name (e.g. super_modified): "));
    check_output_name(config.output_name);

    Workspace workspace = Workspace::create(config.work_dir, config.output_name, console);
    console.status("Work directory: " + workspace.path().string());
    for (const auto& input : {super_path, gsi_path}) {
        for (const auto& artifact : {workspace.repacked_image(), workspace.super_raw(), workspace.tar_file(),
                                     workspace.output_file(), workspace.manifest_file()}) {
            if (artifact == input) {
                throw std::runtime_error("Output name '" + config.output_name + "' would overwrite input " +
                                         artifact.string());
            }
        }
        // extracted/ and odin_package/ are rebuilt from scratch during the run
        for (const auto& dir : {workspace.extracted_dir(), workspace.package_dir()}) {
            if (path_within(dir, input)) {
                throw std::runtime_error("Input " + input.string() + " lies inside " + dir.string() +
                                         ", which is overwritten during the run; move it elsewhere");
            }
        }
    }

    uint64_t required = super_image.size + gsi.size;
    console.status("Checking available space...");
    console.status("Estimated space required: " + format_iec_size(required));
    if (!workspace.check_space(required, console)) {
        console.warning("Consider a work directory with more free space");
        if (!console.confirm("Continue anyway?")) {
            throw UserAbort("Operation cancelled by user");
        }
    }

    console.status("Starting modification...");
    console.blank();

    console.status("Step 1: Preparing work files...");
    console.status("Super image source: " + super_path.string());
    console.status("GSI source: " + gsi_path.string());
    workspace.clean_stale({super_path, gsi_path}, console);

    ImageTransformer transformer(workspace, config.tools, config.layout, console);

    console.status("Step 2: Extracting partitions...");
    transformer.unpack(super_image);

    if (!fs::exists(super_path) || !fs::exists(gsi_path)) {
        throw ValidationError("Input files disappeared during processing");
    }

    console.status("Step 3: Replacing system.img with the GSI...");
    transformer.replace_system(gsi);

    console.status("Step 4: Repacking super.img...");
    fs::path repacked = transformer.repack();

    console.blank();
    console.status("FINAL CHECK OF THE MODIFIED IMAGE");
    console.status("================================================");
    try {
        ImageFile modified = probe_image(repacked, config.tools.file);
        validator.verify_super_structure(modified, "Modified super image");
    } catch (const ValidationError&) {
        console.error("Modified super image failed validation!");
        console.error("The file may be corrupt or malformed");
        console.status("Running diagnostics...");
        if (fs::exists(repacked)) {
            console.status("File exists: " + repacked.string() + " (" + format_iec_size(::file_size(repacked)) + ")");
            auto type = probe_image(repacked, config.tools.file);
            console.status("Type: " + type.description);
        }
        console.warning("Check the input files and try again");
        throw;
    }
    console.success("Modified super image passed all checks");
    console.blank();

    console.status("Step 5: Preparing the Odin package...");
    OdinPackager packager(workspace, config.tools, console);
    PipelineResult result{packager.package(repacked), ""};
    result.md5 = packager.md5();

    workspace.remove_intermediates(transformer.generated_super_raw(), console);
    console.success("Odin package created: " + result.output_file.filename().string());

    if (config.write_manifest) {
        write_manifest(workspace.manifest_file(),
                       build_manifest(super_image, gsi, transformer, result.output_file, result.md5));
    }

    console.blank();
    console.success("================================================");
    console.success("    PROCESS COMPLETED SUCCESSFULLY!");
    console.success("================================================");
    console.blank();
    console.status("Generated file:");
    console.status(result.output_file.filename().string() + " (" + format_iec_size(::file_size(result.output_file)) + ")");
    print_instructions(console, result.output_file);

    return result;
}
