#include "image_transformer.hpp"
#include "errors.hpp"
#include "process_runner.hpp"
#include "utils.hpp"
#include <stdexcept>

namespace fs = std::filesystem;

namespace {
    // lpmake prints this for every raw input image when --sparse is given; it is harmless.
    const std::string SPARSE_NOISE = "Invalid sparse file format";
}

const char* state_name(ImageTransformer::State state) {
    switch (state) {
        case ImageTransformer::State::RawPending: return "raw-pending";
        case ImageTransformer::State::Unpacked: return "unpacked";
        case ImageTransformer::State::SystemReplaced: return "system-replaced";
        case ImageTransformer::State::Repacked: return "repacked";
    }
    return "?";
}

void ImageTransformer::require_state(State expected, const char* operation) const {
    if (current != expected) {
        throw std::logic_error(std::string(operation) + " called in state " + state_name(current) +
                               ", expected " + state_name(expected));
    }
}

const PartitionSet& ImageTransformer::partitions() const {
    if (!extracted.has_value()) {
        throw std::logic_error("No partitions extracted yet");
    }
    return *extracted;
}

const RepackPlan& ImageTransformer::plan() const {
    if (!repack_plan.has_value()) {
        throw std::logic_error("No repack plan built yet");
    }
    return *repack_plan;
}

void ImageTransformer::unpack(const ImageFile& super_image) {
    require_state(State::RawPending, "unpack");

    if (super_image.is_sparse()) {
        console.status("Super image is sparse, converting to raw...");
        raw_source = workspace.super_raw();
        auto result = exec_command({tools.simg2img, super_image.path.string(), raw_source.string()});
        if (!result.ok() || !fs::exists(raw_source)) {
            throw ToolError("Failed to convert sparse super image to raw: " + trim(result.output));
        }
        raw_generated = true;
    } else {
        console.status("Super image is already raw");
        raw_source = super_image.path;
        raw_generated = false;
    }
    console.success("Working file ready: " + raw_source.string());

    console.status("Extracting partitions from the super image...");
    fs::create_directories(workspace.extracted_dir());
    std::vector<std::string> args = {tools.lpunpack, raw_source.string(), workspace.extracted_dir().string() + "/"};
    console.status("Running: " + format_command(args));
    auto result = exec_command(args);
    console.passthrough(result.output);
    if (!result.ok()) {
        throw ToolError("Failed to extract partitions (lpunpack exit code " + std::to_string(result.exit_code) + ")");
    }

    extracted = PartitionSet::scan(workspace.extracted_dir());
    console.success("Partitions extracted successfully");
    for (const auto& p : extracted->entries()) {
        console.status("  " + p.name + ".img " + format_iec_size(p.size));
    }

    current = State::Unpacked;
}

void ImageTransformer::replace_system(const ImageFile& gsi) {
    require_state(State::Unpacked, "replace_system");
    console.status("Replacing system.img with the GSI...");

    fs::path target = workspace.extracted_dir() / "system.img";
    fs::remove(target);

    if (gsi.is_sparse()) {
        console.status("GSI is sparse, converting to raw...");
        auto result = exec_command({tools.simg2img, gsi.path.string(), target.string()});
        if (!result.ok() || !fs::exists(target)) {
            throw ToolError("Failed to convert GSI from sparse to raw: " + trim(result.output));
        }
    } else {
        console.status("GSI is already raw, copying...");
        std::error_code ec;
        fs::copy_file(gsi.path, target, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            throw ToolError("Failed to copy GSI: " + ec.message());
        }
    }

    extracted->refresh_sizes();
    extracted->mark_replaced("system");
    console.success("system.img replaced by the GSI");
    console.status("New size: " + format_iec_size(extracted->find("system")->size));

    current = State::SystemReplaced;
}

bool ImageTransformer::run_lpmake(const RepackPlan& plan) {
    auto args = plan.to_args(tools.lpmake);
    console.status("Command: " + format_command(args));

    auto result = exec_command(args);
    for (const auto& line : split_string(result.output, '\n')) {
        if (line.empty() || line.find(SPARSE_NOISE) != std::string::npos) continue;
        console.passthrough(line);
    }
    if (!result.ok()) {
        console.warning("lpmake exited with code " + std::to_string(result.exit_code));
    }
    return fs::exists(plan.output);
}

fs::path ImageTransformer::repack() {
    require_state(State::SystemReplaced, "repack");

    console.status("Partition sizes:");
    extracted->refresh_sizes();
    for (const auto& p : extracted->entries()) {
        console.status("- " + p.name + ": " + format_iec_size(p.size));
    }

    repack_plan = RepackPlan::from_partitions(*extracted, layout, workspace.repacked_image());
    console.status("Computed super size: " + format_iec_size(repack_plan->device_size));
    console.status("Repacking super.img with lpmake...");
    console.warning("Warnings about 'Invalid sparse file format' are expected and hidden");

    fs::remove(repack_plan->output);
    if (!run_lpmake(*repack_plan)) {
        console.error("Failed to create the new super image, retrying without --sparse...");
        repack_plan->sparse = false;
        if (!run_lpmake(*repack_plan)) {
            throw ToolError("Failed to create super image");
        }
    }

    console.success("New super image created: " + repack_plan->output.filename().string());
    console.status("Final size: " + format_iec_size(::file_size(repack_plan->output)));

    current = State::Repacked;
    return repack_plan->output;
}
