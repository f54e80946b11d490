#include "input_validator.hpp"
#include "errors.hpp"
#include "partition_set.hpp"
#include "process_runner.hpp"
#include "shared_structure.hpp"
#include "utils.hpp"
#include "workspace.hpp"

namespace fs = std::filesystem;

void InputValidator::confirm_or_abort(const std::string& question) {
    if (!console.confirm(question)) {
        throw UserAbort("Operation cancelled by user");
    }
}

fs::path InputValidator::resolve(const std::string& user_path, const std::string& label) {
    if (trim(user_path).empty()) {
        throw ValidationError("No path given for " + label);
    }

    fs::path path = fs::absolute(expand_home(trim(user_path))).lexically_normal();

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw ValidationError("File not found: " + user_path + " (tried " + path.string() + ")");
    }

    uint64_t size = ::file_size(path);
    if (size == 0) {
        throw ValidationError(label + " is empty: " + path.string());
    }

    console.success("File found: " + path.string());
    console.status("Size: " + format_iec_size(size));
    return path;
}

ImageFile InputValidator::validate_gsi(const fs::path& path) {
    console.status("Validating GSI (Generic System Image)...");

    ImageFile image = probe_image(path, tools.file);
    if (image.size == 0) {
        throw ValidationError("GSI is empty: " + path.string());
    }

    std::vector<std::string> warnings;
    if (image.size < MIN_GSI_SIZE) {
        warnings.push_back("GSI looks too small (< 1G), current size: " + format_iec_size(image.size));
    }

    console.status("GSI type: " + image.description);
    if (looks_like_filesystem(image.description)) {
        console.success("GSI has a valid filesystem format");
    } else {
        warnings.push_back("GSI may not have a recognized filesystem format");
    }

    if (!warnings.empty()) {
        for (const auto& w : warnings) {
            console.warning(w);
        }
        console.warning("GSI validation raised warnings");
        confirm_or_abort("Continue anyway?");
    }
    return image;
}

ImageFile InputValidator::validate_super(const fs::path& path, const std::string& label) {
    console.status("Validating " + label + "...");

    ImageFile image = probe_image(path, tools.file);
    if (image.size == 0) {
        throw ValidationError(label + " does not exist or is empty");
    }

    console.status("Size: " + format_iec_size(image.size));
    console.status("Detected type: " + image.description);

    if (!looks_like_super(image.description)) {
        console.warning(label + " does not look like an Android image");
        confirm_or_abort("Continue anyway?");
    }

    verify_super_structure(image, label);
    console.success(label + " passed validation");
    return image;
}

PartitionListing InputValidator::verify_super_structure(const ImageFile& image, const std::string& label) {
    console.status("Checking the internal super partition structure...");
    TempDir temp("supergsi-check");

    fs::path test_file = image.path;
    if (image.is_sparse()) {
        console.status("Converting sparse image to raw for the check...");
        fs::path raw = temp.path() / "test_super.img";
        auto conv = exec_command({tools.simg2img, image.path.string(), raw.string()});
        if (!conv.ok() || !fs::exists(raw)) {
            throw ValidationError("Failed to convert sparse " + label + " for verification");
        }
        test_file = raw;
    }

    fs::path extract_dir = temp.path() / "test_extract";
    fs::create_directories(extract_dir);
    auto unpack = exec_command({tools.lpunpack, test_file.string(), extract_dir.string() + "/"});
    if (!unpack.ok()) {
        throw ValidationError(label + " has no valid super partition structure (lpunpack failed: " +
                              trim(unpack.output) + ")");
    }
    console.success(label + " has a valid super partition structure");

    if (!fs::exists(extract_dir / "system.img")) {
        throw ValidationError("System partition not found in " + label + "!");
    }
    PartitionSet found = PartitionSet::scan(extract_dir);
    console.status("Partitions found: " + std::to_string(found.entries().size()));

    PartitionListing listing;
    for (const auto& p : found.entries()) {
        console.status(p.name + " partition: " + format_iec_size(p.size));
        listing.emplace_back(p.name, p.size);
    }
    return listing;
}
