#ifndef INPUT_VALIDATOR_HPP
#define INPUT_VALIDATOR_HPP

#include <string>
#include <vector>
#include <utility>
#include <cstdint>
#include <filesystem>
#include "config.hpp"
#include "console.hpp"
#include "image_probe.hpp"

// Partition name and byte size as found by a trial unpack.
using PartitionListing = std::vector<std::pair<std::string, uint64_t>>;

// Existence, size and type checks on the two input images.
//
// Definite problems (missing file, empty file, super image lpunpack cannot
// read or without a system partition) throw ValidationError. Heuristic
// problems (small GSI, unexpected `file` type) are printed as warnings and
// confirmed through the console; declining throws UserAbort.
class InputValidator {
private:
    const Toolchain& tools;
    Console& console;

    void confirm_or_abort(const std::string& question);

public:
    InputValidator(const Toolchain& tools, Console& console) : tools(tools), console(console) {}

    // Expands "~", makes the path absolute and checks it names a non-empty regular file.
    std::filesystem::path resolve(const std::string& user_path, const std::string& label);

    // Size (>= 1 GiB) and filesystem-type heuristics for the replacement system image.
    ImageFile validate_gsi(const std::filesystem::path& path);

    // Type heuristic plus a trial unpack that must yield system.img.
    ImageFile validate_super(const std::filesystem::path& path, const std::string& label);

    // Converts to raw if sparse and lists the image with lpunpack inside a private
    // temporary directory, which is always removed.
    PartitionListing verify_super_structure(const ImageFile& image, const std::string& label);
};

#endif // INPUT_VALIDATOR_HPP
