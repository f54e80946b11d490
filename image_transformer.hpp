#ifndef IMAGE_TRANSFORMER_HPP
#define IMAGE_TRANSFORMER_HPP

#include <filesystem>
#include <optional>
#include "config.hpp"
#include "console.hpp"
#include "image_probe.hpp"
#include "partition_set.hpp"
#include "repack_plan.hpp"
#include "workspace.hpp"

// Drives one super image through unpack, system replacement and repack.
// Each step must be called once, in order; anything else throws std::logic_error.
class ImageTransformer {
public:
    enum class State {
        RawPending,
        Unpacked,
        SystemReplaced,
        Repacked
    };

    ImageTransformer(const Workspace& workspace, const Toolchain& tools, const RepackLayout& layout, Console& console)
        : workspace(workspace), tools(tools), layout(layout), console(console) {}

    // Converts a sparse source to <work>/super_raw.img (a raw source is used in
    // place) and unpacks it into <work>/extracted/.
    void unpack(const ImageFile& super_image);

    // Replaces extracted/system.img with the GSI in raw form.
    void replace_system(const ImageFile& gsi);

    // Builds <work>/<name>_super.img with lpmake. Retries once without --sparse
    // when the first attempt leaves no output file.
    std::filesystem::path repack();

    State state() const { return current; }
    const PartitionSet& partitions() const;
    const RepackPlan& plan() const;
    bool generated_super_raw() const { return raw_generated; }

private:
    const Workspace& workspace;
    const Toolchain& tools;
    const RepackLayout& layout;
    Console& console;

    State current = State::RawPending;
    std::filesystem::path raw_source;
    bool raw_generated = false;
    std::optional<PartitionSet> extracted;
    std::optional<RepackPlan> repack_plan;

    void require_state(State expected, const char* operation) const;
    bool run_lpmake(const RepackPlan& plan);
};

const char* state_name(ImageTransformer::State state);

#endif // IMAGE_TRANSFORMER_HPP
