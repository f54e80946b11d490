#ifndef PIPELINE_HPP
#define PIPELINE_HPP

#include <string>
#include <filesystem>
#include "config.hpp"
#include "console.hpp"

struct PipelineResult {
    std::filesystem::path output_file;
    std::string md5;
};

// Runs the whole GSI replacement: dependency check, input validation,
// workspace setup, unpack/replace/repack, re-validation and Odin packaging.
// Fields missing from `config` are asked for on the console. Any failure is
// thrown; the workspace is then left as-is for inspection.
PipelineResult run_pipeline(RunConfig config, Console& console);

#endif // PIPELINE_HPP
