#include <gtest/gtest.h>
#include <stdexcept>

#include "config.hpp"
#include "test_helpers.hpp"
#include "workspace.hpp"

using testing_support::write_file;

TEST(ConfigJson, AppliesPresentKeysOnly) {
    RunConfig config;
    config.work_dir = "/keep";

    apply_config_json(config, json::parse(R"({
        "super_image": "/img/super.img",
        "system_image": "/img/gsi.img",
        "assume_yes": true,
        "tools": {"lpmake": "/opt/bin/lpmake"},
        "layout": {"metadata_slots": 3, "group_name": "qti_dynamic_partitions"},
        "unrelated": 1
    })"));

    EXPECT_EQ(config.super_image, "/img/super.img");
    EXPECT_EQ(config.system_image, "/img/gsi.img");
    EXPECT_EQ(config.work_dir, "/keep");
    EXPECT_TRUE(config.assume_yes);
    EXPECT_FALSE(config.write_manifest);
    EXPECT_EQ(config.tools.lpmake, "/opt/bin/lpmake");
    EXPECT_EQ(config.tools.lpunpack, "lpunpack");
    EXPECT_EQ(config.layout.metadata_slots, 3u);
    EXPECT_EQ(config.layout.metadata_size, 65536u);
    EXPECT_EQ(config.layout.group_name, "qti_dynamic_partitions");
    EXPECT_EQ(config.layout.super_name, "super");
}

TEST(ConfigJson, RejectsWrongTypes) {
    RunConfig config;
    EXPECT_THROW(apply_config_json(config, json::parse(R"({"assume_yes": "yes"})")), std::runtime_error);
    EXPECT_THROW(apply_config_json(config, json::parse(R"({"tools": []})")), std::runtime_error);
    EXPECT_THROW(apply_config_json(config, json::parse("[1, 2]")), std::runtime_error);
}

TEST(ConfigJson, RejectsLayoutNumbersOutOfRange) {
    RunConfig config;
    EXPECT_THROW(apply_config_json(config, json::parse(R"({"layout": {"metadata_size": -1}})")), std::runtime_error);
    EXPECT_THROW(apply_config_json(config, json::parse(R"({"layout": {"metadata_slots": 4294967296}})")),
                 std::runtime_error);
    EXPECT_THROW(apply_config_json(config, json::parse(R"({"layout": {"metadata_size": 1.5}})")), std::runtime_error);
    EXPECT_EQ(config.layout.metadata_size, 65536u);
    EXPECT_EQ(config.layout.metadata_slots, 2u);

    apply_config_json(config, json::parse(R"({"layout": {"metadata_slots": 4294967295}})"));
    EXPECT_EQ(config.layout.metadata_slots, 4294967295u);
}

TEST(ConfigJson, TarToolIsConfigurable) {
    RunConfig config;
    EXPECT_EQ(config.tools.tar, "tar");
    apply_config_json(config, json::parse(R"({"tools": {"tar": "/usr/bin/bsdtar"}})"));
    EXPECT_EQ(config.tools.tar, "/usr/bin/bsdtar");
    EXPECT_EQ(config.tools.required().back(), "/usr/bin/bsdtar");
}

TEST(CommandLine, FlagsOverrideConfigFile) {
    TempDir dir("supergsi-config-test");
    auto cfg = dir.path() / "run.json";
    write_file(cfg, R"({"super_image": "/from/file.img", "output_name": "file_name", "manifest": false})");

    auto cmd = parse_command_line({"--config", cfg.string(), "--name", "flag_name", "--manifest", "-y"});
    EXPECT_FALSE(cmd.show_help);
    EXPECT_EQ(cmd.config.super_image, "/from/file.img");
    EXPECT_EQ(cmd.config.output_name, "flag_name");
    EXPECT_TRUE(cmd.config.write_manifest);
    EXPECT_TRUE(cmd.config.assume_yes);
}

TEST(CommandLine, HelpShortCircuits) {
    auto cmd = parse_command_line({"--bogus-is-ignored-after-help", "-h"});
    EXPECT_TRUE(cmd.show_help);
}

TEST(CommandLine, RejectsUnknownAndIncompleteOptions) {
    EXPECT_THROW(parse_command_line({"--frobnicate"}), std::invalid_argument);
    EXPECT_THROW(parse_command_line({"--super"}), std::invalid_argument);
}

TEST(CommandLine, MissingConfigFileIsAnError) {
    EXPECT_THROW(parse_command_line({"-c", "/nonexistent/supergsi.json"}), std::runtime_error);
}

TEST(OutputName, MustBePlainFileName) {
    EXPECT_NO_THROW(check_output_name("super_modified"));
    EXPECT_THROW(check_output_name(""), std::runtime_error);
    EXPECT_THROW(check_output_name("../escape"), std::runtime_error);
    EXPECT_THROW(check_output_name(".."), std::runtime_error);
}
