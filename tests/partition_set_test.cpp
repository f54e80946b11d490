#include <gtest/gtest.h>
#include <algorithm>

#include "errors.hpp"
#include "partition_set.hpp"
#include "repack_plan.hpp"
#include "test_helpers.hpp"
#include "workspace.hpp"

using namespace testing_support;

namespace {

bool has_pair(const std::vector<std::string>& args, const std::string& flag, const std::string& value) {
    for (size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == flag && args[i + 1] == value) return true;
    }
    return false;
}

}

TEST(PartitionSet, ScansKnownThenOthersInOrder) {
    TempDir dir("supergsi-parts-test");
    write_file(dir.path() / "vendor.img", std::string(300, 'v'));
    write_file(dir.path() / "system.img", std::string(1000, 's'));
    write_file(dir.path() / "odm_dlkm.img", std::string(7, 'o'));
    write_file(dir.path() / "system_ext.img", std::string(50, 'e'));
    write_file(dir.path() / "notes.txt", "ignored");

    PartitionSet set = PartitionSet::scan(dir.path());
    std::vector<std::string> names;
    for (const auto& p : set.entries()) names.push_back(p.name);

    EXPECT_EQ(names, (std::vector<std::string>{"system", "vendor", "system_ext", "odm_dlkm"}));
    EXPECT_EQ(set.total_size(), 1357u);
    EXPECT_TRUE(set.contains("vendor"));
    EXPECT_FALSE(set.contains("product"));
}

TEST(PartitionSet, SystemIsMandatory) {
    TempDir dir("supergsi-parts-test");
    write_file(dir.path() / "vendor.img", "v");
    EXPECT_THROW(PartitionSet::scan(dir.path()), ValidationError);
}

TEST(PartitionSet, RefreshPicksUpReplacedImage) {
    TempDir dir("supergsi-parts-test");
    write_file(dir.path() / "system.img", "old");
    PartitionSet set = PartitionSet::scan(dir.path());

    write_file(dir.path() / "system.img", "much longer replacement");
    set.refresh_sizes();
    set.mark_replaced("system");

    EXPECT_EQ(set.find("system")->size, std::string("much longer replacement").size());
    EXPECT_TRUE(set.find("system")->replaced);
    EXPECT_THROW(set.mark_replaced("vendor"), std::out_of_range);
}

TEST(PartitionSet, ContainerSizeAddsTwentyPercent) {
    EXPECT_EQ(PartitionSet::container_size(0), 0u);
    EXPECT_EQ(PartitionSet::container_size(1000), 1200u);
    EXPECT_EQ(PartitionSet::container_size(7), 8u);
    uint64_t big = 5ULL * 1024 * 1024 * 1024 + 3;
    EXPECT_EQ(PartitionSet::container_size(big), big * 12 / 10);
}

TEST(RepackPlan, BuildsLpmakeArguments) {
    TempDir dir("supergsi-plan-test");
    write_file(dir.path() / "system.img", std::string(1000, 's'));
    write_file(dir.path() / "product.img", std::string(500, 'p'));

    PartitionSet set = PartitionSet::scan(dir.path());
    RepackLayout layout;
    auto out = dir.path() / "x_super.img";
    RepackPlan plan = RepackPlan::from_partitions(set, layout, out);

    EXPECT_EQ(plan.device_size, 1800u);
    EXPECT_EQ(plan.group_size, 1800u);
    ASSERT_EQ(plan.partitions.size(), 2u);
    EXPECT_EQ(plan.partitions[0].name, "system");
    EXPECT_EQ(plan.partitions[0].attributes, "readonly");
    EXPECT_EQ(plan.partitions[0].group, "main");

    auto args = plan.to_args("lpmake");
    EXPECT_EQ(args.front(), "lpmake");
    EXPECT_TRUE(has_pair(args, "--metadata-size", "65536"));
    EXPECT_TRUE(has_pair(args, "--super-name", "super"));
    EXPECT_TRUE(has_pair(args, "--metadata-slots", "2"));
    EXPECT_TRUE(has_pair(args, "--device", "super:1800"));
    EXPECT_TRUE(has_pair(args, "--group", "main:1800"));
    EXPECT_TRUE(has_pair(args, "--partition", "system:readonly:1000:main"));
    EXPECT_TRUE(has_pair(args, "--image", "system=" + (dir.path() / "system.img").string()));
    EXPECT_TRUE(has_pair(args, "--partition", "product:readonly:500:main"));
    EXPECT_TRUE(has_pair(args, "--output", out.string()));
    EXPECT_NE(std::find(args.begin(), args.end(), "--sparse"), args.end());

    plan.sparse = false;
    args = plan.to_args("lpmake");
    EXPECT_EQ(std::find(args.begin(), args.end(), "--sparse"), args.end());
}
