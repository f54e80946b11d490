#include <gtest/gtest.h>

#include "errors.hpp"
#include "input_validator.hpp"
#include "test_helpers.hpp"
#include "workspace.hpp"

using namespace testing_support;

class InputValidatorTest : public ::testing::Test {
protected:
    TempDir dir{"supergsi-validator-test"};
    Toolchain tools;

    void SetUp() override {
        tools = install_fake_tools(dir.path() / "bin");
    }
};

TEST_F(InputValidatorTest, ResolveRejectsMissingAndEmptyFiles) {
    ScriptedConsole c;
    InputValidator v(tools, c.console);

    EXPECT_THROW(v.resolve((dir.path() / "nope.img").string(), "Super image"), ValidationError);
    EXPECT_THROW(v.resolve("   ", "Super image"), ValidationError);

    write_file(dir.path() / "empty.img", "");
    EXPECT_THROW(v.resolve((dir.path() / "empty.img").string(), "Super image"), ValidationError);

    EXPECT_THROW(v.resolve(dir.path().string(), "Super image"), ValidationError);
}

TEST_F(InputValidatorTest, ResolveReturnsAbsoluteNormalizedPath) {
    ScriptedConsole c;
    InputValidator v(tools, c.console);
    write_file(dir.path() / "imgs" / "super.img", "SUPER\n");

    auto p = v.resolve((dir.path() / "imgs" / ".." / "imgs" / "super.img").string(), "Super image");
    EXPECT_TRUE(p.is_absolute());
    EXPECT_EQ(p, dir.path() / "imgs" / "super.img");
}

TEST_F(InputValidatorTest, SmallGsiPromptsAndDeclineAborts) {
    write_file(dir.path() / "gsi.img", "EXT4 tiny");

    ScriptedConsole declined("n\n");
    InputValidator v(tools, declined.console);
    EXPECT_THROW(v.validate_gsi(dir.path() / "gsi.img"), UserAbort);
    EXPECT_NE(declined.out.str().find("too small"), std::string::npos);

    ScriptedConsole accepted("y\n");
    InputValidator v2(tools, accepted.console);
    ImageFile gsi = v2.validate_gsi(dir.path() / "gsi.img");
    EXPECT_EQ(gsi.format, ImageFormat::Raw);
}

TEST_F(InputValidatorTest, UnrecognizedGsiTypeIsOnlyAWarning) {
    write_file(dir.path() / "gsi.img", "plain text, not an image");
    ScriptedConsole c("y\n");
    InputValidator v(tools, c.console);
    ImageFile gsi = v.validate_gsi(dir.path() / "gsi.img");
    EXPECT_EQ(gsi.format, ImageFormat::Unknown);
    EXPECT_NE(c.out.str().find("recognized filesystem"), std::string::npos);
}

TEST_F(InputValidatorTest, SuperStructureListsPartitions) {
    write_file(dir.path() / "super.img", sparse_of(super_of({{"system", "sys"}, {"vendor", "vendor-data"}})));
    ScriptedConsole c;
    InputValidator v(tools, c.console);

    ImageFile super = v.validate_super(dir.path() / "super.img", "Original super image");
    EXPECT_TRUE(super.is_sparse());

    auto listing = v.verify_super_structure(super, "Original super image");
    ASSERT_EQ(listing.size(), 2u);
    EXPECT_EQ(listing[0], (std::pair<std::string, uint64_t>{"system", 3}));
    EXPECT_EQ(listing[1], (std::pair<std::string, uint64_t>{"vendor", 11}));
}

TEST_F(InputValidatorTest, SuperWithoutSystemIsFatal) {
    write_file(dir.path() / "super.img", super_of({{"vendor", "v"}}));
    ScriptedConsole c;
    InputValidator v(tools, c.console);
    EXPECT_THROW(v.validate_super(dir.path() / "super.img", "Original super image"), ValidationError);
}

TEST_F(InputValidatorTest, UnparsableSuperIsFatalAfterTypeWarning) {
    write_file(dir.path() / "super.img", "ASCII junk\n");
    ScriptedConsole c("y\n");
    InputValidator v(tools, c.console);
    EXPECT_THROW(v.validate_super(dir.path() / "super.img", "Original super image"), ValidationError);
    EXPECT_NE(c.out.str().find("does not look like an Android image"), std::string::npos);
}
