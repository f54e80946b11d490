#include <gtest/gtest.h>
#include <fstream>

#include "errors.hpp"
#include "odin_packager.hpp"
#include "test_helpers.hpp"
#include "workspace.hpp"

using namespace testing_support;

TEST(Md5File, KnownVectors) {
    TempDir dir("supergsi-md5-test");
    write_file(dir.path() / "empty", "");
    write_file(dir.path() / "abc", "abc");
    EXPECT_EQ(md5_file(dir.path() / "empty"), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(md5_file(dir.path() / "abc"), "900150983cd24fb0d6963f7d28e17f72");
    // Prefix only
    EXPECT_EQ(md5_file(dir.path() / "abc", 0), "d41d8cd98f00b204e9800998ecf8427e");
}

TEST(OdinTrailer, Format) {
    EXPECT_EQ(odin_trailer("0123456789abcdef0123456789abcdef", "x_AP.tar.md5"),
              "0123456789abcdef0123456789abcdef  x_AP.tar.md5");
}

TEST(OdinPackager, ProducesVerifiableTarMd5) {
    TempDir dir("supergsi-odin-test");
    ScriptedConsole c;
    Workspace ws(dir.path(), "rom");
    Toolchain tools;
    const std::string image = "SPARSE\nSUPER\nsystem=new\n";
    write_file(ws.repacked_image(), image);

    OdinPackager packager(ws, tools, c.console);
    auto out = packager.package(ws.repacked_image());

    EXPECT_EQ(out, dir.path() / "rom_AP.tar.md5");
    EXPECT_FALSE(std::filesystem::exists(ws.tar_file()));
    EXPECT_FALSE(std::filesystem::exists(ws.repacked_image()));
    EXPECT_TRUE(std::filesystem::exists(ws.package_dir() / "super.img"));

    // Single entry named super.img, no directory prefix
    std::string name;
    EXPECT_EQ(tar_entry(out, &name), image);
    EXPECT_EQ(name, "super.img");

    std::string bytes = read_file(out);
    std::string trailer = packager.md5() + "  rom_AP.tar.md5";
    ASSERT_GT(bytes.size(), trailer.size());
    EXPECT_EQ(bytes.substr(bytes.size() - trailer.size()), trailer);
    EXPECT_EQ((bytes.size() - trailer.size()) % TAR_RECORD_SIZE, 0u);
    EXPECT_TRUE(is_md5_hex(packager.md5()));
    EXPECT_EQ(packager.md5(), md5_file(out, bytes.size() - trailer.size()));
    EXPECT_TRUE(verify_odin_trailer(out));
}

TEST(OdinPackager, TarFailureIsFatal) {
    TempDir dir("supergsi-odin-test");
    ScriptedConsole c;
    Workspace ws(dir.path(), "rom");
    Toolchain tools;
    tools.tar = (dir.path() / "bin" / "tar").string();
    write_script(tools.tar, "echo \"tar: write error\" >&2\nexit 2\n");
    write_file(ws.repacked_image(), "payload");

    OdinPackager packager(ws, tools, c.console);
    EXPECT_THROW(packager.package(ws.repacked_image()), ToolError);
    EXPECT_NE(c.out.str().find("tar: write error"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(ws.output_file()));
}

TEST(OdinPackager, VerifyDetectsTampering) {
    TempDir dir("supergsi-odin-test");
    ScriptedConsole c;
    Workspace ws(dir.path(), "rom");
    Toolchain tools;
    write_file(ws.repacked_image(), "payload");
    auto out = OdinPackager(ws, tools, c.console).package(ws.repacked_image());

    std::fstream f(out, std::ios::in | std::ios::out | std::ios::binary);
    f.seekp(TAR_BLOCK_SIZE);
    f.put('X');
    f.close();
    EXPECT_FALSE(verify_odin_trailer(out));
}
