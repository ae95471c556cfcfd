#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <unistd.h>

#include "include/distro_mirrors.hpp"

using namespace vantage::core;
namespace fs = std::filesystem;

class DistroTest : public ::testing::Test {
   protected:
    fs::path dir_;

    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("vantage_distro_" + std::to_string(::getpid()));
        fs::create_directories(dir_);
    }

    void TearDown() override { fs::remove_all(dir_); }

    fs::path os_release(const std::string& body) {
        auto path = dir_ / "os-release";
        std::ofstream(path) << body;
        return path;
    }
};

TEST_F(DistroTest, ReadsQuotedId) {
    auto path = os_release("NAME=\"Ubuntu\"\nID_LIKE=debian\nID=\"ubuntu\"\n");
    EXPECT_EQ(read_os_release_id(path).value(), "ubuntu");
    EXPECT_EQ(detect_distro(path, dir_ / "no-marker"), Distro::Ubuntu);
}

TEST_F(DistroTest, ContainerMarkerWins) {
    auto path = os_release("ID=debian\n");
    std::ofstream(dir_ / ".dockerenv") << "";
    EXPECT_EQ(detect_distro(path, dir_ / ".dockerenv"), Distro::Docker);
}

TEST_F(DistroTest, MissingFileIsUnknown) {
    EXPECT_EQ(detect_distro(dir_ / "absent", dir_ / "no-marker"), Distro::Unknown);
}

TEST(DistroIdTest, KnownIdsAreCaseInsensitive) {
    EXPECT_EQ(distro_from_id("Arch"), Distro::Arch);
    EXPECT_EQ(distro_from_id("DEBIAN"), Distro::Debian);
    EXPECT_EQ(distro_from_id("linuxmint"), Distro::Mint);
    EXPECT_EQ(distro_from_id("kali"), Distro::Kali);
    EXPECT_EQ(distro_from_id("manjaro"), Distro::Manjaro);
    EXPECT_EQ(distro_from_id("fedora"), Distro::Unknown);
}

TEST(DistroMirrorsTest, EverySetIsNonEmptyAndValid) {
    for (auto d : {Distro::Arch, Distro::Debian, Distro::Ubuntu, Distro::Kali, Distro::Mint, Distro::Manjaro,
                   Distro::Docker, Distro::Unknown}) {
        auto mirrors = mirrors_for(d);
        ASSERT_FALSE(mirrors.empty()) << to_string(d);
        for (const auto& m : mirrors) {
            EXPECT_EQ(m.kind, TargetKind::Mirror);
            EXPECT_FALSE(m.label.empty());
            EXPECT_TRUE(make_mirror_target(m.id)) << m.id;
        }
    }
}

TEST(DistroMirrorsTest, UnknownAndDockerShareGenericSet) {
    EXPECT_EQ(mirrors_for(Distro::Unknown), mirrors_for(Distro::Docker));
    EXPECT_NE(mirrors_for(Distro::Debian), mirrors_for(Distro::Unknown));
}
