#include <gtest/gtest.h>

#include "util/path_utils.hpp"

TEST(PathUtilsTest, NormalizeArchivePathCleansInput) {
    EXPECT_EQ(fwbundle::NormalizeArchivePath("./flasher_args.json"), "flasher_args.json");
    EXPECT_EQ(fwbundle::NormalizeArchivePath("bootloader//bootloader.bin"), "bootloader/bootloader.bin");
    EXPECT_EQ(fwbundle::NormalizeArchivePath("/abs//path"), "/abs/path");
    EXPECT_EQ(fwbundle::NormalizeArchivePath(""), "");
}

TEST(PathUtilsTest, SanitizeReleaseNameCollapsesWhitespace) {
    EXPECT_EQ(fwbundle::SanitizeReleaseName("v1.2.0"), "v1.2.0");
    EXPECT_EQ(fwbundle::SanitizeReleaseName("  spring   drop\tbeta "), "spring_drop_beta");
    EXPECT_EQ(fwbundle::SanitizeReleaseName(" \t "), "");
}

TEST(PathUtilsTest, SanitizeReleaseNameFlattensSeparators) {
    EXPECT_EQ(fwbundle::SanitizeReleaseName("release/v1.2"), "release_v1.2");
    EXPECT_EQ(fwbundle::SanitizeReleaseName("../up"), ".._up");
    EXPECT_EQ(fwbundle::SanitizeReleaseName("a\\b"), "a_b");
    EXPECT_EQ(fwbundle::SanitizeReleaseName(".."), "..");
}

TEST(PathUtilsTest, EndsWith) {
    EXPECT_TRUE(fwbundle::EndsWith("v1.0-dirty", "-dirty"));
    EXPECT_FALSE(fwbundle::EndsWith("dirty", "-dirty"));
}
