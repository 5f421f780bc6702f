//! # Digest Tests

#include "core/digest.hpp"
#include "support/fakes.hpp"

#include <gtest/gtest.h>

using namespace cannyup;
using namespace cannyup::test;

TEST(DigestTest, KnownVectors) {
    EXPECT_EQ(sha256_bytes(""),
              "sha256:e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256_bytes("abc"),
              "sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(DigestTest, FileMatchesBuffer) {
    TempDir dir;
    std::string content(100000, 'x');
    content += "tail";
    write_file(dir / "canny", content);

    EXPECT_EQ(sha256_file(dir / "canny"), sha256_bytes(content));
}

TEST(DigestTest, DifferentContentDiffers) {
    TempDir dir;
    write_file(dir / "a", "one");
    write_file(dir / "b", "two");

    EXPECT_NE(sha256_file(dir / "a"), sha256_file(dir / "b"));
}

TEST(DigestTest, MissingFileIsEmpty) {
    TempDir dir;

    EXPECT_EQ(sha256_file(dir / "missing"), "");
}
