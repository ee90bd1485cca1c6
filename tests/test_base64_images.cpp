/**
 * @file test_base64_images.cpp
 * @brief Tests for base64 transport and the clipboard image directory.
 */

#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "clipfolio/Base64.hpp"
#include "clipfolio/Errors.hpp"
#include "clipfolio/Ids.hpp"
#include "clipfolio/ImageStore.hpp"

using namespace clipfolio;
using clipfolio::test::TempDir;

// --------------------------- Base64 ----------------------------------------

TEST(Base64, Known_Vectors) {
    EXPECT_EQ(base64Encode(""), "");
    EXPECT_EQ(base64Encode("f"), "Zg==");
    EXPECT_EQ(base64Encode("fo"), "Zm8=");
    EXPECT_EQ(base64Encode("foo"), "Zm9v");
    EXPECT_EQ(base64Encode("foobar"), "Zm9vYmFy");

    EXPECT_EQ(base64Decode("Zg=="), "f");
    EXPECT_EQ(base64Decode("Zm9v\nYmFy"), "foobar");
    EXPECT_EQ(base64Decode("data:image/png;base64,Zm8="), "fo");
}

TEST(Base64, Rejects_Malformed) {
    EXPECT_FALSE(base64Decode("Zg="));
    EXPECT_FALSE(base64Decode("Z==="));
    EXPECT_FALSE(base64Decode("Zg==Zg=="));
    EXPECT_FALSE(base64Decode("Zm9*"));
}

TEST(Base64, Binary_Bytes) {
    std::string bytes("\x00\xff\x10\x80", 4);
    auto decoded = base64Decode(base64Encode(bytes));
    ASSERT_TRUE(decoded);
    EXPECT_EQ(*decoded, bytes);
}

// --------------------------- Ids -------------------------------------------

TEST(Ids, Strictly_Increasing) {
    std::string previous = nextId();
    for (int i = 0; i < 100; i++) {
        std::string id = nextId();
        EXPECT_GT(std::stoll(id), std::stoll(previous));
        previous = id;
    }
    EXPECT_EQ(generateUUID().size(), 36u);
    EXPECT_NE(generateUUID(), generateUUID());
    EXPECT_EQ(currentTimeLabel().size(), 5u);
    EXPECT_EQ(isoDateUtc().size(), 10u);
}

// --------------------------- ImageStore ------------------------------------

TEST(ImageStore, Save_And_Load) {
    TempDir dir;
    ImageStore images(dir / "images");

    std::string name = images.save(std::string("\x89PNG\r\n", 6));
    EXPECT_EQ(name.rfind("img_", 0), 0u);
    EXPECT_EQ(name.substr(name.size() - 4), ".png");
    EXPECT_TRUE(images.exists(name));
    EXPECT_EQ(images.load(name), std::string("\x89PNG\r\n", 6));

    EXPECT_NE(images.save("other"), name);

    EXPECT_FALSE(images.exists("img_missing.png"));
    EXPECT_FALSE(images.load("img_missing.png"));
}

TEST(ImageStore, Rejects_Empty_Image) {
    TempDir dir;
    ImageStore images(dir.path());
    EXPECT_THROW(images.save(""), StorageError);
}

TEST(ImageStore, Rejects_Path_Names) {
    TempDir dir;
    ImageStore images(dir.path());
    EXPECT_THROW(images.pathFor("../secret"), StorageError);
    EXPECT_THROW(images.pathFor(".."), StorageError);
    EXPECT_THROW(images.exists("a\\b"), StorageError);
    EXPECT_THROW(images.pathFor(""), StorageError);
}
