#include <gtest/gtest.h>
#include "transfer/content_category.h"
#include <stdexcept>

using namespace xferpress;

TEST(ContentCategory, ClassifiesByExtension) {
    for (const char* name : {"a.jpg", "a.jpeg", "a.png", "a.gif"}) {
        EXPECT_EQ(classifyFilename(name), ContentCategory::Image) << name;
    }
    for (const char* name : {"a.mp4", "a.mov", "a.mkv", "a.webm"}) {
        EXPECT_EQ(classifyFilename(name), ContentCategory::Video) << name;
    }
    for (const char* name : {"a.txt", "a.pdf", "archive.tar.gz", "README", "", ".png.txt"}) {
        EXPECT_EQ(classifyFilename(name), ContentCategory::Document) << name;
    }
}

// stb_image has no WebP decoder, so WebP files take the lossless path.
TEST(ContentCategory, WebpIsStoredAsDocument) {
    EXPECT_EQ(classifyFilename("photo.webp"), ContentCategory::Document);
    EXPECT_EQ(classifyFilename("PHOTO.WEBP"), ContentCategory::Document);
}

TEST(ContentCategory, ExtensionMatchIsCaseInsensitive) {
    EXPECT_EQ(classifyFilename("HOLIDAY.JPG"), ContentCategory::Image);
    EXPECT_EQ(classifyFilename("Clip.MoV"), ContentCategory::Video);
}

TEST(ContentCategory, OnlyTheLastExtensionCounts) {
    EXPECT_EQ(classifyFilename("video.mp4.txt"), ContentCategory::Document);
    EXPECT_EQ(classifyFilename("notes.txt.png"), ContentCategory::Image);
}

TEST(ContentCategory, NamesRoundTrip) {
    for (auto c : {ContentCategory::Image, ContentCategory::Video, ContentCategory::Document}) {
        EXPECT_EQ(categoryFromString(toString(c)), c);
    }
    EXPECT_EQ(toString(ContentCategory::Document), "document");
    EXPECT_THROW(categoryFromString("audio"), std::invalid_argument);
}
