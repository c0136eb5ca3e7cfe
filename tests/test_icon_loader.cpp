#include <gtest/gtest.h>
#include "TestDir.h"
#include "tray/IconLoader.h"

TEST(FlattenAlpha, CompositesOverWhite) {
    const uint8_t rgba[] = {
        0, 0, 0, 0,        // transparent
        255, 0, 0, 255,    // opaque red
        0, 0, 0, 128,      // half black
    };

    Image image = flatten_alpha(rgba, 3, 1);

    ASSERT_EQ(image.rgb.size(), 9u);
    EXPECT_EQ(image.rgb[0], 255);
    EXPECT_EQ(image.rgb[1], 255);
    EXPECT_EQ(image.rgb[2], 255);
    EXPECT_EQ(image.rgb[3], 255);
    EXPECT_EQ(image.rgb[4], 0);
    EXPECT_EQ(image.rgb[5], 0);
    EXPECT_NEAR(image.rgb[6], 127, 1);
}

TEST(ResizeToFit, KeepsAspectAndAverages) {
    Image source;
    source.width = 4;
    source.height = 2;
    for (int y = 0; y < 2; y++) {
        for (int x = 0; x < 4; x++) {
            uint8_t v = x < 2 ? 0 : 200;
            source.rgb.insert(source.rgb.end(), {v, v, v});
        }
    }

    Image out = resize_to_fit(source, 2);

    EXPECT_EQ(out.width, 2u);
    EXPECT_EQ(out.height, 1u);
    ASSERT_EQ(out.rgb.size(), 6u);
    EXPECT_EQ(out.rgb[0], 0);
    EXPECT_EQ(out.rgb[3], 200);
}

TEST(ResizeToFit, UpscalesSmallIcons) {
    Image source;
    source.width = 1;
    source.height = 2;
    source.rgb = {10, 10, 10, 90, 90, 90};

    Image out = resize_to_fit(source, 156);

    EXPECT_EQ(out.width, 78u);
    EXPECT_EQ(out.height, 156u);
    EXPECT_EQ(out.rgb[0], 10);
    EXPECT_EQ(out.rgb.back(), 90);
}

TEST(ResizeToFit, EmptyImageStaysEmpty) {
    Image out = resize_to_fit(Image(), 64);
    EXPECT_EQ(out.width, 0u);
    EXPECT_TRUE(out.rgb.empty());
}

TEST(IconLoader, CachePathUsesIconFileName) {
    Config config;
    config.temp_dir = "/tmp/parchment-x";
    IconLoader loader(config, 156);

    DraftProgram draft;
    draft.icon = "/opt/etc/draft/icons/koreader.png";
    EXPECT_EQ(loader.cache_path(draft), std::optional<std::string>(config.icons_dir() + "/koreader.png"));

    draft.icon.reset();
    EXPECT_FALSE(loader.cache_path(draft).has_value());
    EXPECT_FALSE(loader.load(draft).has_value());
}

TEST(IconLoader, UndecodableIconIsSkipped) {
    TestDir dir;
    Config config;
    config.temp_dir = dir.path("runtime");
    IconLoader loader(config, 156);

    DraftProgram draft;
    draft.icon = dir.write("icons/broken.png", "not a png");

    EXPECT_FALSE(loader.load(draft).has_value());
    EXPECT_FALSE(loader.load_cached(draft).has_value());
}
