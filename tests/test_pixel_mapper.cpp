#include "geo/bounds.h"
#include "geo/pixel_mapper.h"
#include <gtest/gtest.h>
#include <utility>
#include <vector>

using namespace rastile;

TEST(PixelMapperTest, SquareImage) {
    PseudoGeoBounds pg = compute_pseudo_geo_bounds(1000, 1000, 0.01);
    EXPECT_EQ(pg.bounds, (Bounds{-5, -5, 5, 5}));
    EXPECT_DOUBLE_EQ(pg.pixel_scale, 0.01);
    EXPECT_DOUBLE_EQ(pg.pixel_offset.x, 5.0);
    EXPECT_DOUBLE_EQ(pg.pixel_offset.y, 5.0);
}

TEST(PixelMapperTest, TallImageClampsHeightOnly) {
    PseudoGeoBounds pg = compute_pseudo_geo_bounds(1000, 20000, 0.01);
    EXPECT_EQ(pg.bounds, (Bounds{-5, -85, 5, 85}));
    EXPECT_DOUBLE_EQ(pg.pixel_offset.y, 85.0);
}

TEST(PixelMapperTest, DefaultScale) {
    PseudoGeoBounds pg = compute_pseudo_geo_bounds(200, 100);
    EXPECT_DOUBLE_EQ(pg.pixel_scale, DEFAULT_PIXEL_SCALE);
    EXPECT_EQ(pg.bounds, (Bounds{-1, -0.5, 1, 0.5}));
}

TEST(PixelMapperTest, CornersMapToBounds) {
    PseudoGeoBounds pg = compute_pseudo_geo_bounds(400, 300, 0.01);
    glm::dvec2 tl = pixel_to_map({0, 0}, pg.pixel_scale, pg.pixel_offset);
    glm::dvec2 br = pixel_to_map({400, 300}, pg.pixel_scale, pg.pixel_offset);
    EXPECT_DOUBLE_EQ(tl.x, pg.bounds.min_x);
    EXPECT_DOUBLE_EQ(tl.y, pg.bounds.max_y);
    EXPECT_NEAR(br.x, pg.bounds.max_x, 1e-12);
    EXPECT_NEAR(br.y, pg.bounds.min_y, 1e-12);
}

TEST(PixelMapperTest, RoundTripWithinOnePixel) {
    const std::vector<std::pair<int, int>> sizes = {{1000, 1000}, {640, 480}, {1000, 20000}};
    for (auto [w, h] : sizes) {
        PseudoGeoBounds pg = compute_pseudo_geo_bounds(w, h, 0.01);
        const Bounds& b = pg.bounds;
        for (int i = 0; i <= 10; i++) {
            for (int j = 0; j <= 10; j++) {
                glm::dvec2 ll{b.min_x + b.width() * i / 10.0, b.min_y + b.height() * j / 10.0};
                glm::dvec2 px = map_to_pixel(ll, pg.pixel_scale, pg.pixel_offset);
                glm::dvec2 back = pixel_to_map(px, pg.pixel_scale, pg.pixel_offset);
                EXPECT_NEAR(back.x, ll.x, pg.pixel_scale);
                EXPECT_NEAR(back.y, ll.y, pg.pixel_scale);
            }
        }
    }
}

TEST(PixelMapperTest, MapToPixelRounds) {
    glm::dvec2 px = map_to_pixel({-4.996, 4.994}, 0.01, {5, 5});
    EXPECT_DOUBLE_EQ(px.x, 0.0);
    EXPECT_DOUBLE_EQ(px.y, 1.0);
}

TEST(BoundsTest, Merge) {
    EXPECT_FALSE(merge_bounds({}).has_value());
    auto m = merge_bounds({{0, 0, 1, 1}, {-2, 0.5, 0.5, 3}});
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(*m, (Bounds{-2, 0, 1, 3}));
}

TEST(BoundsTest, IntersectTouchingCounts) {
    EXPECT_TRUE(bounds_intersect({0, 0, 1, 1}, {1, 1, 2, 2}));
    EXPECT_TRUE(bounds_intersect({0, 0, 2, 2}, {0.5, 0.5, 1, 1}));
    EXPECT_FALSE(bounds_intersect({0, 0, 1, 1}, {1.01, 0, 2, 1}));
}

TEST(BoundsTest, FileName) {
    EXPECT_EQ(file_name_of("/data/scenes/a.tif"), "a.tif");
    EXPECT_EQ(file_name_of("C:\\data\\b.tif"), "b.tif");
    EXPECT_EQ(file_name_of("c.tif"), "c.tif");
    EXPECT_EQ(file_name_of("/vsicurl/https://host/cog.tif"), "cog.tif");
}
