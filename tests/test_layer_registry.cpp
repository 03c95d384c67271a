#include "layer/layer_registry.h"
#include "fake_engine.h"
#include <gtest/gtest.h>

using namespace rastile;
using rastile::testing::make_raster;

namespace {

VectorLayer make_vector(const std::string& id) {
    VectorLayer v;
    v.id = id;
    v.path = "/data/" + id + ".geojson";
    v.feature_count = 12;
    v.geometry_type = "Polygon";
    return v;
}

} // namespace

TEST(LayerRegistryTest, AddKeepsInsertionOrder) {
    LayerRegistry reg;
    EXPECT_TRUE(reg.add(make_raster("a", 1)));
    EXPECT_TRUE(reg.add(make_vector("b")));
    EXPECT_TRUE(reg.add(make_raster("c", 3)));

    EXPECT_EQ(reg.order(), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(reg.size(), 3);
    EXPECT_NE(reg.get_raster("a"), nullptr);
    EXPECT_EQ(reg.get_raster("b"), nullptr);
    EXPECT_NE(reg.get("b"), nullptr);
}

TEST(LayerRegistryTest, IdsAreNeverReused) {
    LayerRegistry reg;
    ASSERT_TRUE(reg.add(make_raster("a", 1)));
    EXPECT_FALSE(reg.add(make_raster("a", 1)));
    ASSERT_TRUE(reg.remove("a"));
    EXPECT_FALSE(reg.add(make_raster("a", 1)));

    RasterLayer unnamed;
    EXPECT_FALSE(reg.add(unnamed));
}

TEST(LayerRegistryTest, MakeIdSkipsUsedIds) {
    LayerRegistry reg;
    std::string first = reg.make_id("rgb-comp");
    ASSERT_TRUE(reg.add(make_raster(first, 3)));
    std::string second = reg.make_id("rgb-comp");
    EXPECT_NE(first, second);
    EXPECT_EQ(second.rfind("rgb-comp-", 0), 0u);
}

TEST(LayerRegistryTest, RemoveIsIdempotent) {
    LayerRegistry reg;
    reg.add(make_raster("a", 1));
    reg.add(make_raster("b", 1));
    reg.select("a");

    EXPECT_TRUE(reg.remove("a"));
    EXPECT_FALSE(reg.remove("a"));
    EXPECT_FALSE(reg.remove("never"));
    EXPECT_EQ(reg.order(), (std::vector<std::string>{"b"}));
    EXPECT_EQ(reg.selected(), std::optional<std::string>("b"));

    reg.remove("b");
    EXPECT_FALSE(reg.selected().has_value());
    EXPECT_TRUE(reg.empty());
}

TEST(LayerRegistryTest, MutatorsOnUnknownIdAreNoOps) {
    LayerRegistry reg;
    EXPECT_FALSE(reg.set_band("x", 1));
    EXPECT_FALSE(reg.set_stretch("x", {}));
    EXPECT_FALSE(reg.set_display_mode("x", DisplayMode::Rgb));
    EXPECT_FALSE(reg.set_rgb_bands("x", {}));
    EXPECT_FALSE(reg.set_rgb_stretch("x", Channel::G, {}));
    EXPECT_FALSE(reg.set_cross_layer_rgb("x", std::nullopt));
    EXPECT_FALSE(reg.set_visible("x", false));
    EXPECT_FALSE(reg.set_opacity("x", 0.5));
    EXPECT_FALSE(reg.set_display_name("x", "name"));
    EXPECT_FALSE(reg.select("x"));
    EXPECT_TRUE(reg.empty());
}

TEST(LayerRegistryTest, RasterMutatorsIgnoreVectorLayers) {
    LayerRegistry reg;
    reg.add(make_vector("v"));
    EXPECT_FALSE(reg.set_band("v", 1));
    EXPECT_TRUE(reg.set_visible("v", false));
    EXPECT_FALSE(common(*reg.get("v")).visible);
}

TEST(LayerRegistryTest, Reorder) {
    LayerRegistry reg;
    for (auto id : {"a", "b", "c", "d"}) reg.add(make_raster(id, 1));

    EXPECT_TRUE(reg.reorder(0, 3));
    EXPECT_EQ(reg.order(), (std::vector<std::string>{"b", "c", "d", "a"}));
    EXPECT_TRUE(reg.reorder(3, 1));
    EXPECT_EQ(reg.order(), (std::vector<std::string>{"b", "a", "c", "d"}));

    EXPECT_FALSE(reg.reorder(2, 2));
    EXPECT_FALSE(reg.reorder(-1, 2));
    EXPECT_FALSE(reg.reorder(0, 4));
    EXPECT_EQ(reg.order(), (std::vector<std::string>{"b", "a", "c", "d"}));
}

TEST(LayerRegistryTest, SetBandReseedsStretch) {
    LayerRegistry reg;
    reg.add(make_raster("a", 4));
    reg.set_stretch("a", {1, 2, 0.5});

    ASSERT_TRUE(reg.set_band("a", 3));
    const RasterLayer* l = reg.get_raster("a");
    EXPECT_EQ(l->band, 3);
    EXPECT_DOUBLE_EQ(l->stretch.min, 30.0);
    EXPECT_DOUBLE_EQ(l->stretch.max, 130.0);

    EXPECT_FALSE(reg.set_band("a", 0));
    EXPECT_FALSE(reg.set_band("a", 5));
    EXPECT_EQ(reg.get_raster("a")->band, 3);
}

TEST(LayerRegistryTest, SetRgbBandsValidatesAndReseeds) {
    LayerRegistry reg;
    reg.add(make_raster("a", 4));

    EXPECT_FALSE(reg.set_rgb_bands("a", {4, 5, 1}));
    ASSERT_TRUE(reg.set_rgb_bands("a", {4, 3, 2}));

    const RasterLayer* l = reg.get_raster("a");
    EXPECT_EQ(l->rgb_bands, (RgbBands{4, 3, 2}));
    EXPECT_EQ(l->rgb_stretch.r, (Stretch{40, 140, 1}));
    EXPECT_EQ(l->rgb_stretch.g, (Stretch{30, 130, 1}));
    EXPECT_EQ(l->rgb_stretch.b, (Stretch{20, 120, 1}));
}

TEST(LayerRegistryTest, PerChannelStretch) {
    LayerRegistry reg;
    reg.add(make_raster("a", 3));
    ASSERT_TRUE(reg.set_rgb_stretch("a", Channel::B, {5, 6, 2.2}));
    const RasterLayer* l = reg.get_raster("a");
    EXPECT_EQ(l->rgb_stretch[Channel::B], (Stretch{5, 6, 2.2}));
    EXPECT_EQ(l->rgb_stretch.r, (Stretch{10, 110, 1}));
}

TEST(LayerRegistryTest, OpacityIsClampedAndNameResets) {
    LayerRegistry reg;
    reg.add(make_raster("a", 1));
    reg.set_opacity("a", 1.7);
    EXPECT_DOUBLE_EQ(common(*reg.get("a")).opacity, 1.0);
    reg.set_opacity("a", -3);
    EXPECT_DOUBLE_EQ(common(*reg.get("a")).opacity, 0.0);

    reg.set_display_name("a", "Scene A");
    EXPECT_EQ(layer_label(*reg.get("a")), "Scene A");
    reg.set_display_name("a", "");
    EXPECT_EQ(layer_label(*reg.get("a")), "a.tif");
}

TEST(LayerRegistryTest, ClearRetiresIds) {
    LayerRegistry reg;
    reg.add(make_raster("a", 1));
    reg.clear();
    EXPECT_TRUE(reg.empty());
    EXPECT_FALSE(reg.add(make_raster("a", 1)));
}
