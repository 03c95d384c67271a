#include <rastile/rastile.h>
#include <gtest/gtest.h>
#include <cstring>
#include <string>

/* Nothing listens on the discard port, so every engine call fails fast */
static const char* kDeadEngine = "http://127.0.0.1:9";

TEST(CApiTest, CallsBeforeInitFail) {
    rastile_shutdown();
    char id[32] = {};
    uint8_t buf[16];
    rastile_cache_stats_t stats;
    EXPECT_EQ(rastile_open_raster("/data/a.tif", id, sizeof(id)), 0);
    EXPECT_EQ(rastile_fetch_tile("raster-a://0/0/0", buf, sizeof(buf)), -1);
    EXPECT_EQ(rastile_cache_stats(&stats), 0);
    EXPECT_EQ(rastile_set_band("a", 1), 0);
    rastile_set_zoom(3.0);
}

TEST(CApiTest, FailuresAreReportedNotThrown) {
    ASSERT_EQ(rastile_init(kDeadEngine), 1);

    char id[32] = {};
    EXPECT_EQ(rastile_open_raster("/data/a.tif", id, sizeof(id)), 0);
    EXPECT_EQ(id[0], '\0');

    uint8_t buf[16];
    EXPECT_EQ(rastile_fetch_tile("raster-missing://0/0/0", buf, sizeof(buf)), -1);
    EXPECT_EQ(rastile_fetch_tile("not a tile url", buf, sizeof(buf)), -1);

    char msg[256] = {};
    EXPECT_GE(rastile_last_log(msg, sizeof(msg)), RASTILE_LOG_WARN);
    EXPECT_GT(std::strlen(msg), 0u);

    EXPECT_EQ(rastile_remove_layer("missing"), 0);
    EXPECT_EQ(rastile_create_composition("missing", 0, id, sizeof(id)), 0);
    EXPECT_EQ(rastile_set_display_mode("missing", RASTILE_DISPLAY_RGB), 0);

    rastile_cache_stats_t stats;
    ASSERT_EQ(rastile_cache_stats(&stats), 1);
    EXPECT_EQ(stats.size, 0);
    EXPECT_GT(stats.max_size, 0);

    rastile_shutdown();
    EXPECT_EQ(rastile_cache_stats(&stats), 0);
}
