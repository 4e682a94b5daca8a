#include <gtest/gtest.h>
#include "reflow/text/cluster_map.h"
#include "reflow/text/font_cache.h"
#include "reflow/text/run_builder.h"
#include "reflow/text/text_shaping.h"
#include "tests/reflow_test_common.h"
#include <string>
#include <vector>

using namespace reflow::text;

namespace {

const std::string kMarker = "\xE2\x80\x8B";

PositionedGlyph makeGlyph(std::uint32_t cluster, float advance) {
    PositionedGlyph glyph{};
    glyph.glyphId = 1;
    glyph.clusterIndex = cluster;
    glyph.xAdvance = advance;
    return glyph;
}

TextRun makeRun(const std::string& text, const std::string& fontPath, float fontSize) {
    TextRun run;
    run.start = 0;
    run.end = static_cast<std::uint32_t>(text.size());
    run.script = CodePointScript::Thai;
    run.fontPath = fontPath;
    run.style.fontSize = fontSize;
    return run;
}

// Spans must tile [start, end) with increasing glyph ranges
void expectTiling(const ShapeResult& result, std::uint32_t start, std::uint32_t end) {
    const auto& spans = result.clusters.spans();
    ASSERT_FALSE(spans.empty());
    EXPECT_EQ(spans.front().sourceStart, start);
    EXPECT_EQ(spans.back().sourceEnd, end);

    std::uint32_t glyphTotal = 0;
    for (std::size_t i = 0; i < spans.size(); ++i) {
        EXPECT_LT(spans[i].sourceStart, spans[i].sourceEnd);
        EXPECT_EQ(spans[i].firstGlyph, glyphTotal);
        glyphTotal += spans[i].glyphCount;
        if (i > 0) {
            EXPECT_EQ(spans[i].sourceStart, spans[i - 1].sourceEnd);
        }
    }
    EXPECT_EQ(glyphTotal, result.glyphs.size());
}

} // namespace

// =============================================================================
// Cluster map
// =============================================================================

TEST(ClusterMapTest, OneSpanPerCluster) {
    ClusterMap map;
    std::vector<PositionedGlyph> glyphs = {
        makeGlyph(0, 5.0f), makeGlyph(3, 4.0f), makeGlyph(3, 0.0f), makeGlyph(6, 7.0f),
    };

    ASSERT_TRUE(map.build(glyphs, 0, 9));
    ASSERT_EQ(map.size(), 3u);

    const ClusterSpan& shared = map.spans()[1];
    EXPECT_EQ(shared.sourceStart, 3u);
    EXPECT_EQ(shared.sourceEnd, 6u);
    EXPECT_EQ(shared.firstGlyph, 1u);
    EXPECT_EQ(shared.glyphCount, 2u);
    EXPECT_FLOAT_EQ(shared.advance, 4.0f);
    EXPECT_EQ(map.spans()[2].sourceEnd, 9u);
}

TEST(ClusterMapTest, LigatureCoversSkippedCharacters) {
    ClusterMap map;
    // "ffi" ligature at 10, next glyph at 13
    std::vector<PositionedGlyph> glyphs = {makeGlyph(10, 9.0f), makeGlyph(13, 3.0f)};

    ASSERT_TRUE(map.build(glyphs, 10, 14));
    ASSERT_EQ(map.size(), 2u);
    EXPECT_EQ(map.spans()[0].sourceEnd, 13u);
}

TEST(ClusterMapTest, RejectsMalformedClusters) {
    ClusterMap map;
    EXPECT_FALSE(map.build({makeGlyph(3, 1.0f), makeGlyph(0, 1.0f)}, 0, 6));
    EXPECT_TRUE(map.empty());
    EXPECT_FALSE(map.build({makeGlyph(6, 1.0f)}, 0, 6));
    EXPECT_FALSE(map.build({makeGlyph(1, 1.0f)}, 2, 6));
    EXPECT_TRUE(map.build({}, 0, 6));
    EXPECT_TRUE(map.empty());
}

TEST(ClusterMapTest, LeadingBytesFoldIntoFirstSpan) {
    ClusterMap map;
    ASSERT_TRUE(map.build({makeGlyph(2, 1.0f), makeGlyph(5, 1.0f), makeGlyph(8, 1.0f)}, 0, 10));

    ASSERT_EQ(map.size(), 3u);
    EXPECT_EQ(map.spans()[0].sourceStart, 0u);
    EXPECT_EQ(map.spans()[0].sourceEnd, 5u);
    EXPECT_EQ(map.spans()[2].sourceEnd, 10u);

    map.clear();
    EXPECT_TRUE(map.empty());
}

// =============================================================================
// Marker stripping
// =============================================================================

TEST(StripRunTest, MapsBackToBufferOffsets) {
    const std::string buffer = "ab" + kMarker + "c" + kMarker;
    TextRun run;
    run.start = 1;
    run.end = static_cast<std::uint32_t>(buffer.size());

    StrippedRun stripped = stripRun(buffer, run);
    EXPECT_EQ(stripped.text, "bc");
    ASSERT_EQ(stripped.bufferOffsets.size(), 2u);
    EXPECT_EQ(stripped.bufferOffsets[0], 1u);
    EXPECT_EQ(stripped.bufferOffsets[1], 5u);
}

// =============================================================================
// Degraded shaping
// =============================================================================

class ShapingAdapterTest : public ::testing::Test {
protected:
    ShapingConfiguration config;
    FontCache fontCache;

    void SetUp() override {
        ASSERT_TRUE(fontCache.initialize());
    }

    void TearDown() override {
        fontCache.shutdown();
    }
};

TEST_F(ShapingAdapterTest, NoFontPathDegradesPerCodePoint) {
    ShapingAdapter adapter(config, &fontCache);
    const std::string text = "ไก่" + kMarker + "ที่";
    TextRun run = makeRun(text, "", 10.0f);

    ShapeResult result = adapter.shape(run, text);
    EXPECT_EQ(result.fallback, ShapingFallback::NoFontPath);
    EXPECT_TRUE(result.degraded());
    EXPECT_FALSE(result.coversEntireRun);

    // Six Thai code points; the marker produces nothing
    ASSERT_EQ(result.glyphs.size(), 6u);
    for (const PositionedGlyph& glyph : result.glyphs) {
        EXPECT_FLOAT_EQ(glyph.xAdvance, 6.0f);
        EXPECT_NE(glyph.glyphId, kBoundaryMarker);
    }
    EXPECT_EQ(result.glyphs[0].glyphId, 0x0E44u);
    EXPECT_EQ(result.glyphs[3].clusterIndex, 12u);

    // Tone and vowel marks share the cluster of their base consonant
    EXPECT_EQ(result.glyphs[2].clusterIndex, 3u);
    EXPECT_EQ(result.glyphs[4].clusterIndex, 12u);
    EXPECT_EQ(result.glyphs[5].clusterIndex, 12u);

    expectTiling(result, 0, static_cast<std::uint32_t>(text.size()));
    ASSERT_EQ(result.clusters.size(), 3u);
    EXPECT_EQ(result.clusters.spans()[0].sourceEnd, 3u);
    EXPECT_EQ(result.clusters.spans()[1].sourceEnd, 12u);
    EXPECT_EQ(result.clusters.spans()[1].glyphCount, 2u);
    EXPECT_FLOAT_EQ(result.clusters.spans()[1].advance, 12.0f);
    EXPECT_EQ(result.clusters.spans()[2].glyphCount, 3u);
}

TEST_F(ShapingAdapterTest, DegradedLeadingMarkKeepsOwnCluster) {
    ShapingAdapter adapter(config, &fontCache);
    // Orphan tone mark, then a Latin letter with a combining acute
    const std::string text = "\xE0\xB9\x88" "e\xCC\x81";
    TextRun run = makeRun(text, "", 10.0f);

    ShapeResult result = adapter.shape(run, text);
    ASSERT_EQ(result.glyphs.size(), 3u);
    EXPECT_EQ(result.glyphs[0].clusterIndex, 0u);
    EXPECT_EQ(result.glyphs[1].clusterIndex, 3u);
    EXPECT_EQ(result.glyphs[2].clusterIndex, 3u);
    ASSERT_EQ(result.clusters.size(), 2u);
    expectTiling(result, 0, static_cast<std::uint32_t>(text.size()));
}

TEST_F(ShapingAdapterTest, ShapingDisabled) {
    config.shapingEnabled = false;
    ShapingAdapter adapter(config, &fontCache);
    const std::string text = "hello";
    TextRun run = makeRun(text, "/fonts/any.ttf", 12.0f);

    ShapeResult result = adapter.shape(run, text);
    EXPECT_EQ(result.fallback, ShapingFallback::ShapingDisabled);
    EXPECT_EQ(result.glyphs.size(), 5u);
    EXPECT_EQ(fontCache.constructionCount(), 0u);
}

TEST_F(ShapingAdapterTest, MissingEngineDegrades) {
    ShapingAdapter adapter(config, nullptr);
    const std::string text = "ไก่";
    TextRun run = makeRun(text, "/fonts/any.ttf", 12.0f);

    ShapeResult result = adapter.shape(run, text);
    EXPECT_EQ(result.fallback, ShapingFallback::EngineUnavailable);
    EXPECT_EQ(result.glyphs.size(), 3u);
}

TEST_F(ShapingAdapterTest, UnloadableFontDegrades) {
    ShapingAdapter adapter(config, &fontCache);
    const std::string text = "ไก่";
    TextRun run = makeRun(text, "/nonexistent/NotoSansThai.ttf", 12.0f);

    ShapeResult result = adapter.shape(run, text);
    EXPECT_EQ(result.fallback, ShapingFallback::FontLoadFailed);
    EXPECT_FALSE(result.coversEntireRun);
    EXPECT_EQ(result.glyphs.size(), 3u);
}

TEST_F(ShapingAdapterTest, FallbackAdvanceFollowsConfig) {
    config.fallbackAdvanceEm = 0.5f;
    ShapingAdapter adapter(config, &fontCache);
    const std::string text = "ab";
    TextRun run = makeRun(text, "", 20.0f);

    ShapeResult result = adapter.shape(run, text);
    ASSERT_EQ(result.glyphs.size(), 2u);
    EXPECT_FLOAT_EQ(result.glyphs[1].xAdvance, 10.0f);
}

TEST_F(ShapingAdapterTest, PlaceholderIsSingleGlyph) {
    ShapingAdapter adapter(config, &fontCache);
    const std::string text = "x{v2}y";
    RunBuilder builder("", TextStyle{}, {1.0f, 2.0f, 33.0f});
    std::vector<TextRun> runs = builder.buildRuns(text);
    ASSERT_EQ(runs.size(), 3u);

    ShapeResult result = adapter.shape(runs[1], text);
    EXPECT_FALSE(result.degraded());
    EXPECT_TRUE(result.coversEntireRun);
    ASSERT_EQ(result.glyphs.size(), 1u);
    EXPECT_EQ(result.glyphs[0].flags & kGlyphFlagPlaceholder, kGlyphFlagPlaceholder);
    EXPECT_EQ(result.glyphs[0].glyphId, 2u);
    EXPECT_FLOAT_EQ(result.glyphs[0].xAdvance, 33.0f);
    expectTiling(result, 1, 5);
}

TEST(FallbackNameTest, Names) {
    EXPECT_STREQ(fallbackName(ShapingFallback::None), "none");
    EXPECT_STREQ(fallbackName(ShapingFallback::NoFontPath), "no-font-path");
    EXPECT_STREQ(fallbackName(ShapingFallback::MalformedClusters), "malformed-clusters");
}

// =============================================================================
// HarfBuzz shaping with system fonts
// =============================================================================

TEST_F(ShapingAdapterTest, ShapesLatinWithSystemFont) {
    const std::string fontPath = reflow_test::findSystemFont();
    if (fontPath.empty()) {
        GTEST_SKIP() << "No system font available";
    }

    ShapingAdapter adapter(config, &fontCache);
    const std::string text = "Hello";
    TextRun run = makeRun(text, fontPath, 16.0f);
    run.script = CodePointScript::Latin;

    ShapeResult result = adapter.shape(run, text);
    EXPECT_EQ(result.fallback, ShapingFallback::None);
    EXPECT_TRUE(result.coversEntireRun);
    ASSERT_EQ(result.glyphs.size(), 5u);
    for (std::size_t i = 0; i < result.glyphs.size(); ++i) {
        EXPECT_EQ(result.glyphs[i].clusterIndex, i);
        EXPECT_GT(result.glyphs[i].xAdvance, 0.0f);
        EXPECT_EQ(result.glyphs[i].flags & kGlyphFlagRtl, 0u);
    }
    expectTiling(result, 0, 5);
}

TEST_F(ShapingAdapterTest, RtlGlyphsReturnInLogicalOrder) {
    const std::string fontPath = reflow_test::findSystemFont();
    if (fontPath.empty()) {
        GTEST_SKIP() << "No system font available";
    }

    ShapingAdapter adapter(config, &fontCache);
    const std::string text = "שלום";
    TextRun run = makeRun(text, fontPath, 16.0f);
    run.script = CodePointScript::Hebrew;

    ShapeResult result = adapter.shape(run, text);
    ASSERT_EQ(result.fallback, ShapingFallback::None);
    ASSERT_FALSE(result.glyphs.empty());
    EXPECT_EQ(result.glyphs.front().clusterIndex, 0u);
    for (std::size_t i = 0; i < result.glyphs.size(); ++i) {
        EXPECT_NE(result.glyphs[i].flags & kGlyphFlagRtl, 0u);
        if (i > 0) {
            EXPECT_GE(result.glyphs[i].clusterIndex, result.glyphs[i - 1].clusterIndex);
        }
    }
}

TEST_F(ShapingAdapterTest, ThaiMarkersNeverReachTheEngine) {
    const std::string fontPath = reflow_test::findThaiFont();
    if (fontPath.empty()) {
        GTEST_SKIP() << "No Thai font available";
    }

    ShapingAdapter adapter(config, &fontCache);
    const std::string plain = reflow_test::thaiScenarioText();
    const std::string hinted = reflow_test::withMarkers(reflow_test::thaiScenarioWords());

    ShapeResult plainResult = adapter.shape(makeRun(plain, fontPath, 16.0f), plain);
    ShapeResult hintedResult = adapter.shape(makeRun(hinted, fontPath, 16.0f), hinted);
    ASSERT_EQ(plainResult.fallback, ShapingFallback::None);
    ASSERT_EQ(hintedResult.fallback, ShapingFallback::None);

    // Same glyphs, same total advance
    ASSERT_EQ(plainResult.glyphs.size(), hintedResult.glyphs.size());
    float plainWidth = 0.0f;
    float hintedWidth = 0.0f;
    for (std::size_t i = 0; i < plainResult.glyphs.size(); ++i) {
        EXPECT_EQ(plainResult.glyphs[i].glyphId, hintedResult.glyphs[i].glyphId);
        plainWidth += plainResult.glyphs[i].xAdvance;
        hintedWidth += hintedResult.glyphs[i].xAdvance;
    }
    EXPECT_NEAR(plainWidth, hintedWidth, 0.001f);

    // No cluster points into a marker
    for (const PositionedGlyph& glyph : hintedResult.glyphs) {
        EXPECT_NE(hinted.compare(glyph.clusterIndex, kMarker.size(), kMarker), 0);
    }
    expectTiling(hintedResult, 0, static_cast<std::uint32_t>(hinted.size()));
}
