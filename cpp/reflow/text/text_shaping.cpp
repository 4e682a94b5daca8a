#include "reflow/text/text_shaping.h"

#include "reflow/core/logging.h"
#include "reflow/core/string_utils.h"
#include "reflow/text/script_classifier.h"

#include <hb.h>
#include <unicode/uchar.h>

#include <algorithm>
#include <initializer_list>

namespace reflow::text {

const char* fallbackName(ShapingFallback reason) {
    switch (reason) {
        case ShapingFallback::None: return "none";
        case ShapingFallback::ShapingDisabled: return "shaping-disabled";
        case ShapingFallback::NoFontPath: return "no-font-path";
        case ShapingFallback::EngineUnavailable: return "engine-unavailable";
        case ShapingFallback::FontLoadFailed: return "font-load-failed";
        case ShapingFallback::ShapingFailed: return "shaping-failed";
        case ShapingFallback::MalformedClusters: return "malformed-clusters";
    }
    return "unknown";
}

namespace {

bool isCombiningMark(std::uint32_t cp) {
    return (U_GET_GC_MASK(static_cast<UChar32>(cp)) & (U_GC_MN_MASK | U_GC_ME_MASK | U_GC_MC_MASK)) != 0;
}

} // namespace

StrippedRun stripRun(std::string_view buffer, const TextRun& run) {
    StrippedRun out;
    const std::size_t end = std::min<std::size_t>(run.end, buffer.size());
    if (run.start >= end) {
        return out;
    }

    out.text.reserve(end - run.start);
    out.bufferOffsets.reserve(end - run.start);

    std::size_t pos = run.start;
    while (pos < end) {
        if (end - pos >= kBoundaryMarkerBytes &&
            buffer.compare(pos, kBoundaryMarkerBytes, kBoundaryMarkerUtf8) == 0) {
            pos += kBoundaryMarkerBytes;
            continue;
        }
        out.text.push_back(buffer[pos]);
        out.bufferOffsets.push_back(static_cast<std::uint32_t>(pos));
        ++pos;
    }
    return out;
}

ShapingAdapter::ShapingAdapter(const ShapingConfiguration& config, FontCache* fontCache)
    : config_(config), fontCache_(fontCache) {
    hbBuffer_ = hb_buffer_create();
    if (!hb_buffer_allocation_successful(hbBuffer_)) {
        hb_buffer_destroy(hbBuffer_);
        hbBuffer_ = nullptr;
    }
}

ShapingAdapter::~ShapingAdapter() {
    if (hbBuffer_) {
        hb_buffer_destroy(hbBuffer_);
        hbBuffer_ = nullptr;
    }
}

ShapeResult ShapingAdapter::shape(const TextRun& run, std::string_view buffer) {
    if (run.kind == RunKind::Placeholder) {
        return shapePlaceholder(run);
    }

    // Configuration-absent cases are expected; debug only
    if (!config_.shapingEnabled) {
        REFLOW_LOG_DEBUG("shaping disabled, run [%u, %u) degraded", run.start, run.end);
        return degrade(run, buffer, ShapingFallback::ShapingDisabled);
    }
    if (run.fontPath.empty()) {
        REFLOW_LOG_DEBUG("no font path, run [%u, %u) degraded", run.start, run.end);
        return degrade(run, buffer, ShapingFallback::NoFontPath);
    }
    if (!fontCache_ || !fontCache_->isInitialized() || !hbBuffer_) {
        return degrade(run, buffer, ShapingFallback::EngineUnavailable);
    }

    const FontHandle* font = fontCache_->acquire(run.fontPath, run.style.fontSize);
    if (!font) {
        return degrade(run, buffer, ShapingFallback::FontLoadFailed);
    }

    const StrippedRun stripped = stripRun(buffer, run);

    ShapeResult result;
    if (!stripped.text.empty()) {
        const ShapingFallback reason = shapeWithEngine(*font, run, stripped, result.glyphs);
        if (reason != ShapingFallback::None) {
            REFLOW_LOG_WARN("run [%u, %u) degraded: %s", run.start, run.end, fallbackName(reason));
            return degrade(run, buffer, reason);
        }
    }

    if (!result.clusters.build(result.glyphs, run.start, run.end)) {
        REFLOW_LOG_WARN("run [%u, %u) degraded: %s", run.start, run.end,
                        fallbackName(ShapingFallback::MalformedClusters));
        return degrade(run, buffer, ShapingFallback::MalformedClusters);
    }

    result.coversEntireRun = true;
    return result;
}

ShapeResult ShapingAdapter::degrade(const TextRun& run, std::string_view buffer, ShapingFallback reason) const {
    ShapeResult result;
    result.fallback = reason;
    result.coversEntireRun = false;

    const float advance = config_.fallbackAdvanceEm * run.style.fontSize;
    const std::size_t end = std::min<std::size_t>(run.end, buffer.size());

    std::size_t pos = run.start;
    while (pos < end) {
        std::uint32_t len = 0;
        const std::uint32_t cp = decodeUtf8Codepoint(buffer.substr(0, end), pos, len);
        if (len == 0) break;
        if (cp != kBoundaryMarker) {
            PositionedGlyph glyph{};
            glyph.glyphId = cp;
            glyph.clusterIndex = static_cast<std::uint32_t>(pos);
            // Combining marks stay in the cluster of their base
            if (!result.glyphs.empty() && isCombiningMark(cp)) {
                glyph.clusterIndex = result.glyphs.back().clusterIndex;
            }
            glyph.xAdvance = advance;
            glyph.yAdvance = 0.0f;
            glyph.xOffset = 0.0f;
            glyph.yOffset = 0.0f;
            glyph.flags = 0;
            result.glyphs.push_back(glyph);
        }
        pos += len;
    }

    // Non-decreasing cluster offsets cannot fail
    result.clusters.build(result.glyphs, run.start, run.end);
    return result;
}

ShapeResult ShapingAdapter::shapePlaceholder(const TextRun& run) const {
    ShapeResult result;

    PositionedGlyph glyph{};
    glyph.glyphId = run.placeholderId;
    glyph.clusterIndex = run.start;
    glyph.xAdvance = run.placeholderAdvance;
    glyph.yAdvance = 0.0f;
    glyph.xOffset = 0.0f;
    glyph.yOffset = 0.0f;
    glyph.flags = kGlyphFlagPlaceholder;
    result.glyphs.push_back(glyph);

    result.clusters.build(result.glyphs, run.start, run.end);
    result.coversEntireRun = true;
    return result;
}

ShapingFallback ShapingAdapter::shapeWithEngine(
    const FontHandle& font,
    const TextRun& run,
    const StrippedRun& stripped,
    std::vector<PositionedGlyph>& outGlyphs
) {
    outGlyphs.clear();

    hb_buffer_reset(hbBuffer_);

    // Add text to buffer first (guess_segment_properties needs content)
    hb_buffer_add_utf8(hbBuffer_, stripped.text.data(), static_cast<int>(stripped.text.size()), 0, -1);
    hb_buffer_guess_segment_properties(hbBuffer_);
    if (!hb_buffer_allocation_successful(hbBuffer_)) {
        return ShapingFallback::ShapingFailed;
    }

    // Thai and the other complex scripts need their mark and
    // composition features explicitly on
    hb_feature_t features[5];
    unsigned int featureCount = 0;
    if (requiresComplexShaping(run.script)) {
        for (const char* tag : {"liga", "kern", "mark", "mkmk", "ccmp"}) {
            if (hb_feature_from_string(tag, -1, &features[featureCount])) {
                ++featureCount;
            }
        }
    }

    hb_shape(font.hbFont, hbBuffer_, featureCount > 0 ? features : nullptr, featureCount);

    unsigned int glyphCount = 0;
    hb_glyph_info_t* glyphInfo = hb_buffer_get_glyph_infos(hbBuffer_, &glyphCount);
    hb_glyph_position_t* glyphPos = hb_buffer_get_glyph_positions(hbBuffer_, &glyphCount);
    if (!glyphInfo || !glyphPos || glyphCount == 0) {
        return ShapingFallback::ShapingFailed;
    }

    const bool rtl = hb_buffer_get_direction(hbBuffer_) == HB_DIRECTION_RTL;

    // Scale factor for HarfBuzz positions (26.6 fixed point to float)
    const float scale = 1.0f / 64.0f;

    outGlyphs.reserve(glyphCount);
    for (unsigned int i = 0; i < glyphCount; ++i) {
        const std::uint32_t cluster = glyphInfo[i].cluster;
        if (cluster >= stripped.bufferOffsets.size()) {
            outGlyphs.clear();
            return ShapingFallback::MalformedClusters;
        }

        PositionedGlyph glyph{};
        glyph.glyphId = glyphInfo[i].codepoint;
        glyph.clusterIndex = stripped.bufferOffsets[cluster];
        glyph.xAdvance = glyphPos[i].x_advance * scale;
        glyph.yAdvance = glyphPos[i].y_advance * scale;
        glyph.xOffset = glyphPos[i].x_offset * scale;
        glyph.yOffset = glyphPos[i].y_offset * scale;
        glyph.flags = rtl ? kGlyphFlagRtl : 0;
        outGlyphs.push_back(glyph);
    }

    // RTL buffers come back in visual order
    if (rtl) {
        std::reverse(outGlyphs.begin(), outGlyphs.end());
    }

    for (std::size_t i = 1; i < outGlyphs.size(); ++i) {
        if (outGlyphs[i].clusterIndex < outGlyphs[i - 1].clusterIndex) {
            outGlyphs.clear();
            return ShapingFallback::MalformedClusters;
        }
    }

    return ShapingFallback::None;
}

} // namespace reflow::text
