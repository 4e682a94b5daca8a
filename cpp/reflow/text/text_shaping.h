#ifndef REFLOW_TEXT_SHAPING_H
#define REFLOW_TEXT_SHAPING_H

#include "reflow/text/cluster_map.h"
#include "reflow/text/font_cache.h"
#include "reflow/text/shaping_config.h"
#include "reflow/text/text_types.h"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations
typedef struct hb_buffer_t hb_buffer_t;

namespace reflow::text {

// Output of shaping one run
struct ShapeResult {
    std::vector<PositionedGlyph> glyphs;    // Logical order, clusters non-decreasing
    ClusterMap clusters;
    bool coversEntireRun = false;           // False when the degraded model was used
    ShapingFallback fallback = ShapingFallback::None;

    bool degraded() const { return fallback != ShapingFallback::None; }
};

// Run text with boundary markers removed, plus the way back to the buffer
struct StrippedRun {
    std::string text;
    std::vector<std::uint32_t> bufferOffsets;   // Per stripped byte: buffer offset
};

/**
 * Remove boundary markers from buffer[run.start, run.end).
 */
StrippedRun stripRun(std::string_view buffer, const TextRun& run);

/**
 * ShapingAdapter: shapes runs with HarfBuzz and normalizes the output.
 *
 * Responsibilities:
 * - Keep boundary markers away from the engine
 * - Map engine clusters back to paragraph buffer offsets
 * - Return glyphs in logical order (RTL output is reversed and flagged)
 * - Reject malformed cluster output
 * - Degrade to one fixed-advance glyph per character when shaping is
 *   disabled, unconfigured, unavailable or fails
 *
 * One adapter per layout pass; the HarfBuzz buffer is reused across runs.
 */
class ShapingAdapter {
public:
    /**
     * @param config Shaping configuration
     * @param fontCache Shared font cache, or nullptr when FreeType is unavailable
     */
    ShapingAdapter(const ShapingConfiguration& config, FontCache* fontCache);
    ~ShapingAdapter();

    // Non-copyable
    ShapingAdapter(const ShapingAdapter&) = delete;
    ShapingAdapter& operator=(const ShapingAdapter&) = delete;

    /**
     * Shape a single run.
     * @param run Run to shape
     * @param buffer Paragraph buffer the run offsets refer to
     * @return Glyphs and cluster map; fallback says why shaping was skipped
     */
    ShapeResult shape(const TextRun& run, std::string_view buffer);

    /**
     * Degraded result: one glyph per non-marker code point, glyph id = code
     * point, advance = fallbackAdvanceEm * font size, zero offsets.
     * Combining marks share the cluster of the preceding glyph.
     */
    ShapeResult degrade(const TextRun& run, std::string_view buffer, ShapingFallback reason) const;

private:
    const ShapingConfiguration& config_;
    FontCache* fontCache_;

    // HarfBuzz buffer (reused for shaping)
    hb_buffer_t* hbBuffer_ = nullptr;

    ShapeResult shapePlaceholder(const TextRun& run) const;

    ShapingFallback shapeWithEngine(
        const FontHandle& font,
        const TextRun& run,
        const StrippedRun& stripped,
        std::vector<PositionedGlyph>& outGlyphs
    );
};

} // namespace reflow::text

#endif // REFLOW_TEXT_SHAPING_H
