#ifndef REFLOW_TEXT_PARAGRAPH_LAYOUT_H
#define REFLOW_TEXT_PARAGRAPH_LAYOUT_H

#include "reflow/text/layout_capabilities.h"
#include "reflow/text/shaping_config.h"
#include "reflow/text/text_types.h"
#include <cstddef>
#include <string>
#include <vector>

namespace reflow::text {

// Region of the page a paragraph is reflowed into (PDF units, y up)
struct ParagraphBox {
    float x0 = 0.0f;
    float x1 = 0.0f;
    float baselineY = 0.0f;     // Baseline of the first line
    float height = 0.0f;        // Available height; 0 disables shrink-to-fit
};

struct ParagraphInput {
    std::string text;                       // Translated text
    std::string languageTag;                // Target language (BCP 47)
    std::vector<float> placeholderAdvances; // Advance per placeholder id
    ParagraphBox box;
    float fontSize = 12.0f;
    TextAlign align = TextAlign::Left;
};

struct ParagraphLayout {
    std::vector<Line> lines;
    float fontSize = 0.0f;          // Shaping size after the per-language scale
    float lineHeight = 0.0f;        // Multiplier after shrink-to-fit
    std::size_t degradedRuns = 0;
    bool hintsApplied = false;
};

/**
 * ParagraphLayoutEngine: reflows one paragraph into its box.
 *
 * Responsibilities:
 * - Hint word boundaries, build runs, shape, compose lines
 * - Apply the per-language font scale and line height
 * - Shrink the line height until the lines fit the box height
 * - Place each line's baseline and apply alignment
 *
 * Stateless between calls; paragraphs may be laid out from several threads
 * against the same engine.
 */
class ParagraphLayoutEngine {
public:
    ParagraphLayoutEngine(const ShapingConfiguration& config, const LayoutCapabilities& capabilities);

    // Non-copyable
    ParagraphLayoutEngine(const ParagraphLayoutEngine&) = delete;
    ParagraphLayoutEngine& operator=(const ParagraphLayoutEngine&) = delete;

    /**
     * Lay out a paragraph.
     * @param input Text, language and geometry
     * @return Lines with absolute placements; zero lines for empty text
     */
    ParagraphLayout layoutParagraph(const ParagraphInput& input) const;

private:
    const ShapingConfiguration& config_;
    const LayoutCapabilities& capabilities_;

    /**
     * Calculate line positions based on alignment.
     */
    static void positionLines(const ParagraphInput& input, ParagraphLayout& layout);
};

} // namespace reflow::text

#endif // REFLOW_TEXT_PARAGRAPH_LAYOUT_H
