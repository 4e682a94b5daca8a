#ifndef REFLOW_TEXT_LINE_COMPOSITOR_H
#define REFLOW_TEXT_LINE_COMPOSITOR_H

#include "reflow/text/text_shaping.h"
#include "reflow/text/text_types.h"
#include <cstdint>
#include <string_view>
#include <vector>

namespace reflow::text {

// Tolerance on the line width bound
constexpr float kLineWidthEpsilon = 0.01f;

/**
 * Shift every placement of a line.
 */
void translateLine(Line& line, float dx, float dy);

/**
 * LineCompositor: breaks a paragraph's shaped runs into lines.
 *
 * Clusters (or placeholders) are accumulated left to right. When the next
 * one would overflow, the latest break candidate on the line whose
 * preceding width reaches minLineUsageFraction * maxWidth wins. Candidates:
 * - a boundary marker between two clusters
 * - a space (dropped from both lines)
 * - after punctuation (kept on the line)
 * - between CJK ideographs
 * - either edge of a placeholder
 *
 * Without a qualifying candidate, text in a space-delimited script breaks
 * at its latest candidate, or overflows whole when the line has none.
 * Text in an unspaced script breaks at the cluster boundary before the
 * overflowing cluster. A newline always ends the line.
 */
class LineCompositor {
public:
    explicit LineCompositor(float minLineUsageFraction);

    /**
     * Compose lines.
     * @param buffer Paragraph buffer (may contain boundary markers)
     * @param runs Runs of the buffer, in order
     * @param shaped One shape result per run
     * @param maxWidth Available width
     * @param originX Pen x at the start of each line
     * @param baselineY Baseline y shared by all lines
     * @return Lines; source ranges index the marker-free text
     */
    std::vector<Line> composeLines(
        std::string_view buffer,
        const std::vector<TextRun>& runs,
        const std::vector<ShapeResult>& shaped,
        float maxWidth,
        float originX = 0.0f,
        float baselineY = 0.0f
    ) const;

private:
    float minLineUsageFraction_;

    // A cluster or placeholder: the smallest unit a line may hold
    struct Unit {
        std::uint32_t sourceStart;
        std::uint32_t sourceEnd;
        std::uint32_t runIndex;
        std::uint32_t firstGlyph;
        std::uint32_t glyphCount;
        float advance;
        bool newline;
        bool space;
        bool punctuation;       // Ends in punctuation that allows a break after
        bool cjk;
        bool placeholder;
        bool markerBefore;      // A boundary marker separates it from the previous unit
        bool spacedScript;
        bool rtl;
    };

    struct BreakCandidate {
        std::uint32_t index;    // First unit of the next line
        std::uint32_t skip;     // Units dropped at the break (a space)
        float widthBefore;
    };

    std::vector<Unit> collectUnits(
        std::string_view buffer,
        const std::vector<TextRun>& runs,
        const std::vector<ShapeResult>& shaped
    ) const;

    static bool candidateBefore(const std::vector<Unit>& units, std::uint32_t i, BreakCandidate& out, float width);

    Line emitLine(
        const std::vector<Unit>& units,
        const std::vector<ShapeResult>& shaped,
        const std::vector<std::uint32_t>& markerOffsets,
        std::uint32_t first,
        std::uint32_t last,
        std::uint32_t sourceAnchor,
        float originX,
        float baselineY
    ) const;
};

} // namespace reflow::text

#endif // REFLOW_TEXT_LINE_COMPOSITOR_H
