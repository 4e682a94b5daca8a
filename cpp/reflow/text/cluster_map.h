#ifndef REFLOW_TEXT_CLUSTER_MAP_H
#define REFLOW_TEXT_CLUSTER_MAP_H

#include "reflow/text/text_types.h"
#include <cstdint>
#include <vector>

namespace reflow::text {

// One source cluster and the glyphs that render it
struct ClusterSpan {
    std::uint32_t sourceStart;  // Buffer byte offset (inclusive)
    std::uint32_t sourceEnd;    // Buffer byte offset (exclusive)
    std::uint32_t firstGlyph;   // Index into the run's glyph vector
    std::uint32_t glyphCount;
    float advance;              // Sum of the glyphs' x advances
};

/**
 * ClusterMap: cluster -> glyph range mapping for one shaped run.
 *
 * Glyphs sharing a cluster index form one span (base plus stacked marks,
 * or a ligature covering several characters). Characters the engine
 * dropped produce no span of their own; their bytes extend the preceding
 * span, so the spans tile [runStart, runEnd) exactly.
 */
class ClusterMap {
public:
    ClusterMap() = default;

    /**
     * Build from glyphs in logical order.
     * @param glyphs Glyphs with non-decreasing cluster indices
     * @param runStart Run start offset in the buffer
     * @param runEnd Run end offset in the buffer
     * @return False if cluster indices decrease or fall outside the run
     */
    bool build(
        const std::vector<PositionedGlyph>& glyphs,
        std::uint32_t runStart,
        std::uint32_t runEnd
    );

    const std::vector<ClusterSpan>& spans() const { return spans_; }
    std::size_t size() const { return spans_.size(); }
    bool empty() const { return spans_.empty(); }

    void clear() { spans_.clear(); }

private:
    std::vector<ClusterSpan> spans_;
};

} // namespace reflow::text

#endif // REFLOW_TEXT_CLUSTER_MAP_H
