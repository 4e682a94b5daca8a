#include "reflow/text/cluster_map.h"

namespace reflow::text {

bool ClusterMap::build(
    const std::vector<PositionedGlyph>& glyphs,
    std::uint32_t runStart,
    std::uint32_t runEnd
) {
    spans_.clear();
    if (glyphs.empty()) {
        return true;
    }

    std::uint32_t prevCluster = runStart;
    for (std::uint32_t i = 0; i < glyphs.size(); ++i) {
        const std::uint32_t cluster = glyphs[i].clusterIndex;
        if (cluster < prevCluster || cluster >= runEnd) {
            spans_.clear();
            return false;
        }
        prevCluster = cluster;

        if (!spans_.empty() && spans_.back().sourceStart == cluster) {
            ClusterSpan& span = spans_.back();
            span.glyphCount++;
            span.advance += glyphs[i].xAdvance;
            continue;
        }

        if (!spans_.empty()) {
            spans_.back().sourceEnd = cluster;
        }
        ClusterSpan span{};
        span.sourceStart = cluster;
        span.sourceEnd = runEnd;
        span.firstGlyph = i;
        span.glyphCount = 1;
        span.advance = glyphs[i].xAdvance;
        spans_.push_back(span);
    }

    // Leading characters without a glyph belong to the first cluster
    spans_.front().sourceStart = runStart;
    return true;
}

} // namespace reflow::text
