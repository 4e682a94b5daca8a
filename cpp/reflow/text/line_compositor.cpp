#include "reflow/text/line_compositor.h"

#include "reflow/core/string_utils.h"
#include "reflow/text/script_classifier.h"

#include <algorithm>

namespace reflow::text {

namespace {

bool hasMarkerAt(std::string_view buffer, std::size_t pos) {
    return pos + kBoundaryMarkerBytes <= buffer.size() &&
        buffer.compare(pos, kBoundaryMarkerBytes, kBoundaryMarkerUtf8) == 0;
}

bool isBreakingSpace(std::uint32_t cp) {
    return cp == ' ' || cp == '\t' || cp == '\r' || cp == 0x3000;
}

// Punctuation after which a line may end
bool isBreakingPunctuation(std::uint32_t cp) {
    switch (cp) {
        case ',': case '.': case ';': case ':': case '!': case '?':
        case ')': case ']': case '}': case '%': case '-': case '/':
        case 0x0E2F:                    // Thai paiyannoi
        case 0x0E46:                    // Thai mai yamok
        case 0x0E5A: case 0x0E5B:       // Thai angkhankhu, khomut
        case 0x3001: case 0x3002:       // Ideographic comma, full stop
        case 0xFF01: case 0xFF0C: case 0xFF0E:
        case 0xFF1A: case 0xFF1B: case 0xFF1F:
            return true;
        default:
            break;
    }
    // Hyphens, dashes, ellipsis
    return cp >= 0x2010 && cp <= 0x2027;
}

std::uint32_t toStrippedOffset(const std::vector<std::uint32_t>& markerOffsets, std::uint32_t offset) {
    auto it = std::lower_bound(markerOffsets.begin(), markerOffsets.end(), offset);
    const std::uint32_t before = static_cast<std::uint32_t>(it - markerOffsets.begin());
    return offset - before * static_cast<std::uint32_t>(kBoundaryMarkerBytes);
}

} // namespace

void translateLine(Line& line, float dx, float dy) {
    for (GlyphPlacement& placement : line.glyphs) {
        placement.x += dx;
        placement.y += dy;
    }
}

LineCompositor::LineCompositor(float minLineUsageFraction)
    : minLineUsageFraction_(std::clamp(minLineUsageFraction, 0.0f, 1.0f)) {}

std::vector<LineCompositor::Unit> LineCompositor::collectUnits(
    std::string_view buffer,
    const std::vector<TextRun>& runs,
    const std::vector<ShapeResult>& shaped
) const {
    std::vector<Unit> units;
    ScriptClassifier classifier;

    // End of the previous unit's last visible character
    std::size_t contentEnd = 0;

    const std::size_t runCount = std::min(runs.size(), shaped.size());
    for (std::size_t r = 0; r < runCount; ++r) {
        const TextRun& run = runs[r];
        const ShapeResult& result = shaped[r];

        for (const ClusterSpan& span : result.clusters.spans()) {
            const std::size_t spanEnd = std::min<std::size_t>(span.sourceEnd, buffer.size());

            std::uint32_t firstCp = 0;
            std::uint32_t lastCp = 0;
            std::size_t contentStart = spanEnd;
            std::size_t lastEnd = span.sourceStart;
            std::size_t visible = 0;

            std::size_t pos = span.sourceStart;
            while (pos < spanEnd) {
                std::uint32_t len = 0;
                const std::uint32_t cp = decodeUtf8Codepoint(buffer, pos, len);
                if (len == 0) break;
                if (cp != kBoundaryMarker) {
                    if (visible == 0) {
                        firstCp = cp;
                        contentStart = pos;
                    }
                    lastCp = cp;
                    lastEnd = pos + len;
                    ++visible;
                }
                pos += len;
            }

            Unit unit{};
            unit.sourceStart = span.sourceStart;
            unit.sourceEnd = span.sourceEnd;
            unit.runIndex = static_cast<std::uint32_t>(r);
            unit.firstGlyph = span.firstGlyph;
            unit.glyphCount = span.glyphCount;
            unit.advance = span.advance;
            unit.placeholder = run.kind == RunKind::Placeholder;
            unit.newline = !unit.placeholder && firstCp == '\n';
            unit.space = !unit.placeholder && visible == 1 && isBreakingSpace(firstCp);
            unit.punctuation = !unit.placeholder && isBreakingPunctuation(lastCp);
            unit.cjk = !unit.placeholder && classifier.classify(firstCp) == CodePointScript::CJK;
            unit.spacedScript = hasInterWordSpacing(run.script);
            unit.rtl = span.glyphCount > 0 &&
                (result.glyphs[span.firstGlyph].flags & kGlyphFlagRtl) != 0;

            // Any marker between the previous visible character and this one
            unit.markerBefore = false;
            if (!units.empty()) {
                for (std::size_t p = contentEnd; p + kBoundaryMarkerBytes <= contentStart; ++p) {
                    if (hasMarkerAt(buffer, p)) {
                        unit.markerBefore = true;
                        break;
                    }
                }
            }

            if (visible > 0) {
                contentEnd = lastEnd;
            }
            units.push_back(unit);
        }
    }

    return units;
}

bool LineCompositor::candidateBefore(
    const std::vector<Unit>& units,
    std::uint32_t i,
    BreakCandidate& out,
    float width
) {
    const Unit& unit = units[i];
    const Unit& prev = units[i - 1];

    out.index = i;
    out.skip = 0;
    out.widthBefore = width;

    if (unit.space) {
        out.skip = 1;
        return true;
    }
    // The space before already offers this break
    if (prev.space) {
        return false;
    }
    if (unit.markerBefore || unit.placeholder || prev.placeholder) {
        return true;
    }
    if (unit.punctuation) {
        return false;
    }
    return prev.punctuation || prev.cjk || unit.cjk;
}

std::vector<Line> LineCompositor::composeLines(
    std::string_view buffer,
    const std::vector<TextRun>& runs,
    const std::vector<ShapeResult>& shaped,
    float maxWidth,
    float originX,
    float baselineY
) const {
    std::vector<Line> lines;

    const std::vector<Unit> units = collectUnits(buffer, runs, shaped);
    if (units.empty()) {
        return lines;
    }

    std::vector<std::uint32_t> markerOffsets;
    for (std::size_t pos = buffer.find(kBoundaryMarkerUtf8, 0, kBoundaryMarkerBytes);
         pos != std::string_view::npos;
         pos = buffer.find(kBoundaryMarkerUtf8, pos + kBoundaryMarkerBytes, kBoundaryMarkerBytes)) {
        markerOffsets.push_back(static_cast<std::uint32_t>(pos));
    }

    const float limit = maxWidth + kLineWidthEpsilon;
    const float minWidth = minLineUsageFraction_ * maxWidth;
    const std::uint32_t count = static_cast<std::uint32_t>(units.size());

    std::uint32_t lineStart = 0;
    std::uint32_t i = 0;
    float width = 0.0f;
    bool overflowing = false;
    std::vector<BreakCandidate> candidates;

    auto emit = [&](std::uint32_t last, std::uint32_t anchor) {
        lines.push_back(emitLine(units, shaped, markerOffsets, lineStart, last, anchor, originX, baselineY));
    };
    auto startLine = [&](std::uint32_t next) {
        lineStart = next;
        i = next;
        width = 0.0f;
        overflowing = false;
        candidates.clear();
    };

    while (i < count) {
        const Unit& unit = units[i];

        if (unit.newline) {
            emit(i, unit.sourceStart);
            startLine(i + 1);
            continue;
        }

        if (i > lineStart) {
            BreakCandidate candidate{};
            if (candidateBefore(units, i, candidate, width)) {
                // A whole-token overflow ends at the first chance
                if (overflowing) {
                    emit(candidate.index, unit.sourceStart);
                    startLine(candidate.index + candidate.skip);
                    continue;
                }
                candidates.push_back(candidate);
            }

            if (!overflowing && width + unit.advance > limit) {
                const BreakCandidate* chosen = nullptr;
                for (auto it = candidates.rbegin(); it != candidates.rend(); ++it) {
                    if (it->widthBefore >= minWidth) {
                        chosen = &*it;
                        break;
                    }
                }
                if (!chosen && unit.spacedScript && !candidates.empty()) {
                    chosen = &candidates.back();
                }

                if (chosen) {
                    const std::uint32_t next = chosen->index + chosen->skip;
                    emit(chosen->index, unit.sourceStart);
                    startLine(next);
                    continue;
                }

                if (unit.spacedScript) {
                    overflowing = true;
                } else {
                    // Last resort: between clusters, never inside one
                    emit(i, unit.sourceStart);
                    startLine(unit.space ? i + 1 : i);
                    continue;
                }
            }
        }

        width += unit.advance;
        ++i;
    }

    if (lineStart < count) {
        emit(count, units.back().sourceEnd);
    }

    return lines;
}

Line LineCompositor::emitLine(
    const std::vector<Unit>& units,
    const std::vector<ShapeResult>& shaped,
    const std::vector<std::uint32_t>& markerOffsets,
    std::uint32_t first,
    std::uint32_t last,
    std::uint32_t sourceAnchor,
    float originX,
    float baselineY
) const {
    Line line;
    if (first >= last) {
        line.sourceStart = toStrippedOffset(markerOffsets, sourceAnchor);
        line.sourceEnd = line.sourceStart;
        return line;
    }

    // Logical to visual: reverse each stretch of RTL units
    std::vector<std::uint32_t> order;
    order.reserve(last - first);
    for (std::uint32_t k = first; k < last; ++k) {
        order.push_back(k);
    }
    std::size_t stretch = 0;
    while (stretch < order.size()) {
        if (!units[order[stretch]].rtl) {
            ++stretch;
            continue;
        }
        std::size_t stretchEnd = stretch;
        while (stretchEnd < order.size() && units[order[stretchEnd]].rtl) {
            ++stretchEnd;
        }
        std::reverse(order.begin() + static_cast<std::ptrdiff_t>(stretch),
                     order.begin() + static_cast<std::ptrdiff_t>(stretchEnd));
        stretch = stretchEnd;
    }

    float pen = originX;
    for (std::uint32_t index : order) {
        const Unit& unit = units[index];
        const std::vector<PositionedGlyph>& glyphs = shaped[unit.runIndex].glyphs;

        for (std::uint32_t g = 0; g < unit.glyphCount; ++g) {
            const std::uint32_t glyphIndex = unit.rtl
                ? unit.firstGlyph + unit.glyphCount - 1 - g
                : unit.firstGlyph + g;
            const PositionedGlyph& glyph = glyphs[glyphIndex];

            GlyphPlacement placement{};
            placement.glyph = glyph;
            placement.x = pen + glyph.xOffset;
            placement.y = baselineY + glyph.yOffset;
            line.glyphs.push_back(placement);

            pen += glyph.xAdvance;
        }
    }

    line.advance = pen - originX;
    line.sourceStart = toStrippedOffset(markerOffsets, units[first].sourceStart);
    line.sourceEnd = toStrippedOffset(markerOffsets, units[last - 1].sourceEnd);
    return line;
}

} // namespace reflow::text
