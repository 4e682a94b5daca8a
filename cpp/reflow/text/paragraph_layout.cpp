#include "reflow/text/paragraph_layout.h"

#include "reflow/core/logging.h"
#include "reflow/text/boundary_hinter.h"
#include "reflow/text/line_compositor.h"
#include "reflow/text/run_builder.h"
#include "reflow/text/text_shaping.h"

#include <limits>

namespace reflow::text {

namespace {

constexpr float kLineHeightStep = 0.05f;

} // namespace

ParagraphLayoutEngine::ParagraphLayoutEngine(
    const ShapingConfiguration& config,
    const LayoutCapabilities& capabilities
)
    : config_(config), capabilities_(capabilities) {}

ParagraphLayout ParagraphLayoutEngine::layoutParagraph(const ParagraphInput& input) const {
    ParagraphLayout layout;
    layout.fontSize = input.fontSize * config_.fontScaleFor(input.languageTag);
    layout.lineHeight = config_.lineHeightFor(input.languageTag);

    if (input.text.empty()) {
        return layout;
    }

    // Boundary hints
    BoundaryHinter hinter(config_, capabilities_.tokenizer());
    std::size_t markers = 0;
    const std::string buffer = hinter.hint(input.text, input.languageTag, &markers);
    layout.hintsApplied = markers > 0;

    // Runs
    TextStyle style;
    style.fontSize = layout.fontSize;
    RunBuilder builder(config_.fontPath.value_or(std::string()), style, input.placeholderAdvances);
    const std::vector<TextRun> runs = builder.buildRuns(buffer);

    // Shaping
    ShapingAdapter adapter(config_, capabilities_.fontCache());
    std::vector<ShapeResult> shaped;
    shaped.reserve(runs.size());
    for (const TextRun& run : runs) {
        shaped.push_back(adapter.shape(run, buffer));
        if (shaped.back().degraded()) {
            layout.degradedRuns++;
        }
    }

    // Lines; a box without width does not wrap
    float maxWidth = input.box.x1 - input.box.x0;
    if (maxWidth <= 0.0f) {
        maxWidth = std::numeric_limits<float>::max();
    }
    LineCompositor compositor(config_.minLineUsageFraction);
    layout.lines = compositor.composeLines(buffer, runs, shaped, maxWidth, input.box.x0, input.box.baselineY);

    // Shrink-to-fit; line pitch follows the requested size, not the scaled one
    if (input.box.height > 0.0f) {
        const float lineCount = static_cast<float>(layout.lines.size());
        while (lineCount * input.fontSize * layout.lineHeight > input.box.height &&
               layout.lineHeight >= 1.0f) {
            layout.lineHeight -= kLineHeightStep;
        }
    }

    positionLines(input, layout);

    REFLOW_LOG_DEBUG("paragraph: %zu lines, %zu runs (%zu degraded), size %.2f, line height %.2f",
                     layout.lines.size(), runs.size(), layout.degradedRuns,
                     static_cast<double>(layout.fontSize), static_cast<double>(layout.lineHeight));
    return layout;
}

void ParagraphLayoutEngine::positionLines(const ParagraphInput& input, ParagraphLayout& layout) {
    const float containerWidth = input.box.x1 - input.box.x0;
    const float lineStep = input.fontSize * layout.lineHeight;

    for (std::size_t k = 0; k < layout.lines.size(); ++k) {
        Line& line = layout.lines[k];

        float xOffset = 0.0f;
        if (input.align == TextAlign::Center) {
            xOffset = (containerWidth - line.advance) * 0.5f;
        } else if (input.align == TextAlign::Right) {
            xOffset = containerWidth - line.advance;
        }

        // Clamp to positive to prevent text going outside the box to the left
        if (xOffset < 0.0f) xOffset = 0.0f;

        // Baselines step down the page (y up)
        translateLine(line, xOffset, -static_cast<float>(k) * lineStep);
    }
}

} // namespace reflow::text
