#ifndef REFLOW_TEXT_BOUNDARY_HINTER_H
#define REFLOW_TEXT_BOUNDARY_HINTER_H

#include "reflow/text/shaping_config.h"
#include "reflow/text/text_types.h"
#include "reflow/text/word_tokenizer.h"
#include <cstddef>
#include <string>
#include <string_view>

namespace reflow::text {

/**
 * Script that needs boundary hints for a language tag ("th" -> Thai).
 * Common means the language needs no hints.
 */
CodePointScript hintedScriptFor(std::string_view languageTag);

/**
 * Remove every boundary marker from text.
 */
std::string stripMarkers(std::string_view text);

bool containsMarker(std::string_view text);

/**
 * BoundaryHinter: inserts zero-width boundary markers between words of
 * scripts written without spaces, so the line compositor has break
 * candidates inside otherwise unbreakable text.
 *
 * The tokenizer is asked once per contiguous run of the language's script.
 * A run that already carries markers is treated as hinted and copied
 * through, which makes hint() idempotent. Any tokenizer failure leaves the
 * run as it was.
 */
class BoundaryHinter {
public:
    /**
     * @param config Shaping configuration (wordWrapEnabled, tokenizerEngine)
     * @param tokenizer Word tokenizer, or nullptr when none is available
     */
    BoundaryHinter(const ShapingConfiguration& config, const WordTokenizer* tokenizer);

    /**
     * Insert boundary markers.
     * @param text Translated UTF-8 text
     * @param languageTag Target language (BCP 47)
     * @param insertedMarkers Optional count of markers added
     * @return text with markers between tokens
     */
    std::string hint(
        std::string_view text,
        std::string_view languageTag,
        std::size_t* insertedMarkers = nullptr
    ) const;

    bool isEnabled() const { return config_.wordWrapEnabled && tokenizer_ != nullptr; }

private:
    const ShapingConfiguration& config_;
    const WordTokenizer* tokenizer_;

    // Append run to out, split by markers; returns markers added
    std::size_t appendHintedRun(std::string_view run, std::string& out) const;
};

} // namespace reflow::text

#endif // REFLOW_TEXT_BOUNDARY_HINTER_H
