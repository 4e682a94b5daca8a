#include "reflow/text/boundary_hinter.h"

#include "reflow/core/logging.h"
#include "reflow/core/string_utils.h"
#include "reflow/text/script_classifier.h"

#include <vector>

namespace reflow::text {

CodePointScript hintedScriptFor(std::string_view languageTag) {
    const std::string tag = normalizeLanguageTag(languageTag);
    if (tag == "th") return CodePointScript::Thai;
    if (tag == "lo") return CodePointScript::Lao;
    if (tag == "km") return CodePointScript::Khmer;
    if (tag == "my") return CodePointScript::Myanmar;
    return CodePointScript::Common;
}

std::string stripMarkers(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::size_t found = text.find(kBoundaryMarkerUtf8, pos, kBoundaryMarkerBytes);
        if (found == std::string_view::npos) {
            out.append(text.substr(pos));
            break;
        }
        out.append(text.substr(pos, found - pos));
        pos = found + kBoundaryMarkerBytes;
    }
    return out;
}

bool containsMarker(std::string_view text) {
    return text.find(kBoundaryMarkerUtf8, 0, kBoundaryMarkerBytes) != std::string_view::npos;
}

BoundaryHinter::BoundaryHinter(const ShapingConfiguration& config, const WordTokenizer* tokenizer)
    : config_(config), tokenizer_(tokenizer) {}

std::string BoundaryHinter::hint(
    std::string_view text,
    std::string_view languageTag,
    std::size_t* insertedMarkers
) const {
    if (insertedMarkers) {
        *insertedMarkers = 0;
    }

    const CodePointScript target = hintedScriptFor(languageTag);
    if (!config_.wordWrapEnabled || target == CodePointScript::Common) {
        return std::string(text);
    }
    if (!tokenizer_) {
        REFLOW_LOG_DEBUG("no tokenizer, %s text left unhinted", scriptName(target));
        return std::string(text);
    }

    ScriptClassifier classifier;
    std::string out;
    out.reserve(text.size() + text.size() / 4);
    std::size_t added = 0;

    std::size_t pos = 0;
    while (pos < text.size()) {
        std::uint32_t len = 0;
        const std::uint32_t cp = decodeUtf8Codepoint(text, pos, len);
        if (classifier.classify(cp) != target) {
            out.append(text.substr(pos, len));
            pos += len;
            continue;
        }

        // A run spans target-script characters and the markers between them
        std::size_t scan = pos;
        std::size_t runEnd = pos;
        bool hinted = false;
        while (scan < text.size()) {
            std::uint32_t l = 0;
            const std::uint32_t c = decodeUtf8Codepoint(text, scan, l);
            if (classifier.classify(c) == target) {
                scan += l;
                runEnd = scan;
            } else if (c == kBoundaryMarker) {
                scan += l;
                hinted = true;
            } else {
                break;
            }
        }

        const std::string_view run = text.substr(pos, runEnd - pos);
        if (hinted && containsMarker(run)) {
            out.append(run);
        } else {
            added += appendHintedRun(run, out);
        }
        pos = runEnd;
    }

    if (insertedMarkers) {
        *insertedMarkers = added;
    }
    return out;
}

std::size_t BoundaryHinter::appendHintedRun(std::string_view run, std::string& out) const {
    std::vector<std::string> tokens;
    if (!tokenizer_->tokenize(run, config_.tokenizerEngine, tokens) || tokens.empty()) {
        REFLOW_LOG_DEBUG("tokenizer failed on %zu-byte run", run.size());
        out.append(run);
        return 0;
    }

    // Tokens must be non-empty and rebuild the run exactly
    std::size_t offset = 0;
    for (const std::string& token : tokens) {
        if (token.empty() || run.compare(offset, token.size(), token) != 0) {
            REFLOW_LOG_WARN("tokenizer output does not reconstruct its input; run left unhinted");
            out.append(run);
            return 0;
        }
        offset += token.size();
    }
    if (offset != run.size()) {
        REFLOW_LOG_WARN("tokenizer output does not reconstruct its input; run left unhinted");
        out.append(run);
        return 0;
    }

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) {
            out.append(kBoundaryMarkerUtf8, kBoundaryMarkerBytes);
        }
        out.append(tokens[i]);
    }
    return tokens.size() - 1;
}

} // namespace reflow::text
