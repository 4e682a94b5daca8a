#ifndef REFLOW_TEXT_SCRIPT_CLASSIFIER_H
#define REFLOW_TEXT_SCRIPT_CLASSIFIER_H

#include "reflow/text/text_types.h"
#include <cstdint>
#include <unordered_map>

namespace reflow::text {

/**
 * Classify a single code point by its ICU Script property.
 * Common and Inherited map to Common. Total over all code points;
 * unassigned values and unhandled scripts map to Other.
 */
CodePointScript classifyCodePoint(std::uint32_t cp);

/**
 * True for scripts that need OpenType shaping (reordering, mark
 * positioning, contextual forms) to render correctly.
 */
bool requiresComplexShaping(CodePointScript script);

/**
 * False for scripts written without spaces between words.
 */
bool hasInterWordSpacing(CodePointScript script);

/**
 * ScriptClassifier: memoizing front end to classifyCodePoint.
 *
 * One instance per layout pass. Not thread-safe; paragraphs laid out in
 * parallel each own a classifier.
 */
class ScriptClassifier {
public:
    ScriptClassifier();

    CodePointScript classify(std::uint32_t cp);

    bool requiresComplexShaping(std::uint32_t cp) {
        return text::requiresComplexShaping(classify(cp));
    }

    std::size_t cachedEntries() const { return cache_.size(); }

private:
    CodePointScript ascii_[128];
    std::unordered_map<std::uint32_t, CodePointScript> cache_;
};

} // namespace reflow::text

#endif // REFLOW_TEXT_SCRIPT_CLASSIFIER_H
