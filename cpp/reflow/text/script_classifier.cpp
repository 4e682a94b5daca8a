#include "reflow/text/script_classifier.h"

#include <unicode/uscript.h>

namespace reflow::text {

CodePointScript classifyCodePoint(std::uint32_t cp) {
    if (cp > 0x10FFFF) {
        return CodePointScript::Other;
    }

    UErrorCode err = U_ZERO_ERROR;
    const UScriptCode script = uscript_getScript(static_cast<UChar32>(cp), &err);
    if (U_FAILURE(err)) {
        return CodePointScript::Other;
    }

    switch (script) {
        case USCRIPT_COMMON:
        case USCRIPT_INHERITED:
            return CodePointScript::Common;
        case USCRIPT_LATIN:
            return CodePointScript::Latin;
        case USCRIPT_GREEK:
            return CodePointScript::Greek;
        case USCRIPT_CYRILLIC:
            return CodePointScript::Cyrillic;
        case USCRIPT_THAI:
            return CodePointScript::Thai;
        case USCRIPT_LAO:
            return CodePointScript::Lao;
        case USCRIPT_KHMER:
            return CodePointScript::Khmer;
        case USCRIPT_MYANMAR:
            return CodePointScript::Myanmar;
        case USCRIPT_HEBREW:
            return CodePointScript::Hebrew;

        // Joining scripts
        case USCRIPT_ARABIC:
        case USCRIPT_SYRIAC:
        case USCRIPT_NKO:
        case USCRIPT_MANDAIC:
        case USCRIPT_MONGOLIAN:
            return CodePointScript::Arabic;

        // Brahmic scripts
        case USCRIPT_DEVANAGARI:
        case USCRIPT_BENGALI:
        case USCRIPT_GURMUKHI:
        case USCRIPT_GUJARATI:
        case USCRIPT_ORIYA:
        case USCRIPT_TAMIL:
        case USCRIPT_TELUGU:
        case USCRIPT_KANNADA:
        case USCRIPT_MALAYALAM:
        case USCRIPT_SINHALA:
        case USCRIPT_TIBETAN:
        case USCRIPT_BALINESE:
        case USCRIPT_JAVANESE:
            return CodePointScript::Indic;

        case USCRIPT_HAN:
        case USCRIPT_HIRAGANA:
        case USCRIPT_KATAKANA:
        case USCRIPT_KATAKANA_OR_HIRAGANA:
        case USCRIPT_HANGUL:
        case USCRIPT_BOPOMOFO:
        case USCRIPT_YI:
            return CodePointScript::CJK;

        default:
            // Unassigned, private use, and scripts without special handling
            return CodePointScript::Other;
    }
}

bool requiresComplexShaping(CodePointScript script) {
    switch (script) {
        case CodePointScript::Thai:
        case CodePointScript::Lao:
        case CodePointScript::Khmer:
        case CodePointScript::Myanmar:
        case CodePointScript::Arabic:
        case CodePointScript::Hebrew:
        case CodePointScript::Indic:
            return true;
        default:
            return false;
    }
}

bool hasInterWordSpacing(CodePointScript script) {
    switch (script) {
        case CodePointScript::Thai:
        case CodePointScript::Lao:
        case CodePointScript::Khmer:
        case CodePointScript::Myanmar:
        case CodePointScript::CJK:
            return false;
        default:
            return true;
    }
}

const char* scriptName(CodePointScript script) {
    switch (script) {
        case CodePointScript::Latin:   return "Latin";
        case CodePointScript::Greek:   return "Greek";
        case CodePointScript::Cyrillic: return "Cyrillic";
        case CodePointScript::Thai:    return "Thai";
        case CodePointScript::Lao:     return "Lao";
        case CodePointScript::Khmer:   return "Khmer";
        case CodePointScript::Myanmar: return "Myanmar";
        case CodePointScript::Arabic:  return "Arabic";
        case CodePointScript::Hebrew:  return "Hebrew";
        case CodePointScript::Indic:   return "Indic";
        case CodePointScript::CJK:     return "CJK";
        case CodePointScript::Common:  return "Common";
        case CodePointScript::Other:   return "Other";
    }
    return "Other";
}

// =============================================================================
// ScriptClassifier
// =============================================================================

ScriptClassifier::ScriptClassifier() {
    for (std::uint32_t cp = 0; cp < 128; ++cp) {
        ascii_[cp] = classifyCodePoint(cp);
    }
}

CodePointScript ScriptClassifier::classify(std::uint32_t cp) {
    if (cp < 128) {
        return ascii_[cp];
    }
    auto it = cache_.find(cp);
    if (it != cache_.end()) {
        return it->second;
    }
    CodePointScript script = classifyCodePoint(cp);
    cache_.emplace(cp, script);
    return script;
}

} // namespace reflow::text
