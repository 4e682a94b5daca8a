#ifndef REFLOW_TEXT_SHAPING_CONFIG_H
#define REFLOW_TEXT_SHAPING_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace reflow::text {

// Boundary-detection algorithm used by the word tokenizer
enum class TokenizerEngine : std::uint8_t {
    Dictionary = 0,   // Dictionary-based word segmentation
    LineBreak  = 1,   // Line-break opportunities (UAX #14 with dictionary)
};

/**
 * Parse a tokenizer engine name ("dictionary", "line", or the legacy
 * aliases "newmm" / "mm").
 * @return True if the name was recognized
 */
bool parseTokenizerEngine(std::string_view name, TokenizerEngine& out);

const char* tokenizerEngineName(TokenizerEngine engine);

/**
 * ShapingConfiguration: options controlling shaping and wrapping.
 *
 * Defaults apply for every absent key. Values are layered:
 * defaults < configuration file < environment.
 */
struct ShapingConfiguration {
    bool shapingEnabled = true;
    std::optional<std::string> fontPath;
    bool wordWrapEnabled = true;
    float minLineUsageFraction = 0.3f;
    TokenizerEngine tokenizerEngine = TokenizerEngine::Dictionary;

    // Degraded advance per character, as a fraction of the point size
    float fallbackAdvanceEm = 0.6f;

    // Per-language overrides keyed by lowercase primary language subtag
    std::map<std::string, float> lineHeightOverrides;
    std::map<std::string, float> fontScaleOverrides;

    /**
     * Line height multiplier for a language tag.
     */
    float lineHeightFor(std::string_view languageTag) const;

    /**
     * Font size scale for a language tag.
     */
    float fontScaleFor(std::string_view languageTag) const;
};

/**
 * Apply one key/value pair.
 * @return False if the key is unknown or the value is invalid; the
 *         configuration is left unchanged in that case
 */
bool applyConfigValue(ShapingConfiguration& config, std::string_view key, std::string_view value);

/**
 * Parse "key = value" lines. '#' and ';' start comments, "[section]"
 * headers are accepted and ignored. Bad lines are skipped with a warning.
 * @return Number of keys applied
 */
std::size_t parseConfiguration(std::string_view content, ShapingConfiguration& config);

/**
 * Load and parse a configuration file.
 * @return False if the file could not be read
 */
bool loadConfigurationFile(const std::string& path, ShapingConfiguration& config);

/**
 * Apply environment variable overrides (TEXT_SHAPING_ENABLED,
 * NOTO_FONT_PATH, THAI_WORD_WRAP_ENABLED, THAI_MIN_LINE_USAGE,
 * THAI_TOKENIZER_ENGINE, and LANG_LINEHEIGHT_<TAG> / LANG_FONTSIZE_SCALE_<TAG>
 * for any tag; "ZH_HANT" names "zh-hant").
 * @return Number of variables applied
 */
std::size_t applyEnvironmentOverrides(ShapingConfiguration& config);

/**
 * Normalize a BCP 47 tag to its lowercase primary subtag ("th-TH" -> "th").
 * Chinese keeps its script/region ("zh-cn", "zh-tw").
 */
std::string normalizeLanguageTag(std::string_view tag);

} // namespace reflow::text

#endif // REFLOW_TEXT_SHAPING_CONFIG_H
