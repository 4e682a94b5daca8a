#include "reflow/text/shaping_config.h"

#include "reflow/core/logging.h"
#include "reflow/core/string_utils.h"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <sstream>

#include <unistd.h>

namespace reflow::text {

namespace {

struct LanguageDefault {
    const char* tag;
    float value;
};

// Line height multipliers by target language
constexpr LanguageDefault kLineHeightDefaults[] = {
    {"zh-cn", 1.4f}, {"zh-tw", 1.4f}, {"zh-hans", 1.4f}, {"zh-hant", 1.4f}, {"zh", 1.4f},
    {"ja", 1.1f}, {"ko", 1.2f}, {"en", 1.2f}, {"ar", 1.0f},
    {"ru", 0.8f}, {"uk", 0.8f}, {"ta", 0.8f},
    {"th", 1.5f},
};
constexpr float kDefaultLineHeight = 1.1f;

// Font size scale by target language
constexpr LanguageDefault kFontScaleDefaults[] = {
    {"th", 0.7f},
};
constexpr float kDefaultFontScale = 1.0f;

bool parseBool(std::string_view value, bool& out) {
    const std::string v = toLowerAscii(trimAscii(value));
    if (v == "true" || v == "yes" || v == "on" || v == "1") {
        out = true;
        return true;
    }
    if (v == "false" || v == "no" || v == "off" || v == "0") {
        out = false;
        return true;
    }
    return false;
}

bool parseFloat(std::string_view value, float& out) {
    const std::string v(trimAscii(value));
    if (v.empty()) {
        return false;
    }
    char* end = nullptr;
    const float f = std::strtof(v.c_str(), &end);
    if (end != v.c_str() + v.size() || !std::isfinite(f)) {
        return false;
    }
    out = f;
    return true;
}

std::string primarySubtag(const std::string& normalized) {
    const std::size_t dash = normalized.find('-');
    return dash == std::string::npos ? normalized : normalized.substr(0, dash);
}

float lookupLanguageValue(
    const std::map<std::string, float>& overrides,
    const LanguageDefault* table,
    std::size_t tableSize,
    float fallback,
    std::string_view languageTag
) {
    const std::string tag = normalizeLanguageTag(languageTag);
    const std::string primary = primarySubtag(tag);

    for (const std::string* key : {&tag, &primary}) {
        auto it = overrides.find(*key);
        if (it != overrides.end()) {
            return it->second;
        }
    }
    for (const std::string* key : {&tag, &primary}) {
        for (std::size_t i = 0; i < tableSize; ++i) {
            if (*key == table[i].tag) {
                return table[i].value;
            }
        }
    }
    return fallback;
}

// "ZH_HANT" -> "zh-hant"
std::string tagFromEnvSuffix(std::string_view suffix) {
    std::string tag = toLowerAscii(suffix);
    for (char& c : tag) {
        if (c == '_') {
            c = '-';
        }
    }
    return tag;
}

} // namespace

// =============================================================================
// Tokenizer engine names
// =============================================================================

bool parseTokenizerEngine(std::string_view name, TokenizerEngine& out) {
    const std::string v = toLowerAscii(trimAscii(name));
    if (v == "dictionary" || v == "newmm" || v == "word") {
        out = TokenizerEngine::Dictionary;
        return true;
    }
    if (v == "line" || v == "mm") {
        out = TokenizerEngine::LineBreak;
        return true;
    }
    return false;
}

const char* tokenizerEngineName(TokenizerEngine engine) {
    switch (engine) {
        case TokenizerEngine::Dictionary: return "dictionary";
        case TokenizerEngine::LineBreak:  return "line";
    }
    return "dictionary";
}

// =============================================================================
// Language tables
// =============================================================================

std::string normalizeLanguageTag(std::string_view tag) {
    std::string t = toLowerAscii(trimAscii(tag));
    for (char& c : t) {
        if (c == '_') c = '-';
    }
    const std::size_t dash = t.find('-');
    if (dash == std::string::npos) {
        return t;
    }
    const std::string primary = t.substr(0, dash);
    if (primary != "zh") {
        return primary;
    }
    const std::size_t next = t.find('-', dash + 1);
    return next == std::string::npos ? t : t.substr(0, next);
}

float ShapingConfiguration::lineHeightFor(std::string_view languageTag) const {
    return lookupLanguageValue(
        lineHeightOverrides,
        kLineHeightDefaults,
        sizeof(kLineHeightDefaults) / sizeof(kLineHeightDefaults[0]),
        kDefaultLineHeight,
        languageTag
    );
}

float ShapingConfiguration::fontScaleFor(std::string_view languageTag) const {
    return lookupLanguageValue(
        fontScaleOverrides,
        kFontScaleDefaults,
        sizeof(kFontScaleDefaults) / sizeof(kFontScaleDefaults[0]),
        kDefaultFontScale,
        languageTag
    );
}

// =============================================================================
// Key/value application
// =============================================================================

bool applyConfigValue(ShapingConfiguration& config, std::string_view key, std::string_view value) {
    key = trimAscii(key);
    value = trimAscii(value);

    if (key == "shapingEnabled") {
        return parseBool(value, config.shapingEnabled);
    }
    if (key == "wordWrapEnabled") {
        return parseBool(value, config.wordWrapEnabled);
    }
    if (key == "fontPath") {
        if (value.empty()) {
            config.fontPath.reset();
        } else {
            config.fontPath = std::string(value);
        }
        return true;
    }
    if (key == "minLineUsageFraction") {
        float f = 0.0f;
        if (!parseFloat(value, f) || f < 0.0f || f > 1.0f) {
            return false;
        }
        config.minLineUsageFraction = f;
        return true;
    }
    if (key == "tokenizerEngine") {
        return parseTokenizerEngine(value, config.tokenizerEngine);
    }
    if (key == "fallbackAdvanceEm") {
        float f = 0.0f;
        if (!parseFloat(value, f) || f <= 0.0f) {
            return false;
        }
        config.fallbackAdvanceEm = f;
        return true;
    }

    constexpr std::string_view kLineHeightPrefix = "lineHeight.";
    constexpr std::string_view kFontScalePrefix = "fontScale.";
    const bool isLineHeight = key.substr(0, kLineHeightPrefix.size()) == kLineHeightPrefix;
    const bool isFontScale = key.substr(0, kFontScalePrefix.size()) == kFontScalePrefix;
    if (isLineHeight || isFontScale) {
        const std::string_view lang = key.substr(isLineHeight ? kLineHeightPrefix.size() : kFontScalePrefix.size());
        float f = 0.0f;
        if (lang.empty() || !parseFloat(value, f) || f <= 0.0f) {
            return false;
        }
        auto& table = isLineHeight ? config.lineHeightOverrides : config.fontScaleOverrides;
        table[normalizeLanguageTag(lang)] = f;
        return true;
    }

    return false;
}

std::size_t parseConfiguration(std::string_view content, ShapingConfiguration& config) {
    std::size_t applied = 0;
    std::size_t lineNo = 0;
    std::size_t pos = 0;

    while (pos <= content.size()) {
        std::size_t eol = content.find('\n', pos);
        if (eol == std::string_view::npos) eol = content.size();
        std::string_view line = trimAscii(content.substr(pos, eol - pos));
        pos = eol + 1;
        ++lineNo;

        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }
        if (line.front() == '[' && line.back() == ']') {
            continue;
        }

        const std::size_t eq = line.find('=');
        if (eq == std::string_view::npos) {
            REFLOW_LOG_WARN("config line %zu: expected key = value", lineNo);
            continue;
        }

        const std::string key(trimAscii(line.substr(0, eq)));
        const std::string value(trimAscii(line.substr(eq + 1)));
        if (applyConfigValue(config, key, value)) {
            ++applied;
        } else {
            REFLOW_LOG_WARN("config line %zu: ignoring %s = %s", lineNo, key.c_str(), value.c_str());
        }
    }

    return applied;
}

bool loadConfigurationFile(const std::string& path, ShapingConfiguration& config) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        REFLOW_LOG_DEBUG("config file %s not readable", path.c_str());
        return false;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    parseConfiguration(buffer.str(), config);
    return true;
}

std::size_t applyEnvironmentOverrides(ShapingConfiguration& config) {
    struct EnvKey {
        const char* env;
        const char* key;
    };
    constexpr EnvKey kEnvKeys[] = {
        {"TEXT_SHAPING_ENABLED", "shapingEnabled"},
        {"NOTO_FONT_PATH", "fontPath"},
        {"THAI_WORD_WRAP_ENABLED", "wordWrapEnabled"},
        {"THAI_MIN_LINE_USAGE", "minLineUsageFraction"},
        {"THAI_TOKENIZER_ENGINE", "tokenizerEngine"},
    };

    std::size_t applied = 0;
    for (const EnvKey& k : kEnvKeys) {
        const char* value = std::getenv(k.env);
        if (!value) {
            continue;
        }
        if (applyConfigValue(config, k.key, value)) {
            ++applied;
        } else {
            REFLOW_LOG_WARN("ignoring %s=%s", k.env, value);
        }
    }

    struct LanguagePrefix {
        const char* env;
        const char* key;
    };
    constexpr LanguagePrefix kLanguagePrefixes[] = {
        {"LANG_LINEHEIGHT_", "lineHeight."},
        {"LANG_FONTSIZE_SCALE_", "fontScale."},
    };

    // Any language tag may be overridden, not only those with defaults
    for (char** entry = environ; entry && *entry; ++entry) {
        const std::string_view var(*entry);
        const std::size_t eq = var.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        const std::string_view name = var.substr(0, eq);
        const std::string_view value = var.substr(eq + 1);

        for (const LanguagePrefix& p : kLanguagePrefixes) {
            const std::string_view prefix(p.env);
            if (name.size() <= prefix.size() || name.substr(0, prefix.size()) != prefix) {
                continue;
            }
            const std::string tag = tagFromEnvSuffix(name.substr(prefix.size()));
            if (applyConfigValue(config, std::string(p.key) + tag, value)) {
                ++applied;
            } else {
                REFLOW_LOG_WARN("ignoring %.*s=%.*s",
                                static_cast<int>(name.size()), name.data(),
                                static_cast<int>(value.size()), value.data());
            }
            break;
        }
    }

    return applied;
}

} // namespace reflow::text
