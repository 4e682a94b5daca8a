#include "reflow/text/run_builder.h"

#include "reflow/core/string_utils.h"
#include "reflow/text/script_classifier.h"

#include <utility>

namespace reflow::text {

namespace {

bool isPatternSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace

bool matchPlaceholder(
    std::string_view text,
    std::size_t pos,
    std::uint32_t& outId,
    std::size_t& outLength
) {
    if (pos >= text.size() || text[pos] != '{') {
        return false;
    }

    std::size_t i = pos + 1;
    while (i < text.size() && isPatternSpace(text[i])) ++i;
    if (i >= text.size() || (text[i] != 'v' && text[i] != 'V')) {
        return false;
    }
    ++i;

    std::uint64_t id = 0;
    bool sawDigit = false;
    bool sawAny = false;
    while (i < text.size() && text[i] != '}') {
        const char c = text[i];
        if (c >= '0' && c <= '9') {
            id = id * 10 + static_cast<std::uint64_t>(c - '0');
            if (id > 0xFFFFFFFFull) {
                return false;
            }
            sawDigit = true;
        } else if (!isPatternSpace(c)) {
            return false;
        }
        sawAny = true;
        ++i;
    }
    if (i >= text.size() || !sawAny || !sawDigit) {
        return false;
    }

    outId = static_cast<std::uint32_t>(id);
    outLength = i + 1 - pos;
    return true;
}

RunBuilder::RunBuilder(std::string fontPath, TextStyle style, std::vector<float> placeholderAdvances)
    : fontPath_(std::move(fontPath)),
      style_(style),
      placeholderAdvances_(std::move(placeholderAdvances)) {}

std::vector<TextRun> RunBuilder::buildRuns(std::string_view text) const {
    std::vector<TextRun> runs;
    if (text.empty()) {
        return runs;
    }

    ScriptClassifier classifier;

    // Open text run; Common until its first script-bearing character
    bool open = false;
    TextRun current;

    auto closeRun = [&](std::uint32_t end) {
        if (open && end > current.start) {
            current.end = end;
            runs.push_back(current);
        }
        open = false;
    };
    auto openRun = [&](std::uint32_t start, CodePointScript script) {
        current = TextRun{};
        current.start = start;
        current.script = script;
        current.kind = RunKind::Text;
        current.fontPath = fontPath_;
        current.style = style_;
        open = true;
    };

    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::uint32_t offset = static_cast<std::uint32_t>(pos);

        if (text[pos] == '{' && !placeholderAdvances_.empty()) {
            std::uint32_t id = 0;
            std::size_t length = 0;
            if (matchPlaceholder(text, pos, id, length) && id < placeholderAdvances_.size()) {
                closeRun(offset);

                TextRun placeholder;
                placeholder.start = offset;
                placeholder.end = static_cast<std::uint32_t>(pos + length);
                placeholder.script = CodePointScript::Common;
                placeholder.kind = RunKind::Placeholder;
                placeholder.fontPath = fontPath_;
                placeholder.style = style_;
                placeholder.placeholderId = id;
                placeholder.placeholderAdvance = placeholderAdvances_[id];
                runs.push_back(placeholder);

                pos += length;
                continue;
            }
        }

        std::uint32_t len = 0;
        const std::uint32_t cp = decodeUtf8Codepoint(text, pos, len);
        const CodePointScript script = classifier.classify(cp);

        if (!open) {
            openRun(offset, script);
        } else if (script != CodePointScript::Common && script != current.script) {
            if (current.script == CodePointScript::Common) {
                // Leading neutrals take the first real script
                current.script = script;
            } else {
                closeRun(offset);
                openRun(offset, script);
            }
        }

        pos += len;
    }

    closeRun(static_cast<std::uint32_t>(text.size()));
    return runs;
}

} // namespace reflow::text
