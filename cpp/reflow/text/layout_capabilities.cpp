#include "reflow/text/layout_capabilities.h"

#include "reflow/core/logging.h"

#include <utility>

namespace reflow::text {

std::unique_ptr<LayoutCapabilities> LayoutCapabilities::create(const std::string& tokenizerLocale) {
    auto fontCache = std::make_unique<FontCache>();
    if (!fontCache->initialize()) {
        REFLOW_LOG_WARN("FreeType unavailable; text will use fixed-advance layout");
        fontCache.reset();
    }

    std::unique_ptr<WordTokenizer> tokenizer = IcuWordTokenizer::create(tokenizerLocale);
    if (!tokenizer) {
        REFLOW_LOG_WARN("word tokenizer unavailable; unspaced scripts will not be hinted");
    }

    return std::make_unique<LayoutCapabilities>(std::move(fontCache), std::move(tokenizer));
}

LayoutCapabilities::LayoutCapabilities(
    std::unique_ptr<FontCache> fontCache,
    std::unique_ptr<WordTokenizer> tokenizer
)
    : fontCache_(std::move(fontCache)), tokenizer_(std::move(tokenizer)) {}

LayoutCapabilities::~LayoutCapabilities() = default;

} // namespace reflow::text
