#ifndef REFLOW_TEXT_LAYOUT_CAPABILITIES_H
#define REFLOW_TEXT_LAYOUT_CAPABILITIES_H

#include "reflow/text/font_cache.h"
#include "reflow/text/word_tokenizer.h"
#include <memory>
#include <string>

namespace reflow::text {

/**
 * LayoutCapabilities: the external engines available to layout.
 *
 * Created once at process start and passed to every layout call. Whether
 * FreeType or the tokenizer is missing is decided here, logged once, and
 * reported through null accessors afterwards.
 */
class LayoutCapabilities {
public:
    /**
     * Probe FreeType and ICU.
     * @param tokenizerLocale Locale for the word tokenizer
     */
    static std::unique_ptr<LayoutCapabilities> create(const std::string& tokenizerLocale = "th");

    /**
     * Use the given engines; either may be null.
     */
    LayoutCapabilities(std::unique_ptr<FontCache> fontCache, std::unique_ptr<WordTokenizer> tokenizer);
    ~LayoutCapabilities();

    // Non-copyable
    LayoutCapabilities(const LayoutCapabilities&) = delete;
    LayoutCapabilities& operator=(const LayoutCapabilities&) = delete;

    /**
     * @return Font cache, or nullptr if FreeType could not be initialized
     */
    FontCache* fontCache() const { return fontCache_.get(); }

    /**
     * @return Tokenizer, or nullptr if none is available
     */
    const WordTokenizer* tokenizer() const { return tokenizer_.get(); }

private:
    std::unique_ptr<FontCache> fontCache_;
    std::unique_ptr<WordTokenizer> tokenizer_;
};

} // namespace reflow::text

#endif // REFLOW_TEXT_LAYOUT_CAPABILITIES_H
