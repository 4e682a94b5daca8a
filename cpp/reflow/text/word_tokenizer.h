#ifndef REFLOW_TEXT_WORD_TOKENIZER_H
#define REFLOW_TEXT_WORD_TOKENIZER_H

#include "reflow/text/shaping_config.h"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace reflow::text {

/**
 * WordTokenizer: word segmentation for scripts written without spaces.
 *
 * Implementations must be safe to call from several threads at once.
 */
class WordTokenizer {
public:
    virtual ~WordTokenizer() = default;

    /**
     * Split UTF-8 text into words.
     * @param text Text to segment (a single-script run)
     * @param engine Segmentation algorithm variant
     * @param outTokens Receives non-empty tokens whose concatenation is text
     * @return False if segmentation is unavailable or failed
     */
    virtual bool tokenize(
        std::string_view text,
        TokenizerEngine engine,
        std::vector<std::string>& outTokens
    ) const = 0;
};

/**
 * IcuWordTokenizer: segmentation with ICU break iterators.
 *
 * Dictionary uses the word iterator, LineBreak the line iterator; both
 * consult ICU's dictionaries for Thai, Lao, Khmer and Myanmar. The
 * prototype iterators are created once and cloned per call.
 */
class IcuWordTokenizer final : public WordTokenizer {
public:
    ~IcuWordTokenizer() override;

    /**
     * Create the tokenizer.
     * @return nullptr if ICU could not create its break iterators
     */
    static std::unique_ptr<IcuWordTokenizer> create(const std::string& locale = "th");

    bool tokenize(
        std::string_view text,
        TokenizerEngine engine,
        std::vector<std::string>& outTokens
    ) const override;

private:
    struct Impl;

    explicit IcuWordTokenizer(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

} // namespace reflow::text

#endif // REFLOW_TEXT_WORD_TOKENIZER_H
