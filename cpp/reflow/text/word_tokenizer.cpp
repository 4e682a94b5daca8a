#include "reflow/text/word_tokenizer.h"

#include "reflow/core/logging.h"

#include <unicode/brkiter.h>
#include <unicode/locid.h>
#include <unicode/utext.h>

#include <utility>

namespace reflow::text {

struct IcuWordTokenizer::Impl {
    std::unique_ptr<icu::BreakIterator> wordPrototype;
    std::unique_ptr<icu::BreakIterator> linePrototype;
};

IcuWordTokenizer::IcuWordTokenizer(std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {}

IcuWordTokenizer::~IcuWordTokenizer() = default;

std::unique_ptr<IcuWordTokenizer> IcuWordTokenizer::create(const std::string& locale) {
    icu::Locale icuLocale(locale.c_str());

    auto impl = std::make_unique<Impl>();

    UErrorCode err = U_ZERO_ERROR;
    impl->wordPrototype.reset(icu::BreakIterator::createWordInstance(icuLocale, err));
    if (U_FAILURE(err) || !impl->wordPrototype) {
        REFLOW_LOG_WARN("ICU word break iterator unavailable: %s", u_errorName(err));
        return nullptr;
    }

    err = U_ZERO_ERROR;
    impl->linePrototype.reset(icu::BreakIterator::createLineInstance(icuLocale, err));
    if (U_FAILURE(err) || !impl->linePrototype) {
        REFLOW_LOG_WARN("ICU line break iterator unavailable: %s", u_errorName(err));
        return nullptr;
    }

    return std::unique_ptr<IcuWordTokenizer>(new IcuWordTokenizer(std::move(impl)));
}

bool IcuWordTokenizer::tokenize(
    std::string_view text,
    TokenizerEngine engine,
    std::vector<std::string>& outTokens
) const {
    outTokens.clear();
    if (text.empty()) {
        return true;
    }

    const icu::BreakIterator& prototype = (engine == TokenizerEngine::LineBreak)
        ? *impl_->linePrototype
        : *impl_->wordPrototype;

    // Iterators carry position state; each call works on its own clone
    std::unique_ptr<icu::BreakIterator> iter(prototype.clone());
    if (!iter) {
        return false;
    }

    UErrorCode err = U_ZERO_ERROR;
    UText uText = UTEXT_INITIALIZER;
    utext_openUTF8(&uText, text.data(), static_cast<int64_t>(text.size()), &err);
    if (U_FAILURE(err)) {
        return false;
    }

    iter->setText(&uText, err);
    if (U_FAILURE(err)) {
        utext_close(&uText);
        return false;
    }

    // UTF-8 UText reports native (byte) indices
    std::int32_t prev = iter->first();
    for (std::int32_t pos = iter->next(); pos != icu::BreakIterator::DONE; pos = iter->next()) {
        if (pos <= prev) {
            break;
        }
        outTokens.emplace_back(text.substr(static_cast<std::size_t>(prev), static_cast<std::size_t>(pos - prev)));
        prev = pos;
    }

    iter.reset();
    utext_close(&uText);

    if (static_cast<std::size_t>(prev) != text.size()) {
        outTokens.clear();
        return false;
    }
    return true;
}

} // namespace reflow::text
