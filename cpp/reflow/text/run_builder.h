#ifndef REFLOW_TEXT_RUN_BUILDER_H
#define REFLOW_TEXT_RUN_BUILDER_H

#include "reflow/text/text_types.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace reflow::text {

/**
 * Match a formula placeholder "{vN}" at pos. Whitespace may follow the
 * opening brace and mix with the digits ("{ V1 2 }" is id 12).
 * @param text Buffer
 * @param pos Offset of the '{'
 * @param outId Placeholder id
 * @param outLength Byte length of the token
 * @return True if a well-formed token starts at pos
 */
bool matchPlaceholder(
    std::string_view text,
    std::size_t pos,
    std::uint32_t& outId,
    std::size_t& outLength
);

/**
 * RunBuilder: splits a paragraph buffer into runs.
 *
 * Responsibilities:
 * - Cut runs on script, font or style change
 * - Attach script-neutral characters (spaces, digits, punctuation, marks,
 *   boundary markers) to the surrounding run
 * - Emit one atomic run per placeholder whose id has a known advance
 *
 * Runs tile the buffer exactly, in order, with no gaps or overlaps.
 */
class RunBuilder {
public:
    /**
     * @param fontPath Font for every text run (empty when none is configured)
     * @param style Paragraph style
     * @param placeholderAdvances Fixed advance per placeholder id
     */
    RunBuilder(std::string fontPath, TextStyle style, std::vector<float> placeholderAdvances = {});

    std::vector<TextRun> buildRuns(std::string_view text) const;

private:
    std::string fontPath_;
    TextStyle style_;
    std::vector<float> placeholderAdvances_;
};

} // namespace reflow::text

#endif // REFLOW_TEXT_RUN_BUILDER_H
