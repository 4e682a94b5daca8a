#ifndef REFLOW_TEXT_TYPES_H
#define REFLOW_TEXT_TYPES_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace reflow::text {

// ============================================================================
// Scripts
// ============================================================================

enum class CodePointScript : std::uint8_t {
    Latin = 0,
    Greek,
    Cyrillic,
    Thai,
    Lao,
    Khmer,
    Myanmar,
    Arabic,
    Hebrew,
    Indic,
    CJK,
    Common,     // Script-neutral: digits, punctuation, spaces, marks, markers
    Other,      // Unassigned, private use, and every other script
};

const char* scriptName(CodePointScript script);

// Zero-width boundary marker (U+200B ZERO WIDTH SPACE) and its UTF-8 form
constexpr std::uint32_t kBoundaryMarker = 0x200B;
constexpr char kBoundaryMarkerUtf8[] = "\xE2\x80\x8B";
constexpr std::size_t kBoundaryMarkerBytes = 3;

// ============================================================================
// Style
// ============================================================================

// Text alignment inside the paragraph box
enum class TextAlign : std::uint8_t {
    Left   = 0,
    Center = 1,
    Right  = 2,
};

struct TextStyle {
    float fontSize = 12.0f;

    bool operator==(const TextStyle& o) const { return fontSize == o.fontSize; }
    bool operator!=(const TextStyle& o) const { return !(*this == o); }
};

// ============================================================================
// Runs and glyphs
// ============================================================================

enum class RunKind : std::uint8_t {
    Text = 0,
    Placeholder = 1,    // Atomic formula/markup span, never shaped
};

// A maximal span of the paragraph buffer sharing script, font and style
struct TextRun {
    std::uint32_t start = 0;        // UTF-8 byte offset (inclusive)
    std::uint32_t end = 0;          // UTF-8 byte offset (exclusive)
    CodePointScript script = CodePointScript::Common;
    RunKind kind = RunKind::Text;
    std::string fontPath;           // Empty when no font is configured
    TextStyle style;
    std::uint32_t placeholderId = 0;
    float placeholderAdvance = 0.0f;

    std::uint32_t length() const { return end - start; }
};

// PositionedGlyph::flags
constexpr std::uint32_t kGlyphFlagRtl = 1u << 0;
constexpr std::uint32_t kGlyphFlagPlaceholder = 1u << 1;

// Shaped glyph info (output from HarfBuzz, or the degraded model)
struct PositionedGlyph {
    std::uint32_t glyphId;      // Font glyph index; code point when degraded; placeholder id
    std::uint32_t clusterIndex; // UTF-8 byte offset in the paragraph buffer
    float xAdvance;
    float yAdvance;
    float xOffset;
    float yOffset;
    std::uint32_t flags;
};

// A glyph placed on the page
struct GlyphPlacement {
    PositionedGlyph glyph;
    float x;                    // Absolute pen x plus glyph offset
    float y;                    // Absolute baseline y plus glyph offset
};

// A composed line
struct Line {
    std::vector<GlyphPlacement> glyphs;
    float advance = 0.0f;           // Cumulative advance of the line
    std::uint32_t sourceStart = 0;  // Byte offset into the marker-free text
    std::uint32_t sourceEnd = 0;
};

// Why a run did not receive complex shaping
enum class ShapingFallback : std::uint8_t {
    None = 0,
    ShapingDisabled,
    NoFontPath,
    EngineUnavailable,
    FontLoadFailed,
    ShapingFailed,
    MalformedClusters,
};

const char* fallbackName(ShapingFallback reason);

} // namespace reflow::text

#endif // REFLOW_TEXT_TYPES_H
