#ifndef REFLOW_TEXT_FONT_CACHE_H
#define REFLOW_TEXT_FONT_CACHE_H

#include "reflow/text/text_types.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Forward declarations for FreeType/HarfBuzz types
typedef struct FT_LibraryRec_* FT_Library;
typedef struct FT_FaceRec_* FT_Face;
typedef struct hb_font_t hb_font_t;

namespace reflow::text {

// A font face loaded at one point size
struct FontHandle {
    std::string path;
    float fontSize = 0.0f;
    FT_Face ftFace = nullptr;
    hb_font_t* hbFont = nullptr;
    std::shared_ptr<const std::vector<std::uint8_t>> fontData;  // Must outlive ftFace
};

/**
 * FontCache: (font path, point size) -> loaded FreeType face + HarfBuzz font.
 *
 * Responsibilities:
 * - Own the FreeType library instance
 * - Read each font file once and share its bytes between sizes
 * - Construct each (path, size) entry at most once, failures included
 *
 * Lookups may come from several threads; a single mutex guards the maps
 * and construction happens under it. Entries live until shutdown().
 */
class FontCache {
public:
    FontCache();
    ~FontCache();

    // Non-copyable
    FontCache(const FontCache&) = delete;
    FontCache& operator=(const FontCache&) = delete;

    /**
     * Initialize FreeType library.
     * @return True if initialization succeeded
     */
    bool initialize();

    /**
     * Release all fonts and the FreeType library.
     */
    void shutdown();

    bool isInitialized() const { return ftLibrary_ != nullptr; }

    /**
     * Look up or construct the font for (path, size).
     * @param path Font file path
     * @param fontSize Point size (HarfBuzz scale is fontSize * 64)
     * @return Font handle, or nullptr if the font could not be loaded.
     *         A failed key is remembered and not retried.
     */
    const FontHandle* acquire(const std::string& path, float fontSize);

    std::size_t entryCount() const;

    // Number of (path, size) constructions attempted so far
    std::size_t constructionCount() const;

private:
    struct Key {
        std::string path;
        float fontSize;

        bool operator==(const Key& o) const { return fontSize == o.fontSize && path == o.path; }
    };

    struct KeyHash {
        std::size_t operator()(const Key& key) const;
    };

    mutable std::mutex mutex_;
    FT_Library ftLibrary_ = nullptr;

    // nullptr value marks a key whose construction failed
    std::unordered_map<Key, std::unique_ptr<FontHandle>, KeyHash> fonts_;
    std::unordered_map<std::string, std::shared_ptr<const std::vector<std::uint8_t>>> fileData_;
    std::size_t constructions_ = 0;

    std::shared_ptr<const std::vector<std::uint8_t>> loadFileData(const std::string& path);

    std::unique_ptr<FontHandle> createFontHandle(
        const std::string& path,
        float fontSize,
        std::shared_ptr<const std::vector<std::uint8_t>> data
    );

    static void destroyFontHandle(FontHandle& handle);
};

} // namespace reflow::text

#endif // REFLOW_TEXT_FONT_CACHE_H
