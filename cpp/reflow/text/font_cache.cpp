#include "reflow/text/font_cache.h"

#include "reflow/core/logging.h"
#include "reflow/core/string_utils.h"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <hb.h>
#include <hb-ft.h>

#include <fstream>

namespace reflow::text {

std::size_t FontCache::KeyHash::operator()(const Key& key) const {
    std::uint64_t h = kDigestOffset;
    h = hashBytes(h, reinterpret_cast<const std::uint8_t*>(key.path.data()), key.path.size());
    h = hashF32(h, key.fontSize);
    return static_cast<std::size_t>(h);
}

FontCache::FontCache() = default;

FontCache::~FontCache() {
    shutdown();
}

bool FontCache::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ftLibrary_) {
        return true;
    }

    FT_Error error = FT_Init_FreeType(&ftLibrary_);
    if (error) {
        ftLibrary_ = nullptr;
        return false;
    }
    return true;
}

void FontCache::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ftLibrary_) {
        return;
    }

    for (auto& [key, handle] : fonts_) {
        if (handle) {
            destroyFontHandle(*handle);
        }
    }
    fonts_.clear();
    fileData_.clear();

    FT_Done_FreeType(ftLibrary_);
    ftLibrary_ = nullptr;
}

const FontHandle* FontCache::acquire(const std::string& path, float fontSize) {
    if (path.empty() || !(fontSize > 0.0f)) {
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!ftLibrary_) {
        return nullptr;
    }

    Key key{path, fontSize};
    auto it = fonts_.find(key);
    if (it != fonts_.end()) {
        return it->second.get();
    }

    ++constructions_;
    std::unique_ptr<FontHandle> handle;
    auto data = loadFileData(path);
    if (data) {
        handle = createFontHandle(path, fontSize, std::move(data));
    }
    if (!handle) {
        REFLOW_LOG_WARN("failed to load font %s at %.2fpt", path.c_str(), static_cast<double>(fontSize));
    }

    const FontHandle* result = handle.get();
    fonts_.emplace(std::move(key), std::move(handle));
    return result;
}

std::size_t FontCache::entryCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fonts_.size();
}

std::size_t FontCache::constructionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return constructions_;
}

std::shared_ptr<const std::vector<std::uint8_t>> FontCache::loadFileData(const std::string& path) {
    auto it = fileData_.find(path);
    if (it != fileData_.end()) {
        return it->second;
    }

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return nullptr;
    }

    std::streamsize size = file.tellg();
    if (size <= 0) {
        return nullptr;
    }
    file.seekg(0, std::ios::beg);

    auto buffer = std::make_shared<std::vector<std::uint8_t>>(static_cast<std::size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer->data()), size)) {
        return nullptr;
    }

    fileData_[path] = buffer;
    return buffer;
}

std::unique_ptr<FontHandle> FontCache::createFontHandle(
    const std::string& path,
    float fontSize,
    std::shared_ptr<const std::vector<std::uint8_t>> data
) {
    FT_Face face = nullptr;
    FT_Error error = FT_New_Memory_Face(
        ftLibrary_,
        data->data(),
        static_cast<FT_Long>(data->size()),
        0,  // face index
        &face
    );
    if (error || !face) {
        return nullptr;
    }

    // Set char size (fontSize in 26.6 fixed point, 72 DPI)
    error = FT_Set_Char_Size(face, 0, static_cast<FT_F26Dot6>(fontSize * 64), 72, 72);
    if (error) {
        FT_Done_Face(face);
        return nullptr;
    }

    auto handle = std::make_unique<FontHandle>();
    handle->path = path;
    handle->fontSize = fontSize;
    handle->ftFace = face;
    handle->fontData = std::move(data);

    handle->hbFont = hb_ft_font_create(face, nullptr);
    if (!handle->hbFont) {
        FT_Done_Face(face);
        return nullptr;
    }

    // Positions come back in 26.6 units of the point size
    hb_font_set_scale(
        handle->hbFont,
        static_cast<int>(fontSize * 64),
        static_cast<int>(fontSize * 64)
    );

    return handle;
}

void FontCache::destroyFontHandle(FontHandle& handle) {
    if (handle.hbFont) {
        hb_font_destroy(handle.hbFont);
        handle.hbFont = nullptr;
    }
    if (handle.ftFace) {
        FT_Done_Face(handle.ftFace);
        handle.ftFace = nullptr;
    }
}

} // namespace reflow::text
