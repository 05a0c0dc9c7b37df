#include <retext/font/font-face.h>

#include <ytrace/ytrace.hpp>

#include <ft2build.h>
#include FT_FREETYPE_H

#include <fstream>
#include <iterator>
#include <unordered_map>
#include <vector>

namespace retext::font {

namespace {

// FT_Library handles are not thread-safe; each thread owns one
struct ThreadLibrary {
    FT_Library lib = nullptr;
    FT_Error error = 0;

    ThreadLibrary() {
        error = FT_Init_FreeType(&lib);
        if (error) lib = nullptr;
    }
    ~ThreadLibrary() {
        if (lib) FT_Done_FreeType(lib);
    }
};

Result<FT_Library> threadLibrary() {
    thread_local ThreadLibrary library;
    if (!library.lib) {
        return Err<FT_Library>("FT_Init_FreeType failed with error " + std::to_string(library.error));
    }
    return Ok(library.lib);
}

} // namespace

class FontFaceImpl : public FontFace {
public:
    FontFaceImpl(std::vector<uint8_t> data, std::string name)
        : _data(std::move(data)), _name(std::move(name)) {}

    ~FontFaceImpl() override {
        if (_face) FT_Done_Face(_face);
    }

    Result<void> init() {
        auto lib = threadLibrary();
        if (!lib) {
            return Err("FontFace: FreeType is not available", lib);
        }
        FT_Error err = FT_New_Memory_Face(*lib, _data.data(), static_cast<FT_Long>(_data.size()),
                                          0, &_face);
        if (err) {
            return Err("FontFace: FreeType error " + std::to_string(err));
        }
        if (_face->units_per_EM == 0) {
            return Err("FontFace: " + _name + " is not scalable");
        }
        return Ok();
    }

    const std::string& name() const override { return _name; }
    int unitsPerEm() const override { return _face->units_per_EM; }

    std::optional<double> advance(uint32_t codepoint) override {
        auto it = _advanceCache.find(codepoint);
        if (it != _advanceCache.end()) return it->second;

        std::optional<double> width;
        FT_UInt glyphIndex = FT_Get_Char_Index(_face, codepoint);
        if (glyphIndex != 0 &&
            FT_Load_Glyph(_face, glyphIndex, FT_LOAD_NO_SCALE | FT_LOAD_NO_BITMAP | FT_LOAD_NO_HINTING) == 0) {
            // advance.x is in font units with NO_SCALE
            width = static_cast<double>(_face->glyph->advance.x) * 1000.0 / _face->units_per_EM;
        }
        _advanceCache[codepoint] = width;
        return width;
    }

private:
    std::vector<uint8_t> _data;
    std::string _name;
    FT_Face _face = nullptr;
    std::unordered_map<uint32_t, std::optional<double>> _advanceCache;
};

Result<FontFace::Ptr> FontFace::create(const uint8_t* data, size_t size, const std::string& name) {
    std::vector<uint8_t> fontData(data, data + size);
    auto impl = std::make_shared<FontFaceImpl>(std::move(fontData), name);
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("FontFace creation failed", res);
    }
    return Ok(Ptr(std::move(impl)));
}

Result<FontFace::Ptr> FontFace::create(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Err<Ptr>("Cannot open font file: " + path);
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (data.empty()) {
        return Err<Ptr>("Font file is empty: " + path);
    }
    return create(data.data(), data.size(), path);
}

//=============================================================================
// FaceMetricsSource
//=============================================================================

void FaceMetricsSource::addFace(const std::string& fontName, FontFace::Ptr face) {
    ydebug("FaceMetricsSource: {} -> {}", fontName, face->name());
    _faces[fontName] = std::move(face);
}

Result<void> FaceMetricsSource::addFile(const std::string& fontName, const std::string& path) {
    auto face = FontFace::create(path);
    if (!face) {
        return Err("Cannot load face for " + fontName, face);
    }
    addFace(fontName, std::move(*face));
    return Ok();
}

const FontFace::Ptr* FaceMetricsSource::find(const std::string& fontName) const {
    auto it = _faces.find(fontName);
    if (it != _faces.end()) return &it->second;

    auto plus = fontName.find('+');
    if (plus != std::string::npos) {
        it = _faces.find(fontName.substr(plus + 1));
        if (it != _faces.end()) return &it->second;
    }
    return nullptr;
}

std::optional<double> FaceMetricsSource::charWidth(const std::string& fontName, uint32_t codepoint) {
    auto* face = find(fontName);
    if (!face) return std::nullopt;
    return (*face)->advance(codepoint);
}

bool FaceMetricsSource::hasFont(const std::string& fontName) const {
    return find(fontName) != nullptr;
}

} // namespace retext::font
