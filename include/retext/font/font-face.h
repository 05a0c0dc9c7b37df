#pragma once

#include <retext/font-metrics.h>
#include <retext/result.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace retext::font {

/// FontFace - a TTF/OTF program loaded through FreeType, used for metrics only.
class FontFace {
public:
    using Ptr = std::shared_ptr<FontFace>;

    virtual ~FontFace() = default;

    static Result<Ptr> create(const std::string& path);
    static Result<Ptr> create(const uint8_t* data, size_t size, const std::string& name);

    virtual const std::string& name() const = 0;
    virtual int unitsPerEm() const = 0;

    /// Unscaled advance in 1/1000 em; nullopt when the face has no glyph
    virtual std::optional<double> advance(uint32_t codepoint) = 0;

protected:
    FontFace() = default;
};

/// FontMetricsSource backed by registered faces. Subset prefixes
/// ("ABCDEF+Name") are ignored when looking a font up.
class FaceMetricsSource : public FontMetricsSource {
public:
    using Ptr = std::shared_ptr<FaceMetricsSource>;

    void addFace(const std::string& fontName, FontFace::Ptr face);
    Result<void> addFile(const std::string& fontName, const std::string& path);

    std::optional<double> charWidth(const std::string& fontName, uint32_t codepoint) override;
    bool hasFont(const std::string& fontName) const override;

    size_t faceCount() const { return _faces.size(); }

private:
    const FontFace::Ptr* find(const std::string& fontName) const;

    std::map<std::string, FontFace::Ptr> _faces;
};

} // namespace retext::font
