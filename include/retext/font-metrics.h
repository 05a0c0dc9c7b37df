#pragma once

#include <compare>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace retext {

/// FontMetricsSource - glyph advances for a named font.
/// Widths are in font units (1/1000 em). A source that does not know a font
/// or a glyph answers std::nullopt and the caller falls back.
class FontMetricsSource {
public:
    using Ptr = std::shared_ptr<FontMetricsSource>;

    virtual ~FontMetricsSource() = default;

    virtual std::optional<double> charWidth(const std::string& fontName, uint32_t codepoint) = 0;
    virtual bool hasFont(const std::string& fontName) const = 0;
};

//=============================================================================
// Fallback metrics
//
// Approximate widths for the three standard families. Good enough to keep a
// replacement inside its footprint, not a substitute for real font metrics.
//=============================================================================
enum class FallbackFamily {
    Helvetica,
    Times,
    Courier,
};

/// "courier"/"mono" -> Courier, "times"/"serif" -> Times, else Helvetica
FallbackFamily fallbackFamily(const std::string& fontName);

double fallbackCharWidth(FallbackFamily family, uint32_t codepoint);
double fallbackCharWidth(const std::string& fontName, uint32_t codepoint);

/// Source that always answers from the fallback tables.
class FallbackMetricsSource : public FontMetricsSource {
public:
    std::optional<double> charWidth(const std::string& fontName, uint32_t codepoint) override {
        return fallbackCharWidth(fontName, codepoint);
    }
    bool hasFont(const std::string&) const override { return true; }
};

/// Width cache key. Embedded fonts are per page, so the page is part of it.
struct WidthCacheKey {
    std::string fontName;
    int page = 0;

    auto operator<=>(const WidthCacheKey&) const = default;
};

} // namespace retext
