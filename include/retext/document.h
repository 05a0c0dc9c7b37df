#pragma once

#include <retext/geometry.h>
#include <retext/result.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace retext {

struct FontRef {
    std::string name;       // BaseFont, may carry a subset prefix ("ABCDEF+Helvetica")
    std::string extension;  // embedded program kind ("ttf", "cff", ...), empty when not embedded
};

//=============================================================================
// Document - read access to the host's document
//
// Pages are 0-based. Every fallible call reports through Result; none throw.
//=============================================================================
class Document {
public:
    using Ptr = std::shared_ptr<Document>;

    virtual ~Document() = default;

    virtual int pageCount() const = 0;

    // Ok when the page can be reached through the page tree
    virtual Result<void> checkPage(int page) const = 0;

    virtual Result<std::vector<FontRef>> pageFonts(int page) const = 0;

    // Decoded content stream bytes
    virtual Result<std::string> pageContent(int page) const = 0;

    virtual Result<std::string> pageText(int page) const = 0;
    virtual Result<std::string> extractText(int page, const Rect& rect) const = 0;

    // Cross-reference size; object numbers run 1..objectCount()-1
    virtual int objectCount() const = 0;
    virtual Result<void> resolveObject(int number) const = 0;

    virtual bool hasSignatures() const = 0;
};

// Text-state spacing for an inserted run: Tc and Tw in points, Tz in percent
struct TextSpacing {
    double charSpacing = 0.0;
    double wordSpacing = 0.0;
    double horizontalScale = 100.0;

    bool isNeutral() const {
        return charSpacing == 0.0 && wordSpacing == 0.0 && horizontalScale == 100.0;
    }
};

//=============================================================================
// PageSurface - where overlay layers are rendered
//=============================================================================
class PageSurface {
public:
    using Ptr = std::shared_ptr<PageSurface>;

    virtual ~PageSurface() = default;

    // fill == nullopt leaves the cleared area transparent
    virtual Result<void> addRedaction(const Rect& rect, const std::optional<Color>& fill) = 0;

    virtual Result<void> drawRect(const Rect& rect, const std::optional<Color>& stroke,
                                  const std::optional<Color>& fill, double fillOpacity,
                                  double strokeWidth) = 0;

    // Returns the host's status code; negative means the text did not fit
    virtual Result<int> insertText(const Point& origin, const std::string& text,
                                   const std::string& fontName, double fontSize,
                                   const Color& color, const TextSpacing& spacing) = 0;
};

} // namespace retext
