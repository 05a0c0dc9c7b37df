#pragma once

#include <retext/font-metrics.h>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace retext {

class Config;

enum class FitStrategy {
    Exact,          // absorb the difference in spacing, fall back to scale
    Compress,       // only act when the new text is wider
    Expand,         // only act when the new text is narrower
    Truncate,
    Ellipsis,
    Scale,          // horizontal scale (Tz)
    AllowOverflow,
};

enum class FitResult {
    Success,
    Compressed,
    Expanded,
    Truncated,
    Scaled,
    Overflow,
    Failed,
};

enum class AdjustmentType {
    None,
    Tracking,
    Kerning,
    WordSpacing,
    HorizontalScale,
    Combined,
};

const char* toString(FitStrategy strategy);
const char* toString(FitResult result);
const char* toString(AdjustmentType type);

// "exact", "ellipsis", "allow-overflow", ... (case-insensitive, '_' == '-')
std::optional<FitStrategy> parseFitStrategy(std::string_view name);

//=============================================================================
// Measurements
//=============================================================================
struct GlyphWidth {
    uint32_t codepoint = 0;
    double widthFontUnits = 0.0;  // 1/1000 em
    double widthPoints = 0.0;
    bool isSpace = false;
};

struct TextWidthInfo {
    std::string text;
    std::string fontName;
    double fontSize = 0.0;
    double totalWidthPoints = 0.0;
    double totalWidthFontUnits = 0.0;
    std::vector<GlyphWidth> glyphs;

    size_t charCount() const { return glyphs.size(); }
    size_t spaceCount() const;
    double nonSpaceWidth() const;
    double spaceWidth() const;
    double averageCharWidth() const;
};

//=============================================================================
// SpacingAdjustment - text-state deltas that absorb a width difference
//=============================================================================
struct SpacingAdjustment {
    AdjustmentType type = AdjustmentType::None;

    double tracking = 0.0;          // Tc, points
    double wordSpacing = 0.0;       // Tw, points
    double horizontalScale = 100.0; // Tz, percent
    std::vector<std::pair<size_t, double>> kerningPairs;  // (gap index, 1/1000 em)

    double totalAdjustment = 0.0;
    double adjustmentPerChar = 0.0;
    double adjustmentPerSpace = 0.0;

    bool hasAdjustment() const;

    // "0.1234 Tc", "-1.5000 Tw", "92.0000 Tz" for the non-neutral fields
    std::vector<std::string> toPdfOperators() const;
};

//=============================================================================
// FitAnalysis - outcome of fitting new text into an original footprint
//=============================================================================
struct FitAnalysis {
    std::string originalText;
    std::string newText;

    double originalWidth = 0.0;
    double naturalWidth = 0.0;      // new text, no adjustment
    double targetWidth = 0.0;
    double widthDifference = 0.0;   // natural - target
    double widthRatio = 1.0;        // natural / target

    FitStrategy strategy = FitStrategy::Exact;
    FitResult result = FitResult::Failed;
    std::optional<SpacingAdjustment> adjustment;

    std::string finalText;
    double finalWidth = 0.0;

    double overflowAmount = 0.0;
    double compressionPercent = 0.0;
    std::string message;

    bool fitsExactly() const;
    bool isSuccess() const;
};

//=============================================================================
// TjArray - [(a) -12.00 (b)] TJ
//=============================================================================
struct TjEntry {
    bool isText = true;
    std::string text;
    double adjustment = 0.0;  // 1/1000 em, negative moves right
};

struct TjArray {
    std::vector<TjEntry> entries;

    bool empty() const { return entries.empty(); }
    std::string toPdf() const;
};

//=============================================================================
// PreserverConfig
//=============================================================================
struct PreserverConfig {
    FitStrategy defaultStrategy = FitStrategy::Exact;

    double widthTolerance = 0.5;    // points
    double ratioTolerance = 0.01;

    double minTracking = -3.0;
    double maxTracking = 5.0;
    double minWordSpacing = -5.0;
    double maxWordSpacing = 10.0;
    double minHorizontalScale = 50.0;
    double maxHorizontalScale = 150.0;

    bool preferWordSpacing = true;
    bool useKerning = true;

    std::string ellipsis = "...";
    bool truncateAtWord = true;

    double maxTjAdjustment = 200.0;

    static PreserverConfig fromConfig(const Config& config);
};

//=============================================================================
// GlyphWidthPreserver
//
// Measures text through a FontMetricsSource (fallback tables when absent or
// silent) and picks spacing/scale adjustments that keep a replacement inside
// the width of the text it replaces.
//=============================================================================
class GlyphWidthPreserver {
public:
    explicit GlyphWidthPreserver(PreserverConfig config = {},
                                 FontMetricsSource::Ptr metrics = nullptr);

    const PreserverConfig& config() const { return _config; }

    // Swapping the metrics source invalidates the width cache
    void setMetricsSource(FontMetricsSource::Ptr metrics);
    void clearCache() { _widthCache.clear(); }

    double charWidthFontUnits(uint32_t codepoint, const std::string& fontName, int page = 0);
    double charWidth(uint32_t codepoint, const std::string& fontName, double fontSize, int page = 0);

    TextWidthInfo measure(const std::string& text, const std::string& fontName,
                          double fontSize, int page = 0);
    double textWidth(const std::string& text, const std::string& fontName,
                     double fontSize, int page = 0);

    FitAnalysis analyzeFit(const std::string& originalText, const std::string& newText,
                           const std::string& fontName, double fontSize,
                           std::optional<FitStrategy> strategy = std::nullopt,
                           std::optional<double> targetWidth = std::nullopt,
                           int page = 0);

    TjArray createTjArray(const std::string& text, double targetWidth,
                          const std::string& fontName, double fontSize, int page = 0);

    // EXACT, then SCALE, then COMPRESS; the first success wins
    FitAnalysis validateFit(const std::string& originalText, const std::string& newText,
                            const std::string& fontName, double fontSize, int page = 0);

    // Estimate from the width of 'x'
    size_t maxTextLength(double targetWidth, const std::string& fontName,
                         double fontSize, int page = 0);

private:
    void applyExact(FitAnalysis& analysis, const TextWidthInfo& info);
    void applyCompress(FitAnalysis& analysis, const TextWidthInfo& info);
    void applyExpand(FitAnalysis& analysis, const TextWidthInfo& info);
    void applyTruncate(FitAnalysis& analysis, const TextWidthInfo& info,
                       const std::string& fontName, double fontSize, int page);
    void applyEllipsis(FitAnalysis& analysis, const TextWidthInfo& info,
                       const std::string& fontName, double fontSize, int page);
    void applyScale(FitAnalysis& analysis);

    // Drop trailing words (or chars) until `text` fits `limit`
    std::string truncateToWidth(std::string text, double limit,
                                const std::string& fontName, double fontSize, int page);

    PreserverConfig _config;
    FontMetricsSource::Ptr _metrics;
    std::map<WidthCacheKey, std::map<uint32_t, double>> _widthCache;
};

} // namespace retext
