#include <retext/glyph-width-preserver.h>
#include <retext/config.h>
#include "utf8.h"

#include <ytrace/ytrace.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace retext {

namespace {

bool isWhitespace(uint32_t cp) {
    return cp == ' ' || cp == '\t' || cp == '\n' || cp == '\r' || cp == '\f' || cp == '\v';
}

std::string rightTrim(std::string text) {
    while (!text.empty() && isWhitespace(static_cast<unsigned char>(text.back()))) {
        text.pop_back();
    }
    return text;
}

// Drop the last codepoint
std::string dropLast(const std::string& text) {
    size_t n = utf8::length(text);
    if (n == 0) return {};
    return std::string(utf8::prefix(text, n - 1));
}

} // namespace

const char* toString(FitStrategy strategy) {
    switch (strategy) {
        case FitStrategy::Exact:         return "EXACT";
        case FitStrategy::Compress:      return "COMPRESS";
        case FitStrategy::Expand:        return "EXPAND";
        case FitStrategy::Truncate:      return "TRUNCATE";
        case FitStrategy::Ellipsis:      return "ELLIPSIS";
        case FitStrategy::Scale:         return "SCALE";
        case FitStrategy::AllowOverflow: return "ALLOW_OVERFLOW";
    }
    return "EXACT";
}

const char* toString(FitResult result) {
    switch (result) {
        case FitResult::Success:    return "SUCCESS";
        case FitResult::Compressed: return "COMPRESSED";
        case FitResult::Expanded:   return "EXPANDED";
        case FitResult::Truncated:  return "TRUNCATED";
        case FitResult::Scaled:     return "SCALED";
        case FitResult::Overflow:   return "OVERFLOW";
        case FitResult::Failed:     return "FAILED";
    }
    return "FAILED";
}

const char* toString(AdjustmentType type) {
    switch (type) {
        case AdjustmentType::None:            return "NONE";
        case AdjustmentType::Tracking:        return "TRACKING";
        case AdjustmentType::Kerning:         return "KERNING";
        case AdjustmentType::WordSpacing:     return "WORD_SPACING";
        case AdjustmentType::HorizontalScale: return "HORIZONTAL_SCALE";
        case AdjustmentType::Combined:        return "COMBINED";
    }
    return "NONE";
}

std::optional<FitStrategy> parseFitStrategy(std::string_view name) {
    std::string key;
    for (char c : name) {
        key += (c == '_') ? '-' : static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (key == "exact") return FitStrategy::Exact;
    if (key == "compress") return FitStrategy::Compress;
    if (key == "expand") return FitStrategy::Expand;
    if (key == "truncate") return FitStrategy::Truncate;
    if (key == "ellipsis") return FitStrategy::Ellipsis;
    if (key == "scale") return FitStrategy::Scale;
    if (key == "allow-overflow") return FitStrategy::AllowOverflow;
    return std::nullopt;
}

//=============================================================================
// Value types
//=============================================================================

size_t TextWidthInfo::spaceCount() const {
    return static_cast<size_t>(std::count_if(glyphs.begin(), glyphs.end(),
                                             [](const GlyphWidth& g) { return g.isSpace; }));
}

double TextWidthInfo::nonSpaceWidth() const {
    double sum = 0.0;
    for (const auto& g : glyphs) {
        if (!g.isSpace) sum += g.widthPoints;
    }
    return sum;
}

double TextWidthInfo::spaceWidth() const {
    double sum = 0.0;
    for (const auto& g : glyphs) {
        if (g.isSpace) sum += g.widthPoints;
    }
    return sum;
}

double TextWidthInfo::averageCharWidth() const {
    return glyphs.empty() ? 0.0 : totalWidthPoints / static_cast<double>(glyphs.size());
}

bool SpacingAdjustment::hasAdjustment() const {
    return tracking != 0.0 || wordSpacing != 0.0 || horizontalScale != 100.0 || !kerningPairs.empty();
}

std::vector<std::string> SpacingAdjustment::toPdfOperators() const {
    std::vector<std::string> ops;
    if (tracking != 0.0) ops.push_back(fmt::format("{:.4f} Tc", tracking));
    if (wordSpacing != 0.0) ops.push_back(fmt::format("{:.4f} Tw", wordSpacing));
    if (horizontalScale != 100.0) ops.push_back(fmt::format("{:.4f} Tz", horizontalScale));
    return ops;
}

bool FitAnalysis::fitsExactly() const {
    return std::abs(finalWidth - targetWidth) < 0.1;
}

bool FitAnalysis::isSuccess() const {
    return result == FitResult::Success || result == FitResult::Compressed ||
           result == FitResult::Expanded || result == FitResult::Scaled;
}

std::string TjArray::toPdf() const {
    std::string out = "[";
    for (size_t i = 0; i < entries.size(); i++) {
        if (i > 0) out += ' ';
        const auto& entry = entries[i];
        if (!entry.isText) {
            out += fmt::format("{:.2f}", entry.adjustment);
            continue;
        }
        out += '(';
        for (char c : entry.text) {
            if (c == '\\' || c == '(' || c == ')') out += '\\';
            out += c;
        }
        out += ')';
    }
    out += "] TJ";
    return out;
}

PreserverConfig PreserverConfig::fromConfig(const Config& config) {
    PreserverConfig c;
    if (auto name = config.get<std::string>("preserver.default-strategy")) {
        if (auto s = parseFitStrategy(*name)) {
            c.defaultStrategy = *s;
        } else {
            ywarn("Unknown preserver.default-strategy '{}', keeping {}", *name, toString(c.defaultStrategy));
        }
    }
    c.widthTolerance = config.get<double>("preserver.width-tolerance", c.widthTolerance);
    c.ratioTolerance = config.get<double>("preserver.ratio-tolerance", c.ratioTolerance);
    c.minTracking = config.get<double>("preserver.min-tracking", c.minTracking);
    c.maxTracking = config.get<double>("preserver.max-tracking", c.maxTracking);
    c.minWordSpacing = config.get<double>("preserver.min-word-spacing", c.minWordSpacing);
    c.maxWordSpacing = config.get<double>("preserver.max-word-spacing", c.maxWordSpacing);
    c.minHorizontalScale = config.get<double>("preserver.min-horizontal-scale", c.minHorizontalScale);
    c.maxHorizontalScale = config.get<double>("preserver.max-horizontal-scale", c.maxHorizontalScale);
    c.preferWordSpacing = config.get<bool>("preserver.prefer-word-spacing", c.preferWordSpacing);
    c.useKerning = config.get<bool>("preserver.use-kerning", c.useKerning);
    c.ellipsis = config.get<std::string>("preserver.ellipsis", c.ellipsis);
    c.truncateAtWord = config.get<bool>("preserver.truncate-at-word", c.truncateAtWord);
    c.maxTjAdjustment = config.get<double>("preserver.max-tj-adjustment", c.maxTjAdjustment);
    return c;
}

//=============================================================================
// Measurement
//=============================================================================

GlyphWidthPreserver::GlyphWidthPreserver(PreserverConfig config, FontMetricsSource::Ptr metrics)
    : _config(std::move(config)), _metrics(std::move(metrics)) {}

void GlyphWidthPreserver::setMetricsSource(FontMetricsSource::Ptr metrics) {
    _metrics = std::move(metrics);
    _widthCache.clear();
}

double GlyphWidthPreserver::charWidthFontUnits(uint32_t codepoint, const std::string& fontName, int page) {
    auto& perFont = _widthCache[WidthCacheKey{fontName, page}];
    if (auto it = perFont.find(codepoint); it != perFont.end()) {
        return it->second;
    }

    double width = 0.0;
    std::optional<double> measured;
    if (_metrics) {
        measured = _metrics->charWidth(fontName, codepoint);
    }
    if (measured) {
        width = *measured;
    } else {
        width = fallbackCharWidth(fontName, codepoint);
    }
    perFont[codepoint] = width;
    return width;
}

double GlyphWidthPreserver::charWidth(uint32_t codepoint, const std::string& fontName,
                                      double fontSize, int page) {
    return charWidthFontUnits(codepoint, fontName, page) / 1000.0 * fontSize;
}

TextWidthInfo GlyphWidthPreserver::measure(const std::string& text, const std::string& fontName,
                                           double fontSize, int page) {
    TextWidthInfo info;
    info.text = text;
    info.fontName = fontName;
    info.fontSize = fontSize;

    for (uint32_t cp : utf8::codepoints(text)) {
        GlyphWidth g;
        g.codepoint = cp;
        g.widthFontUnits = charWidthFontUnits(cp, fontName, page);
        g.widthPoints = g.widthFontUnits / 1000.0 * fontSize;
        g.isSpace = isWhitespace(cp);
        info.totalWidthFontUnits += g.widthFontUnits;
        info.glyphs.push_back(g);
    }
    info.totalWidthPoints = info.totalWidthFontUnits / 1000.0 * fontSize;
    return info;
}

double GlyphWidthPreserver::textWidth(const std::string& text, const std::string& fontName,
                                      double fontSize, int page) {
    return measure(text, fontName, fontSize, page).totalWidthPoints;
}

//=============================================================================
// Fit analysis
//=============================================================================

FitAnalysis GlyphWidthPreserver::analyzeFit(const std::string& originalText, const std::string& newText,
                                            const std::string& fontName, double fontSize,
                                            std::optional<FitStrategy> strategy,
                                            std::optional<double> targetWidth, int page) {
    FitStrategy chosen = strategy.value_or(_config.defaultStrategy);

    TextWidthInfo originalInfo = measure(originalText, fontName, fontSize, page);
    TextWidthInfo newInfo = measure(newText, fontName, fontSize, page);

    FitAnalysis analysis;
    analysis.originalText = originalText;
    analysis.newText = newText;
    analysis.finalText = newText;
    analysis.originalWidth = originalInfo.totalWidthPoints;
    analysis.naturalWidth = newInfo.totalWidthPoints;
    analysis.targetWidth = targetWidth.value_or(originalInfo.totalWidthPoints);
    analysis.widthDifference = analysis.naturalWidth - analysis.targetWidth;
    analysis.widthRatio = analysis.targetWidth > 0.0 ? analysis.naturalWidth / analysis.targetWidth : 1.0;
    analysis.strategy = chosen;
    analysis.result = FitResult::Failed;

    if (std::abs(analysis.widthDifference) <= _config.widthTolerance) {
        analysis.result = FitResult::Success;
        analysis.finalWidth = analysis.naturalWidth;
        return analysis;
    }

    switch (chosen) {
        case FitStrategy::Exact:
            applyExact(analysis, newInfo);
            break;
        case FitStrategy::Compress:
            applyCompress(analysis, newInfo);
            break;
        case FitStrategy::Expand:
            applyExpand(analysis, newInfo);
            break;
        case FitStrategy::Truncate:
            applyTruncate(analysis, newInfo, fontName, fontSize, page);
            break;
        case FitStrategy::Ellipsis:
            applyEllipsis(analysis, newInfo, fontName, fontSize, page);
            break;
        case FitStrategy::Scale:
            applyScale(analysis);
            break;
        case FitStrategy::AllowOverflow:
            analysis.result = FitResult::Overflow;
            analysis.finalWidth = analysis.naturalWidth;
            analysis.overflowAmount = std::max(0.0, analysis.widthDifference);
            break;
    }

    ydebug("analyzeFit '{}' -> '{}' ({} {}pt): {} via {}, natural={:.2f} target={:.2f}",
           originalText, newText, fontName, fontSize, toString(analysis.result),
           toString(chosen), analysis.naturalWidth, analysis.targetWidth);
    return analysis;
}

void GlyphWidthPreserver::applyExact(FitAnalysis& analysis, const TextWidthInfo& info) {
    const double diff = analysis.widthDifference;
    const size_t chars = info.charCount();
    const size_t spaces = info.spaceCount();
    const size_t nonSpaces = chars - spaces;
    const FitResult fitted = diff > 0.0 ? FitResult::Compressed : FitResult::Expanded;

    auto inRange = [](double v, double lo, double hi) { return v >= lo && v <= hi; };

    SpacingAdjustment adj;
    adj.totalAdjustment = -diff;

    if (_config.preferWordSpacing && spaces > 0) {
        double ws = -diff / static_cast<double>(spaces);
        if (inRange(ws, _config.minWordSpacing, _config.maxWordSpacing)) {
            adj.type = AdjustmentType::WordSpacing;
            adj.wordSpacing = ws;
            adj.adjustmentPerSpace = ws;
            analysis.adjustment = adj;
            analysis.result = fitted;
            analysis.finalWidth = analysis.targetWidth;
            return;
        }
    }

    if (nonSpaces > 1) {
        double tr = -diff / static_cast<double>(chars - 1);
        if (inRange(tr, _config.minTracking, _config.maxTracking)) {
            adj.type = AdjustmentType::Tracking;
            adj.tracking = tr;
            adj.adjustmentPerChar = tr;
            analysis.adjustment = adj;
            analysis.result = fitted;
            analysis.finalWidth = analysis.targetWidth;
            return;
        }
    }

    if (spaces > 0 && nonSpaces > 1) {
        // 60% to the word gaps, 40% spread over every gap
        double ws = -diff * 0.6 / static_cast<double>(spaces);
        double tr = -diff * 0.4 / static_cast<double>(chars - 1);
        if (inRange(ws, _config.minWordSpacing, _config.maxWordSpacing) &&
            inRange(tr, _config.minTracking, _config.maxTracking)) {
            adj.type = AdjustmentType::Combined;
            adj.wordSpacing = ws;
            adj.tracking = tr;
            adj.adjustmentPerSpace = ws;
            adj.adjustmentPerChar = tr;
            analysis.adjustment = adj;
            analysis.result = fitted;
            analysis.finalWidth = analysis.targetWidth;
            return;
        }
    }

    applyScale(analysis);
}

void GlyphWidthPreserver::applyCompress(FitAnalysis& analysis, const TextWidthInfo& info) {
    if (analysis.widthDifference > 0.0) {
        applyExact(analysis, info);
        return;
    }
    analysis.result = FitResult::Success;
    analysis.finalWidth = analysis.naturalWidth;
}

void GlyphWidthPreserver::applyExpand(FitAnalysis& analysis, const TextWidthInfo& info) {
    if (analysis.widthDifference < 0.0) {
        applyExact(analysis, info);
        return;
    }
    analysis.result = FitResult::Success;
    analysis.finalWidth = analysis.naturalWidth;
}

std::string GlyphWidthPreserver::truncateToWidth(std::string text, double limit,
                                                 const std::string& fontName, double fontSize, int page) {
    while (!text.empty() && textWidth(text, fontName, fontSize, page) > limit) {
        size_t lastSpace = text.rfind(' ');
        if (_config.truncateAtWord && lastSpace != std::string::npos && lastSpace > 0) {
            text.resize(lastSpace);
        } else {
            text = dropLast(text);
        }
    }
    return text;
}

void GlyphWidthPreserver::applyTruncate(FitAnalysis& analysis, const TextWidthInfo& info,
                                        const std::string& fontName, double fontSize, int page) {
    if (analysis.widthDifference <= _config.widthTolerance) {
        analysis.result = FitResult::Success;
        analysis.finalWidth = info.totalWidthPoints;
        return;
    }

    analysis.finalText = truncateToWidth(analysis.newText, analysis.targetWidth, fontName, fontSize, page);
    analysis.finalWidth = textWidth(analysis.finalText, fontName, fontSize, page);
    analysis.result = FitResult::Truncated;
}

void GlyphWidthPreserver::applyEllipsis(FitAnalysis& analysis, const TextWidthInfo& info,
                                        const std::string& fontName, double fontSize, int page) {
    if (analysis.widthDifference <= _config.widthTolerance) {
        analysis.result = FitResult::Success;
        analysis.finalWidth = info.totalWidthPoints;
        return;
    }

    const std::string& ellipsis = _config.ellipsis;
    double available = analysis.targetWidth - textWidth(ellipsis, fontName, fontSize, page);

    if (available <= 0.0) {
        // Not even the terminator fits: keep its first character
        analysis.finalText = std::string(utf8::prefix(ellipsis, 1));
    } else {
        std::string kept = truncateToWidth(analysis.newText, available, fontName, fontSize, page);
        analysis.finalText = rightTrim(std::move(kept)) + ellipsis;
    }
    analysis.finalWidth = textWidth(analysis.finalText, fontName, fontSize, page);
    analysis.result = FitResult::Truncated;
}

void GlyphWidthPreserver::applyScale(FitAnalysis& analysis) {
    if (analysis.naturalWidth <= 0.0) {
        analysis.result = FitResult::Failed;
        analysis.message = "new text has no width";
        return;
    }

    double scale = analysis.targetWidth / analysis.naturalWidth * 100.0;
    if (scale < _config.minHorizontalScale || scale > _config.maxHorizontalScale) {
        analysis.result = FitResult::Failed;
        analysis.overflowAmount = std::max(0.0, analysis.widthDifference);
        analysis.message = fmt::format("required scale {:.1f}% outside [{:.1f}, {:.1f}]",
                                       scale, _config.minHorizontalScale, _config.maxHorizontalScale);
        return;
    }

    SpacingAdjustment adj;
    adj.type = AdjustmentType::HorizontalScale;
    adj.horizontalScale = scale;
    adj.totalAdjustment = analysis.targetWidth - analysis.naturalWidth;

    analysis.adjustment = adj;
    analysis.result = FitResult::Scaled;
    analysis.finalWidth = analysis.targetWidth;
    analysis.compressionPercent = std::abs(100.0 - scale);
}

//=============================================================================
// TJ generation
//=============================================================================

TjArray GlyphWidthPreserver::createTjArray(const std::string& text, double targetWidth,
                                           const std::string& fontName, double fontSize, int page) {
    TjArray tj;
    if (text.empty()) return tj;

    TextWidthInfo info = measure(text, fontName, fontSize, page);
    double diff = info.totalWidthPoints - targetWidth;
    size_t n = info.charCount();

    if (std::abs(diff) <= _config.widthTolerance || n <= 1 || fontSize <= 0.0) {
        tj.entries.push_back({true, text, 0.0});
        return tj;
    }

    // Positive TJ numbers move the next glyph left
    double perGap = diff / static_cast<double>(n - 1) * (1000.0 / fontSize);
    perGap = std::clamp(perGap, -_config.maxTjAdjustment, _config.maxTjAdjustment);

    const auto codepoints = utf8::codepoints(text);
    for (size_t i = 0; i < codepoints.size(); i++) {
        std::string ch;
        utf8::appendCodepoint(ch, codepoints[i]);
        tj.entries.push_back({true, std::move(ch), 0.0});
        if (i + 1 < codepoints.size() && std::abs(perGap) > 0.1) {
            tj.entries.push_back({false, {}, perGap});
        }
    }
    return tj;
}

//=============================================================================
// Validation helpers
//=============================================================================

FitAnalysis GlyphWidthPreserver::validateFit(const std::string& originalText, const std::string& newText,
                                             const std::string& fontName, double fontSize, int page) {
    FitAnalysis exact = analyzeFit(originalText, newText, fontName, fontSize,
                                   FitStrategy::Exact, std::nullopt, page);
    if (exact.isSuccess()) {
        if (exact.adjustment && exact.adjustment->hasAdjustment()) {
            exact.message = fmt::format("adjustment required: {}", toString(exact.adjustment->type));
        } else {
            exact.message = "fits without adjustment";
        }
        return exact;
    }

    for (FitStrategy alt : {FitStrategy::Scale, FitStrategy::Compress}) {
        FitAnalysis analysis = analyzeFit(originalText, newText, fontName, fontSize, alt, std::nullopt, page);
        if (analysis.isSuccess()) {
            analysis.message = fmt::format("possible with strategy {}", toString(alt));
            return analysis;
        }
    }

    exact.message = fmt::format("text too long (overflows {:.2f}pt)", std::max(0.0, exact.widthDifference));
    return exact;
}

size_t GlyphWidthPreserver::maxTextLength(double targetWidth, const std::string& fontName,
                                          double fontSize, int page) {
    double avg = charWidth('x', fontName, fontSize, page);
    if (avg <= 0.0 || targetWidth <= 0.0) return 0;
    return static_cast<size_t>(std::floor(targetWidth / avg));
}

} // namespace retext
