#pragma once

#include <retext/document.h>
#include <retext/glyph-width-preserver.h>
#include <retext/overlay.h>
#include <retext/result.hpp>
#include <retext/z-order-manager.h>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace retext {

class Config;

struct RewriterConfig {
    OverlayStrategy defaultStrategy = OverlayStrategy::RedactThenInsert;
    RewriteMode defaultMode = RewriteMode::PreservePosition;

    bool autoAdjustTracking = true;
    bool autoAdjustSize = true;

    double minTrackingDelta = -2.0;
    double maxTrackingDelta = 2.0;
    double minSizeFactor = 0.7;
    double maxSizeFactor = 1.3;
    double minScaleX = 0.75;
    double maxScaleX = 1.25;

    double redactMargin = 1.0;  // points around the original bbox

    static RewriterConfig fromConfig(const Config& config);
};

struct RewriteRequest {
    int page = 0;
    std::string originalText;
    Rect originalBbox;
    std::string newText;
    std::string fontName = "Helvetica";
    double fontSize = 12.0;
    Color color = Color::black();
    std::optional<OverlayStrategy> strategy;
    std::optional<RewriteMode> mode;
    std::string originalFont;           // defaults to fontName
    double originalSize = 0.0;          // defaults to fontSize
    std::optional<std::string> spanId;
    Point positionOffset;
};

struct RewriterStatistics {
    size_t totalOverlays = 0;
    size_t applied = 0;
    size_t pending = 0;
    size_t committed = 0;
    std::map<OverlayStrategy, size_t> byStrategy;
    size_t totalLayers = 0;
    size_t pagesAffected = 0;
};

//=============================================================================
// SafeTextRewriter
//
// Stages text replacements as overlay layers instead of editing content
// streams. Layers are registered with the ZOrderManager so that the erase
// layer of an overlay always sits below its text.
//=============================================================================
class SafeTextRewriter {
public:
    explicit SafeTextRewriter(RewriterConfig config = {},
                              std::shared_ptr<ZOrderManager> zorder = nullptr,
                              std::shared_ptr<GlyphWidthPreserver> preserver = nullptr);

    const RewriterConfig& config() const { return _config; }
    ZOrderManager& zorder() { return *_zorder; }
    const ZOrderManager& zorder() const { return *_zorder; }
    GlyphWidthPreserver& preserver() { return *_preserver; }

    Result<TextOverlayInfo> prepareRewrite(const RewriteRequest& request);

    // Renders the layers bottom to top and marks the overlay applied
    RewriteResult applyOverlay(const std::string& overlayId, PageSurface& surface);

    RewriteResult rewriteText(const RewriteRequest& request, PageSurface& surface);

    // One-way; the overlay can no longer be removed afterwards
    bool commitOverlay(const std::string& overlayId);
    bool removeOverlay(const std::string& overlayId);

    const TextOverlayInfo* overlay(const std::string& overlayId) const;
    std::vector<TextOverlayInfo> pageOverlays(int page) const;

    RewriterStatistics statistics() const;

    static OverlayStrategy recommendStrategy(int lengthDelta, bool fontChanged, bool hasSignatures);

private:
    Result<void> createLayers(TextOverlayInfo& info);
    Result<OverlayLayer> registerLayer(const TextOverlayInfo& info, OverlayType type,
                                       const Rect& bbox);
    void adjustToFit(TextOverlayInfo& info);
    Point textOrigin(const TextOverlayInfo& info) const;
    Result<void> renderLayer(const OverlayLayer& layer, PageSurface& surface, RewriteResult& result);

    RewriterConfig _config;
    std::shared_ptr<ZOrderManager> _zorder;
    std::shared_ptr<GlyphWidthPreserver> _preserver;

    std::map<std::string, TextOverlayInfo> _overlays;
    std::map<int, std::vector<std::string>> _pageOverlays;
    uint64_t _nextOverlayId = 1;
};

} // namespace retext
