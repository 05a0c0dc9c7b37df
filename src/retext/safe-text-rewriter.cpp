#include <retext/safe-text-rewriter.h>
#include <retext/config.h>
#include "utf8.h"

#include <ytrace/ytrace.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace retext {

RewriterConfig RewriterConfig::fromConfig(const Config& config) {
    RewriterConfig c;
    if (auto name = config.get<std::string>("rewriter.default-strategy")) {
        if (auto s = parseOverlayStrategy(*name)) c.defaultStrategy = *s;
        else ywarn("Unknown rewriter.default-strategy '{}'", *name);
    }
    if (auto name = config.get<std::string>("rewriter.default-mode")) {
        if (auto m = parseRewriteMode(*name)) c.defaultMode = *m;
        else ywarn("Unknown rewriter.default-mode '{}'", *name);
    }
    c.autoAdjustTracking = config.get<bool>("rewriter.auto-adjust-tracking", c.autoAdjustTracking);
    c.autoAdjustSize = config.get<bool>("rewriter.auto-adjust-size", c.autoAdjustSize);
    c.minTrackingDelta = config.get<double>("rewriter.min-tracking-delta", c.minTrackingDelta);
    c.maxTrackingDelta = config.get<double>("rewriter.max-tracking-delta", c.maxTrackingDelta);
    c.minSizeFactor = config.get<double>("rewriter.min-size-factor", c.minSizeFactor);
    c.maxSizeFactor = config.get<double>("rewriter.max-size-factor", c.maxSizeFactor);
    c.minScaleX = config.get<double>("rewriter.min-scale-x", c.minScaleX);
    c.maxScaleX = config.get<double>("rewriter.max-scale-x", c.maxScaleX);
    c.redactMargin = config.get<double>("rewriter.redact-margin", c.redactMargin);
    return c;
}

//=============================================================================
// SafeTextRewriter
//=============================================================================

SafeTextRewriter::SafeTextRewriter(RewriterConfig config, std::shared_ptr<ZOrderManager> zorder,
                                   std::shared_ptr<GlyphWidthPreserver> preserver)
    : _config(std::move(config)),
      _zorder(zorder ? std::move(zorder) : std::make_shared<ZOrderManager>()),
      _preserver(preserver ? std::move(preserver) : std::make_shared<GlyphWidthPreserver>()) {}

Result<TextOverlayInfo> SafeTextRewriter::prepareRewrite(const RewriteRequest& request) {
    OverlayStrategy strategy = request.strategy.value_or(_config.defaultStrategy);
    if (!isSafe(strategy)) {
        return Err<TextOverlayInfo>(fmt::format("strategy {} is not supported by the overlay rewriter",
                                                toString(strategy)));
    }

    TextOverlayInfo info;
    info.id = fmt::format("overlay-{}", _nextOverlayId++);
    info.page = request.page;
    info.strategy = strategy;
    info.mode = request.mode.value_or(_config.defaultMode);
    info.originalText = request.originalText;
    info.originalBbox = request.originalBbox;
    info.originalFont = request.originalFont.empty() ? request.fontName : request.originalFont;
    info.originalSize = request.originalSize > 0.0 ? request.originalSize : request.fontSize;
    info.originalSpanId = request.spanId;
    info.newText = request.newText;
    info.newFont = request.fontName;
    info.newSize = request.fontSize;
    info.newColor = request.color;
    info.positionOffset = request.positionOffset;
    info.createdAt = std::chrono::system_clock::now();

    if (auto res = createLayers(info); !res) {
        // Roll back whatever made it into the manager
        for (const auto& layer : info.layers) {
            _zorder->removeLayer(layer.id);
        }
        return Err<TextOverlayInfo>("prepareRewrite failed", res);
    }

    ydebug("prepareRewrite {} page={} strategy={} mode={} layers={}", info.id, info.page,
           toString(info.strategy), toString(info.mode), info.layers.size());

    _pageOverlays[info.page].push_back(info.id);
    auto [it, inserted] = _overlays.emplace(info.id, std::move(info));
    return Ok(it->second);
}

Result<OverlayLayer> SafeTextRewriter::registerLayer(const TextOverlayInfo& info, OverlayType type,
                                                     const Rect& bbox) {
    auto registered = _zorder->addLayer(info.page, bbox, levelForOverlayType(type),
                                        fmt::format("{}:{}", info.id, toString(type)),
                                        toString(type), info.id);
    if (!registered) {
        return Err<OverlayLayer>("cannot register layer", registered);
    }

    OverlayLayer layer;
    layer.id = registered->id;
    layer.type = type;
    layer.zOrder = registered->zOrder;
    layer.bbox = bbox;
    layer.createdAt = registered->createdAt;
    layer.sourceSpanId = info.originalSpanId;
    return Ok(std::move(layer));
}

Result<void> SafeTextRewriter::createLayers(TextOverlayInfo& info) {
    const Rect erased = info.originalBbox.expanded(_config.redactMargin);

    switch (info.strategy) {
        case OverlayStrategy::RedactThenInsert: {
            auto layer = registerLayer(info, OverlayType::Redaction, erased);
            if (!layer) return Err("redaction layer", layer);
            layer->fillColor = Color::white();
            info.layers.push_back(std::move(*layer));
            break;
        }
        case OverlayStrategy::WhiteBackground: {
            auto layer = registerLayer(info, OverlayType::Background, erased);
            if (!layer) return Err("background layer", layer);
            layer->fillColor = Color::white();
            layer->fillOpacity = 1.0;
            info.layers.push_back(std::move(*layer));
            break;
        }
        case OverlayStrategy::TransparentErase: {
            auto layer = registerLayer(info, OverlayType::Redaction, erased);
            if (!layer) return Err("erase layer", layer);
            layer->fillColor.reset();
            layer->fillOpacity = 0.0;
            info.layers.push_back(std::move(*layer));
            break;
        }
        case OverlayStrategy::DirectOverlay:
            break;
        case OverlayStrategy::ContentStreamEdit:
            return Err("content stream editing is not an overlay strategy");
    }

    if (info.mode == RewriteMode::AdjustToFit) {
        adjustToFit(info);
    }

    auto text = registerLayer(info, OverlayType::Text, info.originalBbox);
    if (!text) return Err("text layer", text);
    text->origin = textOrigin(info);
    text->content = info.newText;
    text->fontName = info.newFont;
    text->fontSize = info.newSize;
    text->color = info.newColor;
    text->spacing.charSpacing = info.charSpacingDelta;
    text->spacing.wordSpacing = info.wordSpacingDelta;
    text->spacing.horizontalScale = info.scaleFactor * 100.0;
    info.layers.push_back(std::move(*text));
    return Ok();
}

void SafeTextRewriter::adjustToFit(TextOverlayInfo& info) {
    FitAnalysis fit = _preserver->analyzeFit(info.originalText, info.newText, info.newFont, info.newSize,
                                             FitStrategy::Exact, info.originalBbox.width(), info.page);

    if (fit.result == FitResult::Scaled && fit.adjustment) {
        info.scaleFactor = std::clamp(fit.adjustment->horizontalScale / 100.0,
                                      _config.minScaleX, _config.maxScaleX);
    } else if (fit.isSuccess() && fit.adjustment && _config.autoAdjustTracking) {
        info.charSpacingDelta = std::clamp(fit.adjustment->tracking,
                                           _config.minTrackingDelta, _config.maxTrackingDelta);
        info.wordSpacingDelta = fit.adjustment->wordSpacing;
    } else if (fit.result == FitResult::Failed && _config.autoAdjustSize && fit.naturalWidth > 0.0) {
        double factor = std::clamp(fit.targetWidth / fit.naturalWidth,
                                   _config.minSizeFactor, _config.maxSizeFactor);
        ydebug("adjustToFit {}: no spacing fit, font size {} x {:.3f}", info.id, info.newSize, factor);
        info.newSize *= factor;
    }

    info.fit = std::move(fit);
}

Point SafeTextRewriter::textOrigin(const TextOverlayInfo& info) const {
    const Rect& bbox = info.originalBbox;
    const Point& offset = info.positionOffset;

    switch (info.mode) {
        case RewriteMode::CenterInBbox: {
            Point c = bbox.center();
            return {c.x + offset.x, c.y + offset.y};
        }
        case RewriteMode::PreservePosition:
        case RewriteMode::PreserveBaseline:
        case RewriteMode::AdjustToFit:
            break;
    }
    // Baseline anchor at the bottom-left of the span
    return {bbox.x0 + offset.x, bbox.y1 + offset.y};
}

Result<void> SafeTextRewriter::renderLayer(const OverlayLayer& layer, PageSurface& surface,
                                           RewriteResult& result) {
    switch (layer.type) {
        case OverlayType::Redaction:
            return surface.addRedaction(layer.bbox, layer.fillColor);

        case OverlayType::Background:
        case OverlayType::Shape:
            return surface.drawRect(layer.bbox, layer.strokeColor, layer.fillColor,
                                    layer.fillOpacity, layer.strokeWidth);

        case OverlayType::Text: {
            auto rc = surface.insertText(layer.origin, layer.content, layer.fontName,
                                         layer.fontSize, layer.color, layer.spacing);
            if (!rc) return Err("insertText", rc);
            if (*rc < 0) {
                result.addWarning(fmt::format("insertText returned {} for '{}...'", *rc,
                                              utf8::prefix(layer.content, 20)));
            }
            return Ok();
        }

        case OverlayType::Image:
            result.addWarning(fmt::format("layer {}: image layers are not rendered", layer.id));
            return Ok();
    }
    return Ok();
}

RewriteResult SafeTextRewriter::applyOverlay(const std::string& overlayId, PageSurface& surface) {
    RewriteResult result;

    auto it = _overlays.find(overlayId);
    if (it == _overlays.end()) {
        result.addError(fmt::format("unknown overlay {}", overlayId));
        return result;
    }
    TextOverlayInfo& info = it->second;
    if (info.committed()) {
        result.addError(fmt::format("overlay {} is already committed", overlayId));
        result.overlay = info;
        return result;
    }

    // Refresh z from the manager; the stack may have been reordered since prepare
    std::vector<OverlayLayer*> ordered;
    for (const auto& stacked : _zorder->pageLayers(info.page)) {
        for (auto& layer : info.layers) {
            if (layer.id == stacked.id) {
                layer.zOrder = stacked.zOrder;
                ordered.push_back(&layer);
            }
        }
    }
    for (auto& layer : info.layers) {
        if (std::find(ordered.begin(), ordered.end(), &layer) == ordered.end()) {
            ywarn("applyOverlay {}: layer {} is no longer tracked", overlayId, layer.id);
            ordered.push_back(&layer);
        }
    }

    for (const OverlayLayer* layer : ordered) {
        if (auto res = renderLayer(*layer, surface, result); !res) {
            yerror("applyOverlay {}: {}", overlayId, error_msg(res));
            result.addError(fmt::format("error applying layer {}: {}", layer->id, error_msg(res)));
            result.overlay = info;
            return result;
        }
    }

    info.state = OverlayState::Applied;
    result.originalWidth = _preserver->textWidth(info.originalText, info.originalFont,
                                                 info.originalSize, info.page);
    result.newWidth = _preserver->textWidth(info.newText, info.newFont, info.newSize, info.page);
    result.widthDifference = result.newWidth - result.originalWidth;
    result.message = fmt::format("overlay applied ({} layers)", info.layers.size());
    result.overlay = info;
    return result;
}

RewriteResult SafeTextRewriter::rewriteText(const RewriteRequest& request, PageSurface& surface) {
    auto prepared = prepareRewrite(request);
    if (!prepared) {
        RewriteResult result;
        result.addError(error_msg(prepared));
        return result;
    }
    return applyOverlay(prepared->id, surface);
}

bool SafeTextRewriter::commitOverlay(const std::string& overlayId) {
    auto it = _overlays.find(overlayId);
    if (it == _overlays.end()) return false;
    if (it->second.state != OverlayState::Applied) {
        ydebug("commitOverlay {}: state is {}", overlayId, toString(it->second.state));
        return false;
    }
    it->second.state = OverlayState::Committed;
    return true;
}

bool SafeTextRewriter::removeOverlay(const std::string& overlayId) {
    auto it = _overlays.find(overlayId);
    if (it == _overlays.end()) return false;
    if (it->second.committed()) {
        ywarn("removeOverlay {}: committed overlays are permanent", overlayId);
        return false;
    }

    for (const auto& layer : it->second.layers) {
        _zorder->setLocked(layer.id, false);
        _zorder->removeLayer(layer.id);
    }

    auto pit = _pageOverlays.find(it->second.page);
    if (pit != _pageOverlays.end()) {
        auto& ids = pit->second;
        ids.erase(std::remove(ids.begin(), ids.end(), overlayId), ids.end());
        if (ids.empty()) _pageOverlays.erase(pit);
    }
    _overlays.erase(it);
    return true;
}

const TextOverlayInfo* SafeTextRewriter::overlay(const std::string& overlayId) const {
    auto it = _overlays.find(overlayId);
    return it != _overlays.end() ? &it->second : nullptr;
}

std::vector<TextOverlayInfo> SafeTextRewriter::pageOverlays(int page) const {
    std::vector<TextOverlayInfo> out;
    auto it = _pageOverlays.find(page);
    if (it == _pageOverlays.end()) return out;
    for (const auto& id : it->second) {
        if (auto* info = overlay(id)) out.push_back(*info);
    }
    return out;
}

RewriterStatistics SafeTextRewriter::statistics() const {
    RewriterStatistics stats;
    stats.totalOverlays = _overlays.size();
    for (const auto& [id, info] : _overlays) {
        switch (info.state) {
            case OverlayState::Prepared:  stats.pending++; break;
            case OverlayState::Applied:   stats.applied++; break;
            case OverlayState::Committed: stats.committed++; break;
        }
        stats.byStrategy[info.strategy]++;
        stats.totalLayers += info.layers.size();
    }
    stats.pagesAffected = _pageOverlays.size();
    return stats;
}

OverlayStrategy SafeTextRewriter::recommendStrategy(int lengthDelta, bool fontChanged, bool hasSignatures) {
    if (hasSignatures) {
        // Anything else would invalidate the signed byte ranges
        return OverlayStrategy::DirectOverlay;
    }
    if (std::abs(lengthDelta) <= 3 && !fontChanged) {
        return OverlayStrategy::TransparentErase;
    }
    if (lengthDelta > 10) {
        return OverlayStrategy::WhiteBackground;
    }
    return OverlayStrategy::RedactThenInsert;
}

} // namespace retext
