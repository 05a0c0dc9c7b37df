#include <retext/overlay.h>

#include <cctype>
#include <cmath>

namespace retext {

namespace {

std::string normalizeName(std::string_view name) {
    std::string key;
    for (char c : name) {
        key += (c == '_') ? '-' : static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return key;
}

} // namespace

//=============================================================================
// Enums
//=============================================================================

const char* toString(OverlayStrategy strategy) {
    switch (strategy) {
        case OverlayStrategy::RedactThenInsert:  return "REDACT_THEN_INSERT";
        case OverlayStrategy::WhiteBackground:   return "WHITE_BACKGROUND";
        case OverlayStrategy::TransparentErase:  return "TRANSPARENT_ERASE";
        case OverlayStrategy::DirectOverlay:     return "DIRECT_OVERLAY";
        case OverlayStrategy::ContentStreamEdit: return "CONTENT_STREAM_EDIT";
    }
    return "REDACT_THEN_INSERT";
}

const char* toString(RewriteMode mode) {
    switch (mode) {
        case RewriteMode::PreservePosition: return "PRESERVE_POSITION";
        case RewriteMode::PreserveBaseline: return "PRESERVE_BASELINE";
        case RewriteMode::AdjustToFit:      return "ADJUST_TO_FIT";
        case RewriteMode::CenterInBbox:     return "CENTER_IN_BBOX";
    }
    return "PRESERVE_POSITION";
}

const char* toString(OverlayType type) {
    switch (type) {
        case OverlayType::Text:       return "text";
        case OverlayType::Background: return "background";
        case OverlayType::Redaction:  return "redaction";
        case OverlayType::Shape:      return "shape";
        case OverlayType::Image:      return "image";
    }
    return "text";
}

const char* toString(RewriteStatus status) {
    switch (status) {
        case RewriteStatus::Success:        return "SUCCESS";
        case RewriteStatus::PartialSuccess: return "PARTIAL_SUCCESS";
        case RewriteStatus::Failed:         return "FAILED";
        case RewriteStatus::Skipped:        return "SKIPPED";
    }
    return "FAILED";
}

const char* toString(OverlayState state) {
    switch (state) {
        case OverlayState::Prepared:  return "prepared";
        case OverlayState::Applied:   return "applied";
        case OverlayState::Committed: return "committed";
    }
    return "prepared";
}

std::optional<OverlayStrategy> parseOverlayStrategy(std::string_view name) {
    std::string key = normalizeName(name);
    if (key == "redact-then-insert") return OverlayStrategy::RedactThenInsert;
    if (key == "white-background") return OverlayStrategy::WhiteBackground;
    if (key == "transparent-erase") return OverlayStrategy::TransparentErase;
    if (key == "direct-overlay") return OverlayStrategy::DirectOverlay;
    if (key == "content-stream-edit") return OverlayStrategy::ContentStreamEdit;
    return std::nullopt;
}

std::optional<RewriteMode> parseRewriteMode(std::string_view name) {
    std::string key = normalizeName(name);
    if (key == "preserve-position") return RewriteMode::PreservePosition;
    if (key == "preserve-baseline") return RewriteMode::PreserveBaseline;
    if (key == "adjust-to-fit") return RewriteMode::AdjustToFit;
    if (key == "center-in-bbox") return RewriteMode::CenterInBbox;
    return std::nullopt;
}

LayerLevel levelForOverlayType(OverlayType type) {
    switch (type) {
        case OverlayType::Redaction:  return LayerLevel::Redaction;
        case OverlayType::Background: return LayerLevel::TextBackground;
        case OverlayType::Text:       return LayerLevel::Text;
        case OverlayType::Shape:      return LayerLevel::Fill;
        case OverlayType::Image:      return LayerLevel::Annotation;
    }
    return LayerLevel::Text;
}

bool TextOverlayInfo::hasSizeChange() const {
    return std::abs(newSize - originalSize) > 0.01;
}

void RewriteResult::addWarning(std::string warning) {
    warnings.push_back(std::move(warning));
    if (status == RewriteStatus::Success) status = RewriteStatus::PartialSuccess;
}

void RewriteResult::addError(std::string error) {
    errors.push_back(std::move(error));
    status = RewriteStatus::Failed;
}

} // namespace retext
