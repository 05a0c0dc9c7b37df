#pragma once

#include <retext/document.h>
#include <retext/geometry.h>
#include <retext/glyph-width-preserver.h>
#include <retext/z-order-manager.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace retext {

enum class OverlayStrategy {
    RedactThenInsert,   // redact the original, insert above
    WhiteBackground,    // paint an opaque rectangle, insert above
    TransparentErase,   // clear without fill, insert above
    DirectOverlay,      // insert above, original stays visible
    ContentStreamEdit,  // rewrite the stream itself; not composed here
};

enum class RewriteMode {
    PreservePosition,
    PreserveBaseline,
    AdjustToFit,
    CenterInBbox,
};

enum class OverlayType {
    Text,
    Background,
    Redaction,
    Shape,
    Image,
};

enum class RewriteStatus {
    Success,
    PartialSuccess,
    Failed,
    Skipped,
};

enum class OverlayState {
    Prepared,
    Applied,
    Committed,
};

const char* toString(OverlayStrategy strategy);
const char* toString(RewriteMode mode);
const char* toString(OverlayType type);
const char* toString(RewriteStatus status);
const char* toString(OverlayState state);

// "redact-then-insert", "white_background", ... (case-insensitive)
std::optional<OverlayStrategy> parseOverlayStrategy(std::string_view name);
std::optional<RewriteMode> parseRewriteMode(std::string_view name);

inline bool isSafe(OverlayStrategy s) { return s != OverlayStrategy::ContentStreamEdit; }
inline bool preservesOriginal(OverlayStrategy s) { return s == OverlayStrategy::DirectOverlay; }
inline bool isSuccess(RewriteStatus s) { return s != RewriteStatus::Failed; }

LayerLevel levelForOverlayType(OverlayType type);

//=============================================================================
// OverlayLayer - one render instruction
//=============================================================================
struct OverlayLayer {
    std::string id;         // same id as in the ZOrderManager
    OverlayType type = OverlayType::Text;
    int zOrder = 0;
    Rect bbox;
    Point origin;

    std::string content;
    std::string fontName = "Helvetica";
    double fontSize = 12.0;
    Color color = Color::black();
    TextSpacing spacing;

    std::optional<Color> fillColor;
    double fillOpacity = 1.0;
    std::optional<Color> strokeColor;
    double strokeWidth = 0.0;

    Timestamp createdAt;
    std::optional<std::string> sourceSpanId;
};

//=============================================================================
// TextOverlayInfo - every layer of one replace-text request
//=============================================================================
struct TextOverlayInfo {
    std::string id;
    int page = 0;
    OverlayStrategy strategy = OverlayStrategy::RedactThenInsert;
    RewriteMode mode = RewriteMode::PreservePosition;

    std::string originalText;
    Rect originalBbox;
    std::string originalFont;
    double originalSize = 0.0;
    std::optional<std::string> originalSpanId;

    std::string newText;
    std::string newFont;
    double newSize = 0.0;
    Color newColor = Color::black();

    // Adjustments picked in AdjustToFit mode
    double charSpacingDelta = 0.0;
    double wordSpacingDelta = 0.0;
    double scaleFactor = 1.0;
    Point positionOffset;
    std::optional<FitAnalysis> fit;

    std::vector<OverlayLayer> layers;

    Timestamp createdAt;
    OverlayState state = OverlayState::Prepared;

    bool applied() const { return state != OverlayState::Prepared; }
    bool committed() const { return state == OverlayState::Committed; }
    bool pendingWrite() const { return state == OverlayState::Applied; }

    bool hasFontChange() const { return newFont != originalFont; }
    bool hasSizeChange() const;
    bool hasTextChange() const { return newText != originalText; }
};

struct RewriteResult {
    RewriteStatus status = RewriteStatus::Success;
    std::optional<TextOverlayInfo> overlay;
    std::string message;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;

    double originalWidth = 0.0;
    double newWidth = 0.0;
    double widthDifference = 0.0;

    bool success() const { return isSuccess(status); }
    bool hasWarnings() const { return !warnings.empty(); }

    void addWarning(std::string warning);
    void addError(std::string error);
};

} // namespace retext
