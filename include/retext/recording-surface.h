#pragma once

#include <retext/document.h>

#include <optional>
#include <string>
#include <vector>

namespace YAML {
class Emitter;
}

namespace retext {

enum class InstructionKind {
    Redaction,
    Rect,
    Text,
};

const char* toString(InstructionKind kind);

struct RenderInstruction {
    InstructionKind kind = InstructionKind::Text;
    Rect rect;
    Point origin;

    std::string text;
    std::string fontName;
    double fontSize = 0.0;
    Color color = Color::black();
    TextSpacing spacing;

    std::optional<Color> fill;
    std::optional<Color> stroke;
    double fillOpacity = 1.0;
    double strokeWidth = 0.0;
};

//=============================================================================
// RecordingSurface - PageSurface that keeps the render instructions so the
// host can apply them later. Degenerate rectangles and unusable text
// parameters are rejected the way a real surface would reject them.
//=============================================================================
class RecordingSurface : public PageSurface {
public:
    explicit RecordingSurface(int page = 0) : _page(page) {}

    Result<void> addRedaction(const Rect& rect, const std::optional<Color>& fill) override;
    Result<void> drawRect(const Rect& rect, const std::optional<Color>& stroke,
                          const std::optional<Color>& fill, double fillOpacity,
                          double strokeWidth) override;
    Result<int> insertText(const Point& origin, const std::string& text,
                           const std::string& fontName, double fontSize,
                           const Color& color, const TextSpacing& spacing) override;

    int page() const { return _page; }
    const std::vector<RenderInstruction>& instructions() const { return _instructions; }
    void clear() { _instructions.clear(); }

    void emit(YAML::Emitter& out) const;
    std::string toYaml() const;

private:
    int _page;
    std::vector<RenderInstruction> _instructions;
};

} // namespace retext
