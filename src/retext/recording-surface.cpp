#include <retext/recording-surface.h>

#include <ytrace/ytrace.hpp>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

namespace retext {

namespace {

Result<void> checkRect(const Rect& rect) {
    if (!(rect.width() > 0.0) || !(rect.height() > 0.0)) {
        return Err(fmt::format("degenerate rectangle ({}, {}, {}, {})", rect.x0, rect.y0, rect.x1, rect.y1));
    }
    return Ok();
}

void emitColor(YAML::Emitter& out, const char* key, const Color& c) {
    out << YAML::Key << key << YAML::Value << YAML::Flow
        << YAML::BeginSeq << c.r << c.g << c.b << YAML::EndSeq;
}

void emitRect(YAML::Emitter& out, const Rect& r) {
    out << YAML::Key << "rect" << YAML::Value << YAML::Flow
        << YAML::BeginSeq << r.x0 << r.y0 << r.x1 << r.y1 << YAML::EndSeq;
}

} // namespace

const char* toString(InstructionKind kind) {
    switch (kind) {
        case InstructionKind::Redaction: return "redaction";
        case InstructionKind::Rect:      return "rect";
        case InstructionKind::Text:      return "text";
    }
    return "text";
}

Result<void> RecordingSurface::addRedaction(const Rect& rect, const std::optional<Color>& fill) {
    if (auto res = checkRect(rect); !res) return Err("addRedaction", res);

    RenderInstruction ins;
    ins.kind = InstructionKind::Redaction;
    ins.rect = rect;
    ins.fill = fill;
    _instructions.push_back(std::move(ins));
    return Ok();
}

Result<void> RecordingSurface::drawRect(const Rect& rect, const std::optional<Color>& stroke,
                                        const std::optional<Color>& fill, double fillOpacity,
                                        double strokeWidth) {
    if (auto res = checkRect(rect); !res) return Err("drawRect", res);
    if (fillOpacity < 0.0 || fillOpacity > 1.0) {
        return Err(fmt::format("drawRect: fill opacity {} outside [0, 1]", fillOpacity));
    }

    RenderInstruction ins;
    ins.kind = InstructionKind::Rect;
    ins.rect = rect;
    ins.stroke = stroke;
    ins.fill = fill;
    ins.fillOpacity = fillOpacity;
    ins.strokeWidth = strokeWidth;
    _instructions.push_back(std::move(ins));
    return Ok();
}

Result<int> RecordingSurface::insertText(const Point& origin, const std::string& text,
                                         const std::string& fontName, double fontSize,
                                         const Color& color, const TextSpacing& spacing) {
    if (fontName.empty()) {
        return Err<int>("insertText: no font");
    }
    if (!(fontSize > 0.0)) {
        return Err<int>(fmt::format("insertText: font size {}", fontSize));
    }

    RenderInstruction ins;
    ins.kind = InstructionKind::Text;
    ins.origin = origin;
    ins.text = text;
    ins.fontName = fontName;
    ins.fontSize = fontSize;
    ins.color = color;
    ins.spacing = spacing;
    _instructions.push_back(std::move(ins));
    ytrace("page {}: text '{}' at ({:.2f}, {:.2f})", _page, text, origin.x, origin.y);
    return Ok(0);
}

void RecordingSurface::emit(YAML::Emitter& out) const {
    out << YAML::BeginMap;
    out << YAML::Key << "page" << YAML::Value << _page;
    out << YAML::Key << "instructions" << YAML::Value << YAML::BeginSeq;
    for (const auto& ins : _instructions) {
        out << YAML::BeginMap;
        out << YAML::Key << "kind" << YAML::Value << toString(ins.kind);
        switch (ins.kind) {
            case InstructionKind::Redaction:
                emitRect(out, ins.rect);
                if (ins.fill) emitColor(out, "fill", *ins.fill);
                break;
            case InstructionKind::Rect:
                emitRect(out, ins.rect);
                if (ins.fill) emitColor(out, "fill", *ins.fill);
                if (ins.stroke) emitColor(out, "stroke", *ins.stroke);
                out << YAML::Key << "fill-opacity" << YAML::Value << ins.fillOpacity;
                out << YAML::Key << "stroke-width" << YAML::Value << ins.strokeWidth;
                break;
            case InstructionKind::Text:
                out << YAML::Key << "origin" << YAML::Value << YAML::Flow
                    << YAML::BeginSeq << ins.origin.x << ins.origin.y << YAML::EndSeq;
                out << YAML::Key << "text" << YAML::Value << ins.text;
                out << YAML::Key << "font" << YAML::Value << ins.fontName;
                out << YAML::Key << "size" << YAML::Value << ins.fontSize;
                emitColor(out, "color", ins.color);
                if (!ins.spacing.isNeutral()) {
                    out << YAML::Key << "char-spacing" << YAML::Value << ins.spacing.charSpacing;
                    out << YAML::Key << "word-spacing" << YAML::Value << ins.spacing.wordSpacing;
                    out << YAML::Key << "horizontal-scale" << YAML::Value << ins.spacing.horizontalScale;
                }
                break;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
}

std::string RecordingSurface::toYaml() const {
    YAML::Emitter out;
    emit(out);
    return out.c_str();
}

} // namespace retext
