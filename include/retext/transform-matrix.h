#pragma once

#include <retext/geometry.h>
#include <retext/result.hpp>

#include <fmt/format.h>

#include <optional>
#include <string>
#include <vector>

namespace retext {

enum class TransformType {
    Identity,
    Translation,
    Scale,
    Rotation,
    ScaleRotation,
    Skew,
    General,
};

const char* toString(TransformType type);

struct Decomposition {
    double translateX = 0.0;
    double translateY = 0.0;
    double rotation = 0.0;   // degrees
    double scaleX = 1.0;     // negative when the matrix mirrors
    double scaleY = 1.0;
    double skewX = 0.0;      // degrees, best effort
    double skewY = 0.0;
};

//=============================================================================
// TransformMatrix - 2D affine transform, immutable value type
//
// Represents: | a b 0 |
//             | c d 0 |
//             | e f 1 |
//
// Points are row vectors: [x' y' 1] = [x y 1] * M
//=============================================================================
struct TransformMatrix {
    double a = 1, b = 0, c = 0, d = 1, e = 0, f = 0;

    static constexpr double kEpsilon = 1e-6;
    static constexpr double kSingularThreshold = 1e-10;

    // Factories
    static TransformMatrix identity() { return {1, 0, 0, 1, 0, 0}; }
    static TransformMatrix translation(double tx, double ty) { return {1, 0, 0, 1, tx, ty}; }
    static TransformMatrix scaling(double s) { return scaling(s, s); }
    static TransformMatrix scaling(double sx, double sy) { return {sx, 0, 0, sy, 0, 0}; }
    static TransformMatrix rotation(double degrees, double cx = 0.0, double cy = 0.0);
    static TransformMatrix skewing(double xDegrees, double yDegrees = 0.0);
    static Result<TransformMatrix> fromArray(const std::vector<double>& values);

    // self∘other: `other` is applied first, same as the PDF "m × CTM" rule
    TransformMatrix multiply(const TransformMatrix& other) const;
    TransformMatrix operator*(const TransformMatrix& other) const { return multiply(other); }
    TransformMatrix concat(const TransformMatrix& other) const { return other.multiply(*this); }
    std::optional<TransformMatrix> inverse() const;

    Point transformPoint(double x, double y) const;
    Point transformPoint(const Point& p) const { return transformPoint(p.x, p.y); }
    Point transformDistance(double dx, double dy) const;
    Rect transformBBox(const Rect& box) const;

    // Chainable
    TransformMatrix translate(double tx, double ty) const;
    TransformMatrix scale(double sx, double sy) const;
    TransformMatrix scale(double s) const { return scale(s, s); }
    TransformMatrix rotate(double degrees) const;
    TransformMatrix skew(double xDegrees, double yDegrees = 0.0) const;

    // Properties
    double determinant() const { return a * d - b * c; }
    bool isIdentity() const;
    bool isInvertible() const;
    double scaleX() const;
    double scaleY() const;
    double rotationAngle() const;
    bool hasRotation() const;
    bool hasScale() const;
    bool hasSkew() const;
    TransformType type() const;
    Decomposition decompose() const;

    bool isClose(const TransformMatrix& other, double tolerance = kEpsilon) const;
    bool operator==(const TransformMatrix& other) const { return isClose(other); }

    std::string toString() const;
};

TransformMatrix composeMatrices(const std::vector<TransformMatrix>& matrices);
TransformMatrix interpolateMatrices(const TransformMatrix& m1, const TransformMatrix& m2, double t);

// Typical Tm: horizontal scale, optional rotation, then placed at (x, y)
TransformMatrix createTextMatrix(double fontSize, double horizontalScale = 100.0,
                                 double x = 0.0, double y = 0.0, double rotation = 0.0);

//=============================================================================
// TextTransformInfo - CTM + Tm + font size, answers "how big does this render"
//=============================================================================
struct TextTransformInfo {
    TransformMatrix ctm;
    TransformMatrix textMatrix;
    double fontSize = 12.0;
    double horizontalScale = 100.0;  // Tz, percent

    TransformMatrix combined() const { return textMatrix.multiply(ctm); }
    double effectiveFontSize() const;
    double effectiveHorizontalScale() const;
    double textRotation() const;
    bool isRotated() const;
    bool isScaled() const;
    bool isMirrored() const;
    Point transformPoint(double x, double y) const { return combined().transformPoint(x, y); }

    // Rendered width of an advance given in unscaled text space
    double glyphWidth(double width) const;
};

} // namespace retext

template<>
struct fmt::formatter<retext::TransformMatrix> : fmt::formatter<std::string> {
    auto format(const retext::TransformMatrix& m, fmt::format_context& ctx) const {
        return fmt::formatter<std::string>::format(m.toString(), ctx);
    }
};
