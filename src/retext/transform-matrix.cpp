#include <retext/transform-matrix.h>

#include <algorithm>
#include <cmath>
#include <numbers>

namespace retext {

namespace {

double toRadians(double deg) { return deg * std::numbers::pi / 180.0; }
double toDegrees(double rad) { return rad * 180.0 / std::numbers::pi; }

} // namespace

const char* toString(TransformType type) {
    switch (type) {
        case TransformType::Identity:      return "identity";
        case TransformType::Translation:   return "translation";
        case TransformType::Scale:         return "scale";
        case TransformType::Rotation:      return "rotation";
        case TransformType::ScaleRotation: return "scale_rotation";
        case TransformType::Skew:          return "skew";
        case TransformType::General:       return "general";
    }
    return "general";
}

//=============================================================================
// Factories
//=============================================================================

TransformMatrix TransformMatrix::rotation(double degrees, double cx, double cy) {
    double rad = toRadians(degrees);
    double cosA = std::cos(rad);
    double sinA = std::sin(rad);

    // Rotate about (cx, cy): T(-c) * R * T(c)
    return {cosA, sinA, -sinA, cosA,
            cx - cx * cosA + cy * sinA,
            cy - cx * sinA - cy * cosA};
}

TransformMatrix TransformMatrix::skewing(double xDegrees, double yDegrees) {
    return {1, std::tan(toRadians(yDegrees)), std::tan(toRadians(xDegrees)), 1, 0, 0};
}

Result<TransformMatrix> TransformMatrix::fromArray(const std::vector<double>& values) {
    if (values.size() != 6) {
        return Err<TransformMatrix>("TransformMatrix: expected 6 elements, got " +
                                    std::to_string(values.size()));
    }
    return Ok(TransformMatrix{values[0], values[1], values[2],
                              values[3], values[4], values[5]});
}

//=============================================================================
// Algebra
//=============================================================================

TransformMatrix TransformMatrix::multiply(const TransformMatrix& o) const {
    TransformMatrix r;
    r.a = a * o.a + b * o.c;
    r.b = a * o.b + b * o.d;
    r.c = c * o.a + d * o.c;
    r.d = c * o.b + d * o.d;
    r.e = e * o.a + f * o.c + o.e;
    r.f = e * o.b + f * o.d + o.f;
    return r;
}

std::optional<TransformMatrix> TransformMatrix::inverse() const {
    double det = determinant();
    if (std::abs(det) <= kSingularThreshold) {
        return std::nullopt;
    }
    return TransformMatrix{
        d / det,
        -b / det,
        -c / det,
        a / det,
        (c * f - d * e) / det,
        (b * e - a * f) / det,
    };
}

Point TransformMatrix::transformPoint(double x, double y) const {
    return {a * x + c * y + e, b * x + d * y + f};
}

Point TransformMatrix::transformDistance(double dx, double dy) const {
    return {a * dx + c * dy, b * dx + d * dy};
}

Rect TransformMatrix::transformBBox(const Rect& box) const {
    const Point corners[4] = {
        transformPoint(box.x0, box.y0),
        transformPoint(box.x1, box.y0),
        transformPoint(box.x1, box.y1),
        transformPoint(box.x0, box.y1),
    };
    Rect out{corners[0].x, corners[0].y, corners[0].x, corners[0].y};
    for (const auto& p : corners) {
        out.x0 = std::min(out.x0, p.x);
        out.y0 = std::min(out.y0, p.y);
        out.x1 = std::max(out.x1, p.x);
        out.y1 = std::max(out.y1, p.y);
    }
    return out;
}

TransformMatrix TransformMatrix::translate(double tx, double ty) const {
    return multiply(translation(tx, ty));
}

TransformMatrix TransformMatrix::scale(double sx, double sy) const {
    return multiply(scaling(sx, sy));
}

TransformMatrix TransformMatrix::rotate(double degrees) const {
    return multiply(rotation(degrees));
}

TransformMatrix TransformMatrix::skew(double xDegrees, double yDegrees) const {
    return multiply(skewing(xDegrees, yDegrees));
}

//=============================================================================
// Properties
//=============================================================================

bool TransformMatrix::isIdentity() const {
    return std::abs(a - 1) < kEpsilon && std::abs(b) < kEpsilon &&
           std::abs(c) < kEpsilon && std::abs(d - 1) < kEpsilon &&
           std::abs(e) < kEpsilon && std::abs(f) < kEpsilon;
}

bool TransformMatrix::isInvertible() const {
    return std::abs(determinant()) > kSingularThreshold;
}

double TransformMatrix::scaleX() const { return std::sqrt(a * a + b * b); }
double TransformMatrix::scaleY() const { return std::sqrt(c * c + d * d); }
double TransformMatrix::rotationAngle() const { return toDegrees(std::atan2(b, a)); }

bool TransformMatrix::hasRotation() const {
    return std::abs(b) > kEpsilon || std::abs(c) > kEpsilon;
}

bool TransformMatrix::hasScale() const {
    return std::abs(scaleX() - 1.0) > kEpsilon || std::abs(scaleY() - 1.0) > kEpsilon;
}

bool TransformMatrix::hasSkew() const {
    // pure rotation has b == -c
    return hasRotation() && std::abs(b + c) > kEpsilon;
}

TransformType TransformMatrix::type() const {
    if (isIdentity()) return TransformType::Identity;

    bool rotation = hasRotation();
    bool scaled = hasScale();

    if (!rotation && !scaled) return TransformType::Translation;
    if (hasSkew()) return TransformType::Skew;
    if (rotation && !scaled) return TransformType::Rotation;
    if (scaled && !rotation) return TransformType::Scale;
    if (rotation && scaled) return TransformType::ScaleRotation;
    return TransformType::General;
}

Decomposition TransformMatrix::decompose() const {
    Decomposition out;
    out.translateX = e;
    out.translateY = f;

    double sx = scaleX();
    double sy = scaleY();
    if (determinant() < 0) sx = -sx;
    out.scaleX = sx;
    out.scaleY = sy;
    out.rotation = toDegrees(std::atan2(b, a));

    // Assumes near-orthogonal axes; results with real shear are approximate.
    if (std::abs(sx) > kEpsilon && std::abs(sy) > kEpsilon) {
        double cosR = a / sx;
        double sinR = b / sx;
        if (std::abs(cosR) > kEpsilon) {
            out.skewX = toDegrees(std::atan2(c / sy + sinR, cosR));
        }
    }
    return out;
}

bool TransformMatrix::isClose(const TransformMatrix& o, double tolerance) const {
    return std::abs(a - o.a) < tolerance && std::abs(b - o.b) < tolerance &&
           std::abs(c - o.c) < tolerance && std::abs(d - o.d) < tolerance &&
           std::abs(e - o.e) < tolerance && std::abs(f - o.f) < tolerance;
}

std::string TransformMatrix::toString() const {
    return fmt::format("[{:.3f} {:.3f} {:.3f} {:.3f} {:.3f} {:.3f}]", a, b, c, d, e, f);
}

//=============================================================================
// Helpers
//=============================================================================

TransformMatrix composeMatrices(const std::vector<TransformMatrix>& matrices) {
    TransformMatrix result = TransformMatrix::identity();
    for (const auto& m : matrices) {
        result = result.multiply(m);
    }
    return result;
}

TransformMatrix interpolateMatrices(const TransformMatrix& m1, const TransformMatrix& m2, double t) {
    t = std::clamp(t, 0.0, 1.0);
    return {
        m1.a + (m2.a - m1.a) * t,
        m1.b + (m2.b - m1.b) * t,
        m1.c + (m2.c - m1.c) * t,
        m1.d + (m2.d - m1.d) * t,
        m1.e + (m2.e - m1.e) * t,
        m1.f + (m2.f - m1.f) * t,
    };
}

TransformMatrix createTextMatrix(double /*fontSize*/, double horizontalScale,
                                 double x, double y, double rotation) {
    // Font size belongs to Tf, not Tm
    TransformMatrix m = TransformMatrix::scaling(horizontalScale / 100.0, 1.0);
    if (std::abs(rotation) > 0.001) {
        m = m.rotate(rotation);
    }
    m.e = x;
    m.f = y;
    return m;
}

//=============================================================================
// TextTransformInfo
//=============================================================================

double TextTransformInfo::effectiveFontSize() const {
    return fontSize * combined().scaleY();
}

double TextTransformInfo::effectiveHorizontalScale() const {
    return horizontalScale / 100.0 * combined().scaleX();
}

double TextTransformInfo::textRotation() const {
    return combined().rotationAngle();
}

bool TextTransformInfo::isRotated() const {
    return std::abs(textRotation()) > 0.5;
}

bool TextTransformInfo::isScaled() const {
    auto m = combined();
    return std::abs(m.scaleX() - m.scaleY()) > 0.01;
}

bool TextTransformInfo::isMirrored() const {
    return combined().determinant() < 0;
}

double TextTransformInfo::glyphWidth(double width) const {
    double scaled = width * horizontalScale / 100.0;
    return std::abs(combined().transformDistance(scaled, 0.0).x);
}

} // namespace retext
