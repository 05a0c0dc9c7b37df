#pragma once

#include <algorithm>

namespace retext {

struct Point {
    double x = 0.0;
    double y = 0.0;
};

//=============================================================================
// Rect - axis aligned box in PDF user space (x0,y0) .. (x1,y1)
//=============================================================================
struct Rect {
    double x0 = 0.0, y0 = 0.0, x1 = 0.0, y1 = 0.0;

    double width() const { return x1 - x0; }
    double height() const { return y1 - y0; }
    double area() const { return width() * height(); }
    Point center() const { return {(x0 + x1) / 2.0, (y0 + y1) / 2.0}; }

    bool contains(double x, double y) const {
        return x >= x0 && x <= x1 && y >= y0 && y <= y1;
    }

    Rect expanded(double margin) const {
        return {x0 - margin, y0 - margin, x1 + margin, y1 + margin};
    }

    bool intersects(const Rect& o) const {
        return std::max(x0, o.x0) < std::min(x1, o.x1) &&
               std::max(y0, o.y0) < std::min(y1, o.y1);
    }
};

// RGB in [0, 1]
struct Color {
    double r = 0.0, g = 0.0, b = 0.0;

    static Color black() { return {0.0, 0.0, 0.0}; }
    static Color white() { return {1.0, 1.0, 1.0}; }

    bool operator==(const Color&) const = default;
};

} // namespace retext
