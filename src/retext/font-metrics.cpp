#include <retext/font-metrics.h>

#include <algorithm>
#include <cctype>

namespace retext {

namespace {

struct CharWidth {
    uint32_t codepoint;
    double width;
};

const CharWidth kHelveticaWidths[] = {
    {' ', 278}, {'i', 278}, {'l', 222}, {'I', 278}, {'!', 278},
    {'m', 889}, {'w', 778}, {'M', 833}, {'W', 1000},
};

const CharWidth kTimesWidths[] = {
    {' ', 250}, {'i', 278}, {'l', 278}, {'I', 333},
    {'m', 778}, {'w', 722}, {'M', 889}, {'W', 1000},
};

bool containsNoCase(const std::string& haystack, const char* needle) {
    std::string lower(haystack.size(), '\0');
    std::transform(haystack.begin(), haystack.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find(needle) != std::string::npos;
}

template <size_t N>
double lookup(const CharWidth (&table)[N], uint32_t codepoint, double fallback) {
    for (const auto& entry : table) {
        if (entry.codepoint == codepoint) return entry.width;
    }
    return fallback;
}

} // namespace

FallbackFamily fallbackFamily(const std::string& fontName) {
    if (containsNoCase(fontName, "courier") || containsNoCase(fontName, "mono")) {
        return FallbackFamily::Courier;
    }
    if (containsNoCase(fontName, "times") || containsNoCase(fontName, "serif")) {
        return FallbackFamily::Times;
    }
    return FallbackFamily::Helvetica;
}

double fallbackCharWidth(FallbackFamily family, uint32_t codepoint) {
    switch (family) {
        case FallbackFamily::Courier:
            return 600.0;
        case FallbackFamily::Times:
            return lookup(kTimesWidths, codepoint, 500.0);
        case FallbackFamily::Helvetica:
            return lookup(kHelveticaWidths, codepoint, 556.0);
    }
    return 556.0;
}

double fallbackCharWidth(const std::string& fontName, uint32_t codepoint) {
    return fallbackCharWidth(fallbackFamily(fontName), codepoint);
}

} // namespace retext
