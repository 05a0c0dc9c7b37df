//=============================================================================
// Font Metrics Tests
//
// Fallback width tables and the face-backed metrics source. Faces are
// stubbed so no font files are needed.
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>

#include <retext/font-metrics.h>
#include <retext/font/font-face.h>
#include <retext/glyph-width-preserver.h>

#include <cmath>
#include <map>
#include <memory>

using namespace boost::ut;
using namespace retext;

namespace {

class StubFace : public font::FontFace {
public:
    explicit StubFace(std::string name, std::map<uint32_t, double> advances)
        : _name(std::move(name)), _advances(std::move(advances)) {}

    const std::string& name() const override { return _name; }
    int unitsPerEm() const override { return 1000; }

    std::optional<double> advance(uint32_t codepoint) override {
        auto it = _advances.find(codepoint);
        if (it == _advances.end()) return std::nullopt;
        return it->second;
    }

private:
    std::string _name;
    std::map<uint32_t, double> _advances;
};

} // namespace

suite fallback_metrics_tests = [] {
    "family from the font name"_test = [] {
        expect(fallbackFamily("Courier-Bold") == FallbackFamily::Courier);
        expect(fallbackFamily("DejaVuSansMono") == FallbackFamily::Courier);
        expect(fallbackFamily("Times-Roman") == FallbackFamily::Times);
        expect(fallbackFamily("NotoSerif") == FallbackFamily::Times);
        expect(fallbackFamily("Arial") == FallbackFamily::Helvetica);
    };

    "width tables"_test = [] {
        expect(fallbackCharWidth("Helvetica", 'W') == 1000.0_d);
        expect(fallbackCharWidth("Helvetica", 'l') == 222.0_d);
        expect(fallbackCharWidth("Helvetica", 'a') == 556.0_d);
        expect(fallbackCharWidth("Times-Roman", ' ') == 250.0_d);
        expect(fallbackCharWidth("Times-Roman", 'a') == 500.0_d);
        expect(fallbackCharWidth("Courier", 'W') == 600.0_d);
        expect(fallbackCharWidth("Courier", 'i') == 600.0_d);
    };

    "fallback source knows every font"_test = [] {
        FallbackMetricsSource source;
        expect(source.hasFont("Anything"));
        expect(source.charWidth("Courier", 'x') == std::optional(600.0));
    };
};

suite face_metrics_tests = [] {
    "faces are found with or without the subset prefix"_test = [] {
        font::FaceMetricsSource source;
        source.addFace("Arial", std::make_shared<StubFace>("arial.ttf", std::map<uint32_t, double>{{'a', 556.0}}));
        expect(source.faceCount() == 1_u);
        expect(source.hasFont("Arial"));
        expect(source.hasFont("ABCDEF+Arial"));
        expect(!source.hasFont("Verdana"));
        expect(source.charWidth("ABCDEF+Arial", 'a') == std::optional(556.0));
        expect(!source.charWidth("Arial", 'z').has_value());
        expect(!source.charWidth("Verdana", 'a').has_value());
    };

    "missing font files fail to load"_test = [] {
        font::FaceMetricsSource source;
        auto res = source.addFile("Arial", "/nonexistent/arial.ttf");
        expect(!res.has_value());
        expect(error_msg(res).find("Cannot load face for Arial") == 0_u) << error_msg(res);
        expect(source.faceCount() == 0_u);
    };

    "garbage font data is rejected"_test = [] {
        const uint8_t junk[] = {0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07};
        auto face = font::FontFace::create(junk, sizeof(junk), "junk");
        expect(!face.has_value());
    };

    "preserver falls back per glyph"_test = [] {
        auto source = std::make_shared<font::FaceMetricsSource>();
        source->addFace("Arial", std::make_shared<StubFace>("arial.ttf", std::map<uint32_t, double>{{'a', 500.0}}));
        GlyphWidthPreserver preserver({}, source);
        // 'a' from the face, 'W' from the Helvetica table
        expect(std::abs(preserver.textWidth("aW", "Arial", 10) - 15.0) < 1e-9);
        // Unknown fonts measure with the fallback tables
        expect(std::abs(preserver.textWidth("a", "Courier", 10) - 6.0) < 1e-9);
    };
};
