//=============================================================================
// GlyphWidthPreserver Tests
//
// Widths come from the Helvetica fallback table unless a test installs its
// own metrics source: H/e/o/d/r 556, l 222, i 278, space 278, W 1000.
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include <retext/glyph-width-preserver.h>

#include <cmath>
#include <memory>

using namespace boost::ut;
using namespace retext;

namespace {

bool near(double a, double b, double eps = 1e-6) { return std::abs(a - b) < eps; }

class FixedMetrics : public FontMetricsSource {
public:
    explicit FixedMetrics(double width) : _width(width) {}

    std::optional<double> charWidth(const std::string&, uint32_t) override {
        calls++;
        return _width;
    }
    bool hasFont(const std::string&) const override { return true; }

    int calls = 0;

private:
    double _width;
};

} // namespace

suite glyph_width_measure_tests = [] {
    "measures through the fallback table"_test = [] {
        GlyphWidthPreserver preserver;
        // 556 + 556 + 222 + 222 + 556 = 2112
        expect(near(preserver.textWidth("Hello", "Helvetica", 10), 21.12));

        auto info = preserver.measure("Hello World", "Helvetica", 12);
        expect(info.charCount() == 11_u);
        expect(info.spaceCount() == 1_u);
        expect(near(info.totalWidthFontUnits, 5280.0));
        expect(near(info.totalWidthPoints, 63.36));
        expect(near(info.spaceWidth(), 3.336));
    };

    "empty text has zero width"_test = [] {
        GlyphWidthPreserver preserver;
        expect(near(preserver.textWidth("", "Helvetica", 12), 0.0));
    };

    "metrics source wins over the fallback"_test = [] {
        auto metrics = std::make_shared<FixedMetrics>(500.0);
        GlyphWidthPreserver preserver({}, metrics);
        expect(near(preserver.textWidth("ab", "Anything", 10), 10.0));
    };

    "widths are cached per font and page"_test = [] {
        auto metrics = std::make_shared<FixedMetrics>(500.0);
        GlyphWidthPreserver preserver({}, metrics);
        preserver.textWidth("aaaa", "F", 10, 0);
        expect(metrics->calls == 1_i);
        preserver.textWidth("a", "F", 10, 1);
        expect(metrics->calls == 2_i);
        preserver.clearCache();
        preserver.textWidth("a", "F", 10, 0);
        expect(metrics->calls == 3_i);
    };

    "swapping the metrics source drops cached widths"_test = [] {
        GlyphWidthPreserver preserver;
        expect(near(preserver.textWidth("a", "Helvetica", 10), 5.56));
        preserver.setMetricsSource(std::make_shared<FixedMetrics>(1000.0));
        expect(near(preserver.textWidth("a", "Helvetica", 10), 10.0));
    };

    "maxTextLength estimates from x"_test = [] {
        GlyphWidthPreserver preserver;
        expect(preserver.maxTextLength(56.0, "Helvetica", 10) == 10_u);
        expect(preserver.maxTextLength(0.0, "Helvetica", 10) == 0_u);
    };
};

suite glyph_width_fit_tests = [] {
    "equal widths fit without adjustment"_test = [] {
        GlyphWidthPreserver preserver;
        auto fit = preserver.analyzeFit("abc", "xyz", "Helvetica", 12);
        expect(fit.result == FitResult::Success);
        expect(!fit.adjustment.has_value());
        expect(fit.fitsExactly());
    };

    "short replacement for long text cannot be absorbed"_test = [] {
        GlyphWidthPreserver preserver;
        auto fit = preserver.analyzeFit("Hello World", "Hi", "Helvetica", 12, FitStrategy::Exact);
        bool scaledUp = fit.result == FitResult::Scaled && fit.adjustment &&
                        fit.adjustment->horizontalScale > 100.0;
        expect(fit.result == FitResult::Failed || scaledUp);
        expect(!fit.message.empty());
    };

    "long replacement for short text fails under EXACT"_test = [] {
        GlyphWidthPreserver preserver;
        auto fit = preserver.analyzeFit("Hi", "Hello World", "Helvetica", 12, FitStrategy::Exact);
        expect(fit.result == FitResult::Failed);
        expect(fit.overflowAmount > 0.0);
        expect(near(fit.widthDifference, fit.naturalWidth - fit.targetWidth));
    };

    "small difference goes to tracking"_test = [] {
        GlyphWidthPreserver preserver;
        // 2112 vs 1834 units at 12pt: 3.336pt spread over 4 gaps
        auto fit = preserver.analyzeFit("Hello", "Helli", "Helvetica", 12, FitStrategy::Exact);
        expect(fit.result == FitResult::Expanded);
        expect(fit.adjustment.has_value() >> fatal);
        expect(fit.adjustment->type == AdjustmentType::Tracking);
        expect(near(fit.adjustment->tracking, 0.834));
        expect(fit.isSuccess());
        expect(fit.fitsExactly());
    };

    "word spacing is preferred when there are spaces"_test = [] {
        GlyphWidthPreserver preserver;
        auto fit = preserver.analyzeFit("ab cd", "ab c", "Helvetica", 12, FitStrategy::Exact);
        expect(fit.adjustment.has_value() >> fatal);
        expect(fit.adjustment->type == AdjustmentType::WordSpacing);
        expect(near(fit.adjustment->wordSpacing, 6.672));
        auto ops = fit.adjustment->toPdfOperators();
        expect((ops.size() == 1_u) >> fatal);
        expect(ops[0] == "6.6720 Tw") << ops[0];
    };

    "SCALE stays within the configured range"_test = [] {
        GlyphWidthPreserver preserver;
        auto fit = preserver.analyzeFit("Hello World", "Hello Worlds", "Helvetica", 12, FitStrategy::Scale);
        expect(fit.result == FitResult::Scaled);
        expect(fit.adjustment.has_value() >> fatal);
        expect(fit.adjustment->horizontalScale < 100.0);
        expect(fit.adjustment->horizontalScale >= preserver.config().minHorizontalScale);
        expect(near(fit.finalWidth, fit.targetWidth));
    };

    "TRUNCATE drops whole words first"_test = [] {
        GlyphWidthPreserver preserver;
        auto fit = preserver.analyzeFit("Hello", "Hello World", "Helvetica", 12, FitStrategy::Truncate);
        expect(fit.result == FitResult::Truncated);
        expect(fit.finalText == "Hello") << fit.finalText;
        expect(fit.finalWidth <= fit.targetWidth + preserver.config().widthTolerance);
    };

    "TRUNCATE by character when word breaks are off"_test = [] {
        PreserverConfig config;
        config.truncateAtWord = false;
        GlyphWidthPreserver preserver(config);
        auto fit = preserver.analyzeFit("Hello", "Hello World", "Helvetica", 12, FitStrategy::Truncate);
        expect(fit.result == FitResult::Truncated);
        expect(fit.finalText == "Hello") << fit.finalText;
    };

    "ELLIPSIS ends with the terminator and fits"_test = [] {
        GlyphWidthPreserver preserver;
        auto fit = preserver.analyzeFit("Hello World", "Hello World and more", "Helvetica", 12,
                                        FitStrategy::Ellipsis);
        expect(fit.result == FitResult::Truncated);
        expect((fit.finalText.size() >= 3_u) >> fatal);
        expect(fit.finalText.substr(fit.finalText.size() - 3) == "...") << fit.finalText;
        expect(fit.finalWidth <= fit.targetWidth + preserver.config().widthTolerance);
    };

    "ELLIPSIS keeps one dot when nothing else fits"_test = [] {
        GlyphWidthPreserver preserver;
        auto fit = preserver.analyzeFit("i", "Hello World", "Helvetica", 12, FitStrategy::Ellipsis);
        expect(fit.result == FitResult::Truncated);
        expect(fit.finalText == ".") << fit.finalText;
    };

    "COMPRESS and EXPAND only act in their direction"_test = [] {
        GlyphWidthPreserver preserver;
        auto compress = preserver.analyzeFit("Hello", "Helli", "Helvetica", 12, FitStrategy::Compress);
        expect(compress.result == FitResult::Success);
        expect(!compress.adjustment.has_value());

        auto expand = preserver.analyzeFit("Helli", "Hello", "Helvetica", 12, FitStrategy::Expand);
        expect(expand.result == FitResult::Success);
        expect(!expand.adjustment.has_value());

        auto squeezed = preserver.analyzeFit("Helli", "Hello", "Helvetica", 12, FitStrategy::Compress);
        expect(squeezed.result == FitResult::Compressed);
    };

    "ALLOW_OVERFLOW reports the overflow"_test = [] {
        GlyphWidthPreserver preserver;
        auto fit = preserver.analyzeFit("Hi", "Hello World", "Helvetica", 12, FitStrategy::AllowOverflow);
        expect(fit.result == FitResult::Overflow);
        expect(near(fit.overflowAmount, fit.widthDifference));
        expect(fit.finalText == "Hello World");
    };

    "explicit target width overrides the original"_test = [] {
        GlyphWidthPreserver preserver;
        auto fit = preserver.analyzeFit("x", "Hello", "Helvetica", 10, FitStrategy::Exact, 21.12);
        expect(fit.result == FitResult::Success);
        expect(near(fit.targetWidth, 21.12));
    };

    "configured default strategy is used"_test = [] {
        PreserverConfig config;
        config.defaultStrategy = FitStrategy::AllowOverflow;
        GlyphWidthPreserver preserver(config);
        auto fit = preserver.analyzeFit("Hi", "Hello World", "Helvetica", 12);
        expect(fit.strategy == FitStrategy::AllowOverflow);
    };

    "validateFit reports the first working strategy"_test = [] {
        GlyphWidthPreserver preserver;
        auto ok = preserver.validateFit("Hello", "Helli", "Helvetica", 12);
        expect(ok.isSuccess());
        expect(ok.message == "adjustment required: TRACKING") << ok.message;

        auto bad = preserver.validateFit("Hi", "Hello World", "Helvetica", 12);
        expect(!bad.isSuccess());
        expect(bad.message.find("text too long") == 0_u) << bad.message;
    };
};

suite glyph_width_tj_tests = [] {
    "TJ array spreads the difference and clamps"_test = [] {
        GlyphWidthPreserver preserver;
        // natural 20.016, target 26.016: -250 per gap, clamped to -200
        auto tj = preserver.createTjArray("abc", 26.016, "Helvetica", 12);
        expect((tj.entries.size() == 5_u) >> fatal);
        expect(!tj.entries[1].isText);
        expect(near(tj.entries[1].adjustment, -200.0));
        expect(tj.toPdf() == "[(a) -200.00 (b) -200.00 (c)] TJ") << tj.toPdf();
    };

    "TJ array keeps fitting text whole and escapes it"_test = [] {
        GlyphWidthPreserver preserver;
        auto tj = preserver.createTjArray("a(b)", preserver.textWidth("a(b)", "Helvetica", 12),
                                          "Helvetica", 12);
        expect((tj.entries.size() == 1_u) >> fatal);
        expect(tj.toPdf() == "[(a\\(b\\))] TJ") << tj.toPdf();
        expect(preserver.createTjArray("", 10, "Helvetica", 12).empty());
    };
};

suite glyph_width_names_tests = [] {
    "strategy names parse in either spelling"_test = [] {
        expect(parseFitStrategy("allow-overflow") == std::optional(FitStrategy::AllowOverflow));
        expect(parseFitStrategy("ALLOW_OVERFLOW") == std::optional(FitStrategy::AllowOverflow));
        expect(parseFitStrategy("Ellipsis") == std::optional(FitStrategy::Ellipsis));
        expect(!parseFitStrategy("squash").has_value());
        expect(std::string(toString(FitResult::Truncated)) == "TRUNCATED");
    };

    "neutral adjustment emits no operators"_test = [] {
        SpacingAdjustment adj;
        expect(!adj.hasAdjustment());
        expect(adj.toPdfOperators().empty());

        adj.tracking = -0.5;
        adj.horizontalScale = 92.0;
        auto ops = adj.toPdfOperators();
        expect((ops.size() == 2_u) >> fatal);
        expect(ops[0] == "-0.5000 Tc");
        expect(ops[1] == "92.0000 Tz");
    };
};
