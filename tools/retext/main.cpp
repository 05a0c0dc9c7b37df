// retext: inspect and rewrite the text of a PDF page
//
//   retext spans <file> [--page N]
//   retext fit <original> <new> [--font F] [--size S] [--strategy X] [--target W]
//   retext rewrite <file> --page N --bbox x0,y0,x1,y1 [--old T] --new T [--strategy X] [--mode M]
//   retext validate <file> [--quick]
//
// Rewrites are staged as overlay layers and printed as YAML render
// instructions; the PDF itself is never modified.

#include <retext/config.h>
#include <retext/font/font-face.h>
#include <retext/glyph-width-preserver.h>
#include <retext/pdf/pdfio-document.h>
#include <retext/pre-save-validator.h>
#include <retext/recording-surface.h>
#include <retext/safe-text-rewriter.h>
#include <retext/z-order-manager.h>

#include <ytrace/ytrace.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <fmt/format.h>

#include <args.hxx>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace retext;

namespace {

constexpr int EXIT_INVALID = 2;

struct Options {
    std::vector<std::string> operands;
    std::optional<int> page;
    std::optional<std::string> font;
    std::optional<double> size;
    std::optional<std::string> strategy;
    std::optional<std::string> mode;
    std::optional<double> target;
    std::optional<std::string> bbox;
    std::optional<std::string> oldText;
    std::optional<std::string> newText;
    bool quick = false;
};

// "x0,y0,x1,y1"
std::optional<Rect> parseBbox(const std::string& text) {
    Rect r;
    char tail = 0;
    if (std::sscanf(text.c_str(), "%lf,%lf,%lf,%lf%c", &r.x0, &r.y0, &r.x1, &r.y1, &tail) != 4) {
        return std::nullopt;
    }
    if (r.x1 <= r.x0 || r.y1 <= r.y0) return std::nullopt;
    return r;
}

// "section.key=value" pairs into an override tree
Result<YAML::Node> parseOverrides(const std::vector<std::string>& sets) {
    YAML::Node root(YAML::NodeType::Map);
    for (const auto& set : sets) {
        auto eq = set.find('=');
        auto dot = set.find('.');
        if (eq == std::string::npos || dot == std::string::npos || dot > eq) {
            return Err<YAML::Node>("--set expects section.key=value, got '" + set + "'");
        }
        std::string section = set.substr(0, dot);
        std::string key = set.substr(dot + 1, eq - dot - 1);
        try {
            root[section][key] = YAML::Load(set.substr(eq + 1));
        } catch (const YAML::Exception& e) {
            return Err<YAML::Node>("--set " + set + ": " + e.what());
        }
    }
    return Ok(std::move(root));
}

Result<pdf::PdfioDocument::Ptr> openDocument(const std::string& path,
                                             const font::FaceMetricsSource::Ptr& faces) {
    if (!std::filesystem::exists(path)) {
        return Err<pdf::PdfioDocument::Ptr>("file not found: " + path);
    }
    auto doc = pdf::PdfioDocument::open(path);
    if (!doc) return Err<pdf::PdfioDocument::Ptr>("openDocument", doc);

    for (int p = 0; p < (*doc)->pageCount(); p++) {
        if (auto loaded = (*doc)->loadEmbeddedFaces(p, *faces); !loaded) {
            ywarn("page {}: {}", p, error_msg(loaded));
        }
    }
    (*doc)->setMetricsSource(faces);
    return doc;
}

//=============================================================================
// spans
//=============================================================================
int runSpans(const Options& opts) {
    if (opts.operands.size() != 1) {
        std::cerr << "usage: retext spans <file> [--page N]\n";
        return 1;
    }
    auto faces = std::make_shared<font::FaceMetricsSource>();
    auto doc = openDocument(opts.operands[0], faces);
    if (!doc) {
        std::cerr << "Error: " << error_msg(doc) << "\n";
        return 1;
    }

    int first = opts.page.value_or(0);
    int last = opts.page ? *opts.page : (*doc)->pageCount() - 1;
    for (int page = first; page <= last; page++) {
        auto blocks = (*doc)->parsePage(page);
        if (!blocks) {
            std::cerr << "Error: " << error_msg(blocks) << "\n";
            return 1;
        }
        for (size_t b = 0; b < blocks->size(); b++) {
            for (const auto& op : (*blocks)[b].operations) {
                Point p = op.position();
                std::cout << fmt::format("{}\t{}\t{}\t{}\t{:.2f}\t{:.2f}\t{:.2f}\t{}\n", page, b,
                                         toString(op.op), op.fontName(), op.fontSize(), p.x, p.y,
                                         op.text);
            }
        }
    }
    return 0;
}

//=============================================================================
// fit
//=============================================================================
int runFit(const Options& opts, const Config& config) {
    if (opts.operands.size() != 2) {
        std::cerr << "usage: retext fit <original> <new> [--font F] [--size S] [--strategy X] [--target W]\n";
        return 1;
    }
    std::optional<FitStrategy> strategy;
    if (opts.strategy) {
        strategy = parseFitStrategy(*opts.strategy);
        if (!strategy) {
            std::cerr << "Error: unknown fit strategy '" << *opts.strategy << "'\n";
            return 1;
        }
    }

    GlyphWidthPreserver preserver(PreserverConfig::fromConfig(config));
    FitAnalysis fit = preserver.analyzeFit(opts.operands[0], opts.operands[1],
                                           opts.font.value_or("Helvetica"), opts.size.value_or(12.0),
                                           strategy, opts.target);

    std::cout << fmt::format("strategy:     {}\n", toString(fit.strategy));
    std::cout << fmt::format("result:       {}\n", toString(fit.result));
    std::cout << fmt::format("original:     {:.3f}\n", fit.originalWidth);
    std::cout << fmt::format("natural:      {:.3f}\n", fit.naturalWidth);
    std::cout << fmt::format("target:       {:.3f}\n", fit.targetWidth);
    std::cout << fmt::format("final:        {:.3f} '{}'\n", fit.finalWidth, fit.finalText);
    if (fit.adjustment) {
        for (const auto& op : fit.adjustment->toPdfOperators()) {
            std::cout << "operator:     " << op << "\n";
        }
    }
    if (fit.overflowAmount > 0.0) {
        std::cout << fmt::format("overflow:     {:.3f}\n", fit.overflowAmount);
    }
    std::cout << "message:      " << fit.message << "\n";
    return fit.isSuccess() ? 0 : EXIT_INVALID;
}

//=============================================================================
// rewrite
//=============================================================================
int runRewrite(const Options& opts, const Config& config) {
    if (opts.operands.size() != 1 || !opts.page || !opts.bbox || !opts.newText) {
        std::cerr << "usage: retext rewrite <file> --page N --bbox x0,y0,x1,y1 [--old T] --new T\n";
        return 1;
    }
    auto bbox = parseBbox(*opts.bbox);
    if (!bbox) {
        std::cerr << "Error: invalid --bbox '" << *opts.bbox << "'\n";
        return 1;
    }

    auto faces = std::make_shared<font::FaceMetricsSource>();
    auto doc = openDocument(opts.operands[0], faces);
    if (!doc) {
        std::cerr << "Error: " << error_msg(doc) << "\n";
        return 1;
    }
    if (auto res = (*doc)->checkPage(*opts.page); !res) {
        std::cerr << "Error: " << error_msg(res) << "\n";
        return 1;
    }

    std::string oldText;
    if (opts.oldText) {
        oldText = *opts.oldText;
    } else {
        auto extracted = (*doc)->extractText(*opts.page, *bbox);
        if (!extracted) {
            std::cerr << "Error: " << error_msg(extracted) << "\n";
            return 1;
        }
        oldText = *extracted;
        yinfo("rewrite: original text '{}'", oldText);
    }

    RewriteRequest request;
    request.page = *opts.page;
    request.originalText = oldText;
    request.originalBbox = *bbox;
    request.newText = *opts.newText;
    if (opts.font) request.fontName = *opts.font;
    if (opts.size) request.fontSize = *opts.size;

    if (opts.strategy) {
        request.strategy = parseOverlayStrategy(*opts.strategy);
        if (!request.strategy) {
            std::cerr << "Error: unknown strategy '" << *opts.strategy << "'\n";
            return 1;
        }
    } else {
        int delta = static_cast<int>(request.newText.size()) - static_cast<int>(oldText.size());
        request.strategy = SafeTextRewriter::recommendStrategy(delta, false, (*doc)->hasSignatures());
    }
    if (opts.mode) {
        request.mode = parseRewriteMode(*opts.mode);
        if (!request.mode) {
            std::cerr << "Error: unknown mode '" << *opts.mode << "'\n";
            return 1;
        }
    }

    auto zorder = std::make_shared<ZOrderManager>(ZOrderConfig::fromConfig(config));
    auto preserver = std::make_shared<GlyphWidthPreserver>(PreserverConfig::fromConfig(config), faces);
    SafeTextRewriter rewriter(RewriterConfig::fromConfig(config), zorder, preserver);

    RecordingSurface surface(request.page);
    RewriteResult result = rewriter.rewriteText(request, surface);
    for (const auto& w : result.warnings) std::cerr << "warning: " << w << "\n";
    for (const auto& e : result.errors) std::cerr << "error: " << e << "\n";
    if (!result.success()) return 1;

    PreSaveValidator validator(ValidatorConfig::fromConfig(config));
    validator.recordModification("text_overlay", request.page, oldText, request.newText);
    ValidationReport report = validator.validate(**doc, (*doc)->path());
    for (const auto& issue : report.blockingIssues()) {
        std::cerr << issue.toString() << "\n";
    }

    std::cout << surface.toYaml() << std::endl;
    return report.result == ValidationResult::Invalid ? EXIT_INVALID : 0;
}

//=============================================================================
// validate
//=============================================================================
int runValidate(const Options& opts, const Config& config) {
    if (opts.operands.size() != 1) {
        std::cerr << "usage: retext validate <file> [--quick]\n";
        return 1;
    }
    auto faces = std::make_shared<font::FaceMetricsSource>();
    auto doc = openDocument(opts.operands[0], faces);
    if (!doc) {
        std::cerr << "Error: " << error_msg(doc) << "\n";
        return 1;
    }

    PreSaveValidator validator(ValidatorConfig::fromConfig(config));
    if (opts.quick) {
        bool ok = validator.quickValidate(**doc);
        std::cout << (ok ? "ok" : "blocked") << "\n";
        return ok ? 0 : EXIT_INVALID;
    }

    ValidationReport report = validator.validate(**doc, (*doc)->path());
    std::cout << report.summary() << "\n";
    for (const auto& issue : report.issues) {
        std::cout << issue.toString() << "\n";
    }
    return report.result == ValidationResult::Invalid ? EXIT_INVALID : 0;
}

} // namespace

int main(int argc, char** argv) {
    args::ArgumentParser parser("retext - overlay-based PDF text replacement");
    args::HelpFlag help(parser, "help", "Show help", {'h', "help"});
    args::ValueFlag<std::string> configFlag(parser, "path", "Config file", {'c', "config"});
    args::ValueFlagList<std::string> setFlag(parser, "section.key=value", "Override a config value", {"set"});
    args::ValueFlag<std::string> logFileFlag(parser, "path", "Write the log to a file", {"log-file"});
    args::Flag verboseFlag(parser, "verbose", "Debug logging", {'v', "verbose"});

    args::ValueFlag<int> pageFlag(parser, "N", "Page (0-based)", {'p', "page"});
    args::ValueFlag<std::string> fontFlag(parser, "F", "Font name", {"font"});
    args::ValueFlag<double> sizeFlag(parser, "S", "Font size", {"size"});
    args::ValueFlag<std::string> strategyFlag(parser, "X", "Fit or overlay strategy", {"strategy"});
    args::ValueFlag<std::string> modeFlag(parser, "M", "Rewrite mode", {"mode"});
    args::ValueFlag<double> targetFlag(parser, "W", "Target width in points", {"target"});
    args::ValueFlag<std::string> bboxFlag(parser, "x0,y0,x1,y1", "Original span box", {"bbox"});
    args::ValueFlag<std::string> oldFlag(parser, "T", "Original text", {"old"});
    args::ValueFlag<std::string> newFlag(parser, "T", "Replacement text", {"new"});
    args::Flag quickFlag(parser, "quick", "Critical checks only", {"quick"});

    args::Positional<std::string> commandArg(parser, "command", "spans | fit | rewrite | validate");
    args::PositionalList<std::string> operandsArg(parser, "operands", "Command operands");

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    } catch (const args::ValidationError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    if (!commandArg) {
        std::cerr << parser;
        return 1;
    }

    if (logFileFlag) {
        try {
            auto fileLogger = spdlog::basic_logger_mt("retext", args::get(logFileFlag), true);
            spdlog::set_default_logger(fileLogger);
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "Error: cannot log to " << args::get(logFileFlag) << ": " << e.what() << "\n";
            return 1;
        }
    }
    spdlog::set_level(verboseFlag ? spdlog::level::debug : spdlog::level::info);
    spdlog::cfg::load_env_levels();

    auto overrides = parseOverrides(args::get(setFlag));
    if (!overrides) {
        std::cerr << "Error: " << error_msg(overrides) << "\n";
        return 1;
    }
    auto config = Config::create(configFlag ? args::get(configFlag) : "", *overrides);
    if (!config) {
        std::cerr << "Error: " << error_msg(config) << "\n";
        return 1;
    }

    Options opts;
    opts.operands = args::get(operandsArg);
    if (pageFlag) opts.page = args::get(pageFlag);
    if (fontFlag) opts.font = args::get(fontFlag);
    if (sizeFlag) opts.size = args::get(sizeFlag);
    if (strategyFlag) opts.strategy = args::get(strategyFlag);
    if (modeFlag) opts.mode = args::get(modeFlag);
    if (targetFlag) opts.target = args::get(targetFlag);
    if (bboxFlag) opts.bbox = args::get(bboxFlag);
    if (oldFlag) opts.oldText = args::get(oldFlag);
    if (newFlag) opts.newText = args::get(newFlag);
    opts.quick = args::get(quickFlag);

    const std::string command = args::get(commandArg);
    ydebug("retext {} ({} operands)", command, opts.operands.size());

    if (command == "spans") return runSpans(opts);
    if (command == "fit") return runFit(opts, **config);
    if (command == "rewrite") return runRewrite(opts, **config);
    if (command == "validate") return runValidate(opts, **config);

    std::cerr << "Error: unknown command '" << command << "'\n";
    return 1;
}
