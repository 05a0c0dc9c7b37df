#include <retext/pre-save-validator.h>
#include <retext/config.h>
#include "utf8.h"

#include <ytrace/ytrace.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <array>
#include <iterator>

namespace retext {

namespace {

constexpr std::array<std::string_view, 14> STANDARD_FONTS = {
    "Courier", "Courier-Bold", "Courier-BoldOblique", "Courier-Oblique",
    "Helvetica", "Helvetica-Bold", "Helvetica-BoldOblique", "Helvetica-Oblique",
    "Times-Roman", "Times-Bold", "Times-BoldItalic", "Times-Italic",
    "Symbol", "ZapfDingbats",
};

constexpr std::array<Category, 8> CATEGORY_ORDER = {
    Category::Structure, Category::Fonts, Category::Content, Category::Resources,
    Category::Annotations, Category::Metadata, Category::Security, Category::Modifications,
};

// \x00-\x08, \x0b, \x0c, \x0e-\x1f
bool isControlByte(unsigned char ch) {
    return ch <= 0x08 || ch == 0x0b || ch == 0x0c || (ch >= 0x0e && ch <= 0x1f);
}

bool isPageCategory(Category c) {
    return c == Category::Content || c == Category::Fonts ||
           c == Category::Resources || c == Category::Annotations;
}

double elapsedSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

std::vector<ValidationIssue> filterIssues(const std::vector<ValidationIssue>& issues,
                                          const std::function<bool(const ValidationIssue&)>& pred) {
    std::vector<ValidationIssue> out;
    std::copy_if(issues.begin(), issues.end(), std::back_inserter(out), pred);
    return out;
}

Result<std::optional<ValidationIssue>> passThrough(ValidationContext&, const ValidationRule&) {
    return std::optional<ValidationIssue>{};
}

} // namespace

//=============================================================================
// Enums
//=============================================================================

const char* toString(Severity severity) {
    switch (severity) {
        case Severity::Info:     return "INFO";
        case Severity::Warning:  return "WARNING";
        case Severity::Error:    return "ERROR";
        case Severity::Critical: return "CRITICAL";
    }
    return "INFO";
}

const char* toString(Category category) {
    switch (category) {
        case Category::Structure:     return "STRUCTURE";
        case Category::Fonts:         return "FONTS";
        case Category::Content:       return "CONTENT";
        case Category::Resources:     return "RESOURCES";
        case Category::Annotations:   return "ANNOTATIONS";
        case Category::Metadata:      return "METADATA";
        case Category::Security:      return "SECURITY";
        case Category::Modifications: return "MODIFICATIONS";
    }
    return "STRUCTURE";
}

const char* toString(ValidationResult result) {
    switch (result) {
        case ValidationResult::Valid:             return "VALID";
        case ValidationResult::ValidWithWarnings: return "VALID_WITH_WARNINGS";
        case ValidationResult::Invalid:           return "INVALID";
        case ValidationResult::Unknown:           return "UNKNOWN";
    }
    return "UNKNOWN";
}

//=============================================================================
// ValidationIssue / ValidationReport
//=============================================================================

std::optional<std::string> ValidationIssue::autoFixHint() const {
    if (autoFixAction) return autoFixAction;
    if (canAutoFix) return std::string("auto_fix_available");
    return std::nullopt;
}

std::string ValidationIssue::toString() const {
    std::string out = fmt::format("[{}] {}: {}", retext::toString(severity), code, message);
    if (page) out += fmt::format(" (page {})", *page);
    return out;
}

void ValidationReport::addIssue(ValidationIssue issue) {
    issues.push_back(std::move(issue));
    computeResult();
}

void ValidationReport::computeResult() {
    if (issues.empty()) {
        result = ValidationResult::Valid;
        return;
    }
    bool blocking = std::any_of(issues.begin(), issues.end(),
                                [](const ValidationIssue& i) { return i.isBlocking(); });
    result = blocking ? ValidationResult::Invalid : ValidationResult::ValidWithWarnings;
}

std::vector<ValidationIssue> ValidationReport::blockingIssues() const {
    return filterIssues(issues, [](const ValidationIssue& i) { return i.isBlocking(); });
}

std::vector<ValidationIssue> ValidationReport::warnings() const {
    return filterIssues(issues, [](const ValidationIssue& i) { return i.severity == Severity::Warning; });
}

std::vector<ValidationIssue> ValidationReport::errors() const {
    return filterIssues(issues, [](const ValidationIssue& i) {
        return i.severity == Severity::Error || i.severity == Severity::Critical;
    });
}

std::vector<ValidationIssue> ValidationReport::fixableIssues() const {
    return filterIssues(issues, [](const ValidationIssue& i) { return i.canAutoFix; });
}

std::vector<ValidationIssue> ValidationReport::byCategory(Category category) const {
    return filterIssues(issues, [category](const ValidationIssue& i) { return i.category == category; });
}

std::vector<ValidationIssue> ValidationReport::byPage(int page) const {
    return filterIssues(issues, [page](const ValidationIssue& i) { return i.page == page; });
}

std::string ValidationReport::summary() const {
    return fmt::format("Result: {}\n"
                       "Total issues: {}\n"
                       "  - Errors: {}\n"
                       "  - Warnings: {}\n"
                       "Pages checked: {}\n"
                       "Time: {:.2f}ms",
                       toString(result), issues.size(), errors().size(), warnings().size(),
                       pagesChecked, elapsedMs);
}

//=============================================================================
// ValidatorConfig / ValidationRule
//=============================================================================

bool ValidatorConfig::checks(Category category) const {
    switch (category) {
        case Category::Structure:     return checkStructure;
        case Category::Fonts:         return checkFonts;
        case Category::Content:       return checkContent;
        case Category::Resources:     return checkResources;
        case Category::Annotations:   return checkAnnotations;
        case Category::Metadata:      return checkMetadata;
        case Category::Security:      return checkSecurity;
        case Category::Modifications: return checkModifications;
    }
    return false;
}

ValidatorConfig ValidatorConfig::fromConfig(const Config& config) {
    ValidatorConfig c;
    c.checkStructure = config.get<bool>("validator.check-structure", c.checkStructure);
    c.checkFonts = config.get<bool>("validator.check-fonts", c.checkFonts);
    c.checkContent = config.get<bool>("validator.check-content", c.checkContent);
    c.checkResources = config.get<bool>("validator.check-resources", c.checkResources);
    c.checkAnnotations = config.get<bool>("validator.check-annotations", c.checkAnnotations);
    c.checkMetadata = config.get<bool>("validator.check-metadata", c.checkMetadata);
    c.checkSecurity = config.get<bool>("validator.check-security", c.checkSecurity);
    c.checkModifications = config.get<bool>("validator.check-modifications", c.checkModifications);
    c.allowMissingFonts = config.get<bool>("validator.allow-missing-fonts", c.allowMissingFonts);
    c.allowSubsetFonts = config.get<bool>("validator.allow-subset-fonts", c.allowSubsetFonts);
    c.allowEmptyPages = config.get<bool>("validator.allow-empty-pages", c.allowEmptyPages);

    int maxIssues = config.get<int>("validator.max-issues", static_cast<int>(c.maxIssues));
    c.maxIssues = maxIssues > 0 ? static_cast<size_t>(maxIssues) : c.maxIssues;
    c.timeoutMs = config.get<double>("validator.timeout-ms", c.timeoutMs);
    c.pagesToCheck = config.get<std::vector<int>>("validator.pages-to-check", c.pagesToCheck);
    return c;
}

Result<std::optional<ValidationIssue>> ValidationRule::check(ValidationContext& context) const {
    if (!enabled || !checkFn) return std::optional<ValidationIssue>{};
    return checkFn(context, *this);
}

ValidationIssue ValidationRule::issue(std::string message) const {
    ValidationIssue i;
    i.severity = severity;
    i.category = category;
    i.code = code;
    i.message = std::move(message);
    return i;
}

//=============================================================================
// PreSaveValidator
//=============================================================================

PreSaveValidator::PreSaveValidator(ValidatorConfig config)
    : _config(std::move(config)), _rng(std::random_device{}()) {
    registerDefaultRules();
}

void PreSaveValidator::registerDefaultRules() {
    auto bind = [this](auto method) -> RuleCheck {
        return [this, method](ValidationContext& ctx, const ValidationRule& rule) {
            return (this->*method)(ctx, rule);
        };
    };

    _rules = {
        {"STRUCT_001", "valid_page_tree", "The page tree is non-empty and every page is reachable",
         Category::Structure, Severity::Critical, true, bind(&PreSaveValidator::checkPageTree)},
        {"STRUCT_002", "valid_xref", "Sampled cross-reference entries resolve",
         Category::Structure, Severity::Error, true, bind(&PreSaveValidator::checkXref)},
        {"STRUCT_003", "no_circular_refs", "No circular object references",
         Category::Structure, Severity::Error, true, passThrough},

        {"FONT_001", "fonts_available", "Referenced fonts are standard or embedded",
         Category::Fonts, Severity::Error, true, bind(&PreSaveValidator::checkFontsAvailable)},
        {"FONT_002", "font_encoding", "Font encodings are valid",
         Category::Fonts, Severity::Warning, true, passThrough},
        {"FONT_003", "subset_complete", "Font subsets carry every used glyph",
         Category::Fonts, Severity::Warning, true, passThrough},

        {"CONTENT_001", "valid_content_streams", "Page text can be extracted",
         Category::Content, Severity::Error, true, bind(&PreSaveValidator::checkContentStreams)},
        {"CONTENT_002", "text_encoding", "Page text holds no control characters",
         Category::Content, Severity::Warning, true, bind(&PreSaveValidator::checkTextEncoding)},
        {"CONTENT_003", "no_empty_text", "No pages without text",
         Category::Content, Severity::Info, true, bind(&PreSaveValidator::checkEmptyText)},

        {"MOD_001", "modifications_valid", "Pending modifications are valid",
         Category::Modifications, Severity::Error, true, bind(&PreSaveValidator::checkModifications)},
        {"MOD_002", "overlays_consistent", "Overlays are consistent",
         Category::Modifications, Severity::Warning, true, passThrough},
    };
}

void PreSaveValidator::addRule(ValidationRule rule) {
    _rules.push_back(std::move(rule));
}

bool PreSaveValidator::removeRule(const std::string& code) {
    auto it = std::find_if(_rules.begin(), _rules.end(),
                           [&](const ValidationRule& r) { return r.code == code; });
    if (it == _rules.end()) return false;
    _rules.erase(it);
    return true;
}

bool PreSaveValidator::enableRule(const std::string& code) {
    for (auto& r : _rules) {
        if (r.code == code) {
            r.enabled = true;
            return true;
        }
    }
    return false;
}

bool PreSaveValidator::disableRule(const std::string& code) {
    for (auto& r : _rules) {
        if (r.code == code) {
            r.enabled = false;
            return true;
        }
    }
    return false;
}

const ValidationRule* PreSaveValidator::rule(const std::string& code) const {
    for (const auto& r : _rules) {
        if (r.code == code) return &r;
    }
    return nullptr;
}

void PreSaveValidator::addCustomCheck(CustomCheck check) {
    _customChecks.push_back(std::move(check));
}

void PreSaveValidator::recordModification(const std::string& type, int page,
                                          std::optional<std::string> originalContent,
                                          std::optional<std::string> newContent) {
    ModificationRecord record;
    record.type = type;
    record.page = page;
    record.originalContent = std::move(originalContent);
    record.newContent = std::move(newContent);
    record.timestamp = std::chrono::system_clock::now();
    _modifications.push_back(std::move(record));
}

//-----------------------------------------------------------------------------
// Running
//-----------------------------------------------------------------------------

ValidationContext PreSaveValidator::buildContext(const Document& document, std::optional<int> onlyPage) {
    ValidationContext ctx;
    ctx.document = &document;
    ctx.pageCount = document.pageCount();
    ctx.objectCount = document.objectCount();
    ctx.modifications = &_modifications;

    if (onlyPage) {
        ctx.pages.push_back(*onlyPage);
    } else if (!_config.pagesToCheck.empty()) {
        for (int p : _config.pagesToCheck) {
            if (p >= 0 && p < ctx.pageCount) ctx.pages.push_back(p);
            else ydebug("pages-to-check: page {} out of range", p);
        }
    } else {
        for (int p = 0; p < ctx.pageCount; ++p) ctx.pages.push_back(p);
    }

    for (int p : ctx.pages) {
        auto fonts = document.pageFonts(p);
        if (!fonts) {
            ywarn("buildContext: page {} fonts: {}", p, error_msg(fonts));
            continue;
        }
        for (const auto& f : *fonts) {
            ctx.fonts.insert(f.name);
            if (!f.extension.empty()) ctx.embeddedFonts.insert(f.name);
        }
    }
    return ctx;
}

std::optional<ValidationIssue> PreSaveValidator::runRule(const ValidationRule& rule, ValidationContext& context) {
    auto res = rule.check(context);
    if (res) return std::move(*res);

    yerror("Rule {} failed: {}", rule.code, error_msg(res));
    ValidationIssue issue;
    issue.severity = Severity::Warning;
    issue.category = rule.category;
    issue.code = rule.code + "_CHECK_ERROR";
    issue.message = fmt::format("rule {} could not run: {}", rule.code, error_msg(res));
    issue.details["error"] = error_msg(res);
    return issue;
}

bool PreSaveValidator::validateCategory(Category category, ValidationContext& context,
                                        ValidationReport& report) {
    for (const auto& rule : _rules) {
        if (rule.category != category || !rule.enabled) continue;

        if (report.issues.size() >= _config.maxIssues) {
            ValidationIssue cap;
            cap.severity = Severity::Warning;
            cap.category = Category::Structure;
            cap.code = "MAX_ISSUES_REACHED";
            cap.message = fmt::format("issue limit of {} reached", _config.maxIssues);
            report.addIssue(std::move(cap));
            return false;
        }

        if (auto issue = runRule(rule, context)) {
            report.addIssue(std::move(*issue));
        }
    }
    return true;
}

ValidationReport PreSaveValidator::validate(const Document& document, const std::optional<std::string>& path) {
    auto start = std::chrono::steady_clock::now();

    ValidationReport report;
    report.documentPath = path;

    ValidationContext context = buildContext(document, std::nullopt);

    for (Category category : CATEGORY_ORDER) {
        if (!_config.checks(category)) continue;
        if (elapsedSince(start) > _config.timeoutMs) {
            ValidationIssue timeout;
            timeout.severity = Severity::Warning;
            timeout.category = Category::Structure;
            timeout.code = "VALIDATION_TIMEOUT";
            timeout.message = fmt::format("validation stopped after {:.0f}ms before {}",
                                          _config.timeoutMs, toString(category));
            report.addIssue(std::move(timeout));
            break;
        }
        if (!validateCategory(category, context, report)) break;
    }

    for (const auto& check : _customChecks) {
        auto issues = check(document, context);
        if (!issues) {
            yerror("Custom check failed: {}", error_msg(issues));
            continue;
        }
        for (auto& issue : *issues) report.addIssue(std::move(issue));
    }

    report.pagesChecked = context.pageCount;
    report.fontsChecked = static_cast<int>(context.fonts.size());
    report.objectsChecked = context.objectCount;
    report.elapsedMs = elapsedSince(start);
    report.computeResult();

    yinfo("validate: {} ({} issues, {:.2f}ms)", toString(report.result), report.issues.size(),
          report.elapsedMs);
    return report;
}

ValidationReport PreSaveValidator::validatePage(const Document& document, int page) {
    auto start = std::chrono::steady_clock::now();

    ValidationReport report;
    report.pagesChecked = 1;

    auto reachable = (page >= 0 && page < document.pageCount())
        ? document.checkPage(page)
        : Err<void>(fmt::format("page {} out of range 0..{}", page, document.pageCount() - 1));

    if (!reachable) {
        ValidationIssue issue;
        issue.severity = Severity::Error;
        issue.category = Category::Structure;
        issue.code = "PAGE_VALIDATION_ERROR";
        issue.message = fmt::format("cannot validate page {}: {}", page, error_msg(reachable));
        issue.page = page;
        report.addIssue(std::move(issue));
    } else {
        ValidationContext context = buildContext(document, page);
        for (const auto& rule : _rules) {
            if (!rule.enabled || !isPageCategory(rule.category)) continue;
            if (auto issue = runRule(rule, context)) {
                issue->page = page;
                report.addIssue(std::move(*issue));
            }
        }
        report.fontsChecked = static_cast<int>(context.fonts.size());
    }

    report.elapsedMs = elapsedSince(start);
    report.computeResult();
    return report;
}

bool PreSaveValidator::quickValidate(const Document& document) {
    ValidationContext context = buildContext(document, std::nullopt);
    for (const auto& rule : _rules) {
        if (!rule.enabled || rule.severity != Severity::Critical) continue;
        auto issue = runRule(rule, context);
        if (issue && issue->isBlocking()) {
            ydebug("quickValidate: {}", issue->toString());
            return false;
        }
    }
    return true;
}

//-----------------------------------------------------------------------------
// Built-in checks
//-----------------------------------------------------------------------------

bool PreSaveValidator::isStandardFont(std::string_view name) {
    return std::find(STANDARD_FONTS.begin(), STANDARD_FONTS.end(), name) != STANDARD_FONTS.end();
}

bool PreSaveValidator::isFontAvailable(const std::string& name, bool embedded) const {
    auto plus = name.rfind('+');
    if (plus == std::string::npos) return embedded || isStandardFont(name);
    // "ABCDEF+Name" is an embedded subset
    return _config.allowSubsetFonts || isStandardFont(std::string_view(name).substr(plus + 1));
}

Result<std::optional<ValidationIssue>> PreSaveValidator::checkPageTree(ValidationContext& ctx,
                                                                       const ValidationRule& rule) {
    if (!ctx.document) {
        return std::optional(rule.issue("no document"));
    }
    if (ctx.pageCount <= 0) {
        auto issue = rule.issue("document has no pages");
        issue.suggestion = "the page tree is empty or corrupt";
        return std::optional(std::move(issue));
    }
    for (int p = 0; p < ctx.pageCount; ++p) {
        if (auto res = ctx.document->checkPage(p); !res) {
            auto issue = rule.issue(fmt::format("page {} is not reachable", p));
            issue.page = p;
            issue.details["error"] = error_msg(res);
            return std::optional(std::move(issue));
        }
    }
    return std::optional<ValidationIssue>{};
}

Result<std::optional<ValidationIssue>> PreSaveValidator::checkXref(ValidationContext& ctx,
                                                                   const ValidationRule& rule) {
    if (!ctx.document) return std::optional<ValidationIssue>{};

    int n = ctx.objectCount;
    if (n <= 0) {
        return std::optional(rule.issue("cross-reference table is empty or invalid"));
    }
    if (n == 1) {
        // Only the free head entry
        return std::optional<ValidationIssue>{};
    }

    std::uniform_int_distribution<int> pick(1, n - 1);
    int samples = std::min(10, n);
    for (int i = 0; i < samples; ++i) {
        int number = pick(_rng);
        if (auto res = ctx.document->resolveObject(number); !res) {
            auto issue = rule.issue(fmt::format("object {} cannot be resolved", number));
            issue.details["object"] = std::to_string(number);
            issue.details["error"] = error_msg(res);
            return std::optional(std::move(issue));
        }
    }
    return std::optional<ValidationIssue>{};
}

Result<std::optional<ValidationIssue>> PreSaveValidator::checkFontsAvailable(ValidationContext& ctx,
                                                                             const ValidationRule& rule) {
    std::vector<std::string> missing;
    for (const auto& name : ctx.fonts) {
        if (!isFontAvailable(name, ctx.embeddedFonts.count(name) > 0)) missing.push_back(name);
    }
    if (missing.empty()) return std::optional<ValidationIssue>{};

    std::vector<std::string> shown(missing.begin(), missing.begin() + std::min<size_t>(5, missing.size()));
    ValidationIssue issue;
    if (_config.allowMissingFonts) {
        issue = rule.issue(fmt::format("fonts not available: {}", fmt::join(shown, ", ")));
        issue.severity = Severity::Warning;
    } else {
        issue = rule.issue(fmt::format("required fonts not available: {}", fmt::join(shown, ", ")));
        issue.suggestion = "embed the fonts or switch to standard fonts";
    }
    issue.details["missing"] = fmt::format("{}", fmt::join(missing, ", "));
    return std::optional(std::move(issue));
}

Result<std::optional<ValidationIssue>> PreSaveValidator::checkContentStreams(ValidationContext& ctx,
                                                                             const ValidationRule& rule) {
    if (!ctx.document) return std::optional<ValidationIssue>{};
    for (int p : ctx.pages) {
        if (auto text = ctx.document->pageText(p); !text) {
            auto issue = rule.issue(fmt::format("content stream of page {} is unreadable", p));
            issue.page = p;
            issue.details["error"] = error_msg(text);
            return std::optional(std::move(issue));
        }
    }
    return std::optional<ValidationIssue>{};
}

Result<std::optional<ValidationIssue>> PreSaveValidator::checkTextEncoding(ValidationContext& ctx,
                                                                           const ValidationRule& rule) {
    if (!ctx.document) return std::optional<ValidationIssue>{};
    for (int p : ctx.pages) {
        auto text = ctx.document->pageText(p);
        if (!text) {
            // Reported by CONTENT_001
            continue;
        }
        auto bad = std::find_if(text->begin(), text->end(),
                                [](char c) { return isControlByte(static_cast<unsigned char>(c)); });
        if (bad != text->end()) {
            auto issue = rule.issue(fmt::format("control characters in the text of page {}", p));
            issue.page = p;
            issue.details["offset"] = std::to_string(bad - text->begin());
            return std::optional(std::move(issue));
        }
    }
    return std::optional<ValidationIssue>{};
}

Result<std::optional<ValidationIssue>> PreSaveValidator::checkEmptyText(ValidationContext& ctx,
                                                                        const ValidationRule& rule) {
    if (!ctx.document || _config.allowEmptyPages) return std::optional<ValidationIssue>{};
    for (int p : ctx.pages) {
        auto text = ctx.document->pageText(p);
        if (text && text->find_first_not_of(" \t\r\n") == std::string::npos) {
            auto issue = rule.issue(fmt::format("page {} has no text", p));
            issue.page = p;
            return std::optional(std::move(issue));
        }
    }
    return std::optional<ValidationIssue>{};
}

std::vector<std::string> PreSaveValidator::validateModification(const ModificationRecord& mod,
                                                                const ValidationContext& context) const {
    std::vector<std::string> errors;
    if (mod.page < 0 || mod.page >= context.pageCount) {
        errors.push_back(fmt::format("page {} does not exist", mod.page));
    }
    if (mod.newContent) {
        if (mod.newContent->size() > MAX_MODIFICATION_BYTES) {
            errors.push_back("new content is too large");
        }
        if (!utf8::isValid(*mod.newContent)) {
            errors.push_back("new content is not valid UTF-8");
        }
    }
    return errors;
}

Result<std::optional<ValidationIssue>> PreSaveValidator::checkModifications(ValidationContext& ctx,
                                                                            const ValidationRule& rule) {
    if (!ctx.modifications || ctx.modifications->empty()) return std::optional<ValidationIssue>{};

    std::vector<const ModificationRecord*> invalid;
    for (auto& mod : *ctx.modifications) {
        if (mod.validated) continue;
        auto errors = validateModification(mod, ctx);
        if (errors.empty()) {
            mod.validated = true;
        } else {
            mod.errors = std::move(errors);
            invalid.push_back(&mod);
        }
    }
    if (invalid.empty()) return std::optional<ValidationIssue>{};

    auto issue = rule.issue(fmt::format("{} modifications invalid", invalid.size()));
    issue.details["invalid"] = std::to_string(invalid.size());
    for (size_t i = 0; i < invalid.size(); ++i) {
        issue.details[fmt::format("modification.{}", i)] =
            fmt::format("{} page {}: {}", invalid[i]->type, invalid[i]->page,
                        fmt::join(invalid[i]->errors, "; "));
    }
    return std::optional(std::move(issue));
}

} // namespace retext
