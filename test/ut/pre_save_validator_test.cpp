//=============================================================================
// PreSaveValidator Tests
//
// Rules run against FakeDocument; every check goes through the Document
// interface so broken structure can be simulated without a PDF.
//=============================================================================

#include <boost/ut.hpp>
#include "harness/fake_document.h"

#include <retext/pre-save-validator.h>

#include <string>
#include <vector>

using namespace boost::ut;
using namespace retext;
using namespace retext::test;

namespace {

bool hasCode(const ValidationReport& report, const std::string& code) {
    return std::any_of(report.issues.begin(), report.issues.end(),
                       [&](const ValidationIssue& i) { return i.code == code; });
}

const ValidationIssue* findCode(const ValidationReport& report, const std::string& code) {
    for (const auto& i : report.issues) {
        if (i.code == code) return &i;
    }
    return nullptr;
}

} // namespace

suite validator_structure_tests = [] {
    "healthy document is valid"_test = [] {
        PreSaveValidator validator;
        auto doc = FakeDocument::withPages(3);
        auto report = validator.validate(doc, std::string("in.pdf"));
        expect(report.result == ValidationResult::Valid);
        expect(report.issues.empty());
        expect(report.pagesChecked == 3_i);
        expect(report.fontsChecked == 1_i);
        expect(report.objectsChecked == 20_i);
        expect(report.documentPath == std::optional<std::string>("in.pdf"));
    };

    "empty page tree is critical"_test = [] {
        PreSaveValidator validator;
        FakeDocument doc;
        auto report = validator.validate(doc);
        expect(report.result == ValidationResult::Invalid);
        auto* issue = findCode(report, "STRUCT_001");
        expect((issue != nullptr) >> fatal);
        expect(issue->severity == Severity::Critical);
        expect(issue->message == "document has no pages") << issue->message;
    };

    "unreachable page is reported with its number"_test = [] {
        PreSaveValidator validator;
        auto doc = FakeDocument::withPages(3);
        doc.pages[1].reachable = false;
        auto report = validator.validate(doc);
        auto* issue = findCode(report, "STRUCT_001");
        expect((issue != nullptr) >> fatal);
        expect(issue->message == "page 1 is not reachable") << issue->message;
        expect(issue->page == std::optional(1));
        expect(!report.isValid());
    };

    "unresolvable object fails the xref check"_test = [] {
        PreSaveValidator validator;
        validator.seed(7);
        auto doc = FakeDocument::withPages(1);
        doc.objects = 2;
        doc.brokenObjects = {1};
        auto report = validator.validate(doc);
        auto* issue = findCode(report, "STRUCT_002");
        expect((issue != nullptr) >> fatal);
        expect(issue->message == "object 1 cannot be resolved") << issue->message;
        expect(issue->details.at("object") == "1");
    };

    "empty xref is invalid"_test = [] {
        PreSaveValidator validator;
        auto doc = FakeDocument::withPages(1);
        doc.objects = 0;
        auto report = validator.validate(doc);
        auto* issue = findCode(report, "STRUCT_002");
        expect((issue != nullptr) >> fatal);
        expect(issue->message == "cross-reference table is empty or invalid");
    };
};

suite validator_font_tests = [] {
    "non-standard unembedded font is missing"_test = [] {
        PreSaveValidator validator;
        auto doc = FakeDocument::withPages(2);
        doc.pages[1].fonts = {{"Arial", ""}};
        auto report = validator.validate(doc);
        expect(report.result == ValidationResult::Invalid);
        auto* issue = findCode(report, "FONT_001");
        expect((issue != nullptr) >> fatal);
        expect(issue->severity == Severity::Error);
        expect(issue->details.at("missing") == "Arial");
        expect(issue->suggestion.has_value());
    };

    "missing fonts can be downgraded to a warning"_test = [] {
        ValidatorConfig config;
        config.allowMissingFonts = true;
        PreSaveValidator validator(config);
        auto doc = FakeDocument::withPages(1);
        doc.pages[0].fonts = {{"Arial", ""}};
        auto report = validator.validate(doc);
        expect(report.result == ValidationResult::ValidWithWarnings);
        expect(report.warnings().size() == 1_u);
    };

    "embedded fonts are available"_test = [] {
        PreSaveValidator validator;
        auto doc = FakeDocument::withPages(1);
        doc.pages[0].fonts = {{"Arial", "ttf"}, {"Times-Roman", ""}};
        auto report = validator.validate(doc);
        expect(report.result == ValidationResult::Valid);
        expect(report.fontsChecked == 2_i);
    };

    "subset fonts follow the subset setting"_test = [] {
        auto doc = FakeDocument::withPages(1);
        doc.pages[0].fonts = {{"ABCDEF+Arial", "cff"}, {"GHIJKL+Helvetica", "cff"}};

        PreSaveValidator lenient;
        expect(lenient.validate(doc).result == ValidationResult::Valid);

        ValidatorConfig config;
        config.allowSubsetFonts = false;
        PreSaveValidator strict(config);
        auto report = strict.validate(doc);
        auto* issue = findCode(report, "FONT_001");
        expect((issue != nullptr) >> fatal);
        // Subsets of the base 14 stay acceptable
        expect(issue->details.at("missing") == "ABCDEF+Arial") << issue->details.at("missing");
    };

    "standard font table"_test = [] {
        expect(PreSaveValidator::isStandardFont("Helvetica"));
        expect(PreSaveValidator::isStandardFont("Times-Roman"));
        expect(PreSaveValidator::isStandardFont("ZapfDingbats"));
        expect(!PreSaveValidator::isStandardFont("Arial"));
        expect(!PreSaveValidator::isStandardFont("helvetica"));
    };
};

suite validator_content_tests = [] {
    "unreadable content stream"_test = [] {
        PreSaveValidator validator;
        auto doc = FakeDocument::withPages(3);
        doc.pages[2].textError = true;
        auto report = validator.validate(doc);
        expect((report.issues.size() == 1_u) >> fatal);
        expect(report.issues[0].code == "CONTENT_001");
        expect(report.issues[0].message == "content stream of page 2 is unreadable");
        expect(report.byPage(2).size() == 1_u);
        expect(report.result == ValidationResult::Invalid);
    };

    "control characters are a warning"_test = [] {
        PreSaveValidator validator;
        auto doc = FakeDocument::withPages(1);
        doc.pages[0].text = "bad\x01text";
        auto report = validator.validate(doc);
        auto* issue = findCode(report, "CONTENT_002");
        expect((issue != nullptr) >> fatal);
        expect(issue->severity == Severity::Warning);
        expect(issue->details.at("offset") == "3");
        expect(report.result == ValidationResult::ValidWithWarnings);
    };

    "tab and newline are not control characters"_test = [] {
        PreSaveValidator validator;
        auto doc = FakeDocument::withPages(1);
        doc.pages[0].text = "line\tone\r\nline two";
        expect(validator.validate(doc).result == ValidationResult::Valid);
    };

    "empty pages only reported when disallowed"_test = [] {
        auto doc = FakeDocument::withPages(2);
        doc.pages[1].text = " \n ";

        PreSaveValidator lenient;
        expect(!hasCode(lenient.validate(doc), "CONTENT_003"));

        ValidatorConfig config;
        config.allowEmptyPages = false;
        PreSaveValidator strict(config);
        auto report = strict.validate(doc);
        auto* issue = findCode(report, "CONTENT_003");
        expect((issue != nullptr) >> fatal);
        expect(issue->severity == Severity::Info);
        expect(issue->page == std::optional(1));
        expect(report.result == ValidationResult::ValidWithWarnings);
    };
};

suite validator_modification_tests = [] {
    "bad modifications are collected into one issue"_test = [] {
        PreSaveValidator validator;
        auto doc = FakeDocument::withPages(3);
        validator.recordModification("replace_text", 0, std::string("old"), std::string("new"));
        validator.recordModification("replace_text", 7, std::string("old"), std::string("new"));
        validator.recordModification("replace_text", 1, std::string("old"), std::string("\xff\xfe"));
        validator.recordModification("replace_text", 2, std::nullopt, std::string(100001, 'a'));

        auto report = validator.validate(doc);
        auto* issue = findCode(report, "MOD_001");
        expect((issue != nullptr) >> fatal);
        expect(issue->message == "3 modifications invalid") << issue->message;
        expect(issue->details.at("invalid") == "3");

        const auto& mods = validator.modifications();
        expect((mods.size() == 4_u) >> fatal);
        expect(mods[0].validated);
        expect(!mods[1].validated);
        expect((mods[1].errors.size() == 1_u) >> fatal);
        expect(mods[1].errors[0] == "page 7 does not exist");
        expect(mods[2].errors[0] == "new content is not valid UTF-8");
        expect(mods[3].errors[0] == "new content is too large");
    };

    "clearing modifications clears the issue"_test = [] {
        PreSaveValidator validator;
        auto doc = FakeDocument::withPages(1);
        validator.recordModification("replace_text", 4);
        expect(hasCode(validator.validate(doc), "MOD_001"));
        validator.clearModifications();
        expect(validator.validate(doc).result == ValidationResult::Valid);
    };
};

suite validator_rule_tests = [] {
    "disabled rule is skipped"_test = [] {
        PreSaveValidator validator;
        auto doc = FakeDocument::withPages(1);
        doc.pages[0].fonts = {{"Arial", ""}};
        expect(validator.disableRule("FONT_001"));
        expect(validator.validate(doc).result == ValidationResult::Valid);
        expect(validator.enableRule("FONT_001"));
        expect(hasCode(validator.validate(doc), "FONT_001"));
        expect(!validator.disableRule("NOPE_001"));
    };

    "rules can be removed and added"_test = [] {
        PreSaveValidator validator;
        expect(validator.removeRule("FONT_001"));
        expect(!validator.removeRule("FONT_001"));
        expect(validator.rule("FONT_001") == nullptr);

        ValidationRule custom;
        custom.code = "META_001";
        custom.name = "has_title";
        custom.category = Category::Metadata;
        custom.severity = Severity::Info;
        custom.checkFn = [](ValidationContext& ctx, const ValidationRule& rule)
            -> Result<std::optional<ValidationIssue>> {
            return std::optional(rule.issue(fmt::format("{} pages without title", ctx.pageCount)));
        };
        validator.addRule(custom);

        auto report = validator.validate(FakeDocument::withPages(2));
        auto* issue = findCode(report, "META_001");
        expect((issue != nullptr) >> fatal);
        expect(issue->message == "2 pages without title");
        expect(issue->category == Category::Metadata);
        expect(report.result == ValidationResult::ValidWithWarnings);
    };

    "failing rule turns into a warning"_test = [] {
        PreSaveValidator validator;
        ValidationRule broken;
        broken.code = "SEC_001";
        broken.category = Category::Security;
        broken.severity = Severity::Critical;
        broken.checkFn = [](ValidationContext&, const ValidationRule&)
            -> Result<std::optional<ValidationIssue>> {
            return Err<std::optional<ValidationIssue>>("permissions dictionary unreadable");
        };
        validator.addRule(broken);

        auto report = validator.validate(FakeDocument::withPages(1));
        auto* issue = findCode(report, "SEC_001_CHECK_ERROR");
        expect((issue != nullptr) >> fatal);
        expect(issue->severity == Severity::Warning);
        expect(issue->details.at("error") == "permissions dictionary unreadable");
        expect(report.result == ValidationResult::ValidWithWarnings);
    };

    "custom checks add issues"_test = [] {
        PreSaveValidator validator;
        validator.addCustomCheck([](const Document& doc, const ValidationContext&)
                                     -> Result<std::vector<ValidationIssue>> {
            ValidationIssue issue;
            issue.severity = Severity::Warning;
            issue.code = "CUSTOM";
            issue.message = fmt::format("{} pages", doc.pageCount());
            issue.canAutoFix = true;
            return std::vector<ValidationIssue>{issue};
        });
        validator.addCustomCheck([](const Document&, const ValidationContext&)
                                     -> Result<std::vector<ValidationIssue>> {
            return Err<std::vector<ValidationIssue>>("checker crashed");
        });

        auto report = validator.validate(FakeDocument::withPages(4));
        expect((report.issues.size() == 1_u) >> fatal);
        expect(report.issues[0].message == "4 pages");
        expect(report.fixableIssues().size() == 1_u);
        expect(report.issues[0].autoFixHint() == std::optional<std::string>("auto_fix_available"));
    };

    "issue limit stops the run"_test = [] {
        ValidatorConfig config;
        config.maxIssues = 1;
        PreSaveValidator validator(config);
        FakeDocument doc;
        doc.objects = 0;
        auto report = validator.validate(doc);
        expect((report.issues.size() == 2_u) >> fatal);
        expect(report.issues[0].code == "STRUCT_001");
        expect(report.issues[1].code == "MAX_ISSUES_REACHED");
    };

    "timeout stops before the next category"_test = [] {
        ValidatorConfig config;
        config.timeoutMs = -1.0;
        PreSaveValidator validator(config);
        auto report = validator.validate(FakeDocument());
        expect((report.issues.size() == 1_u) >> fatal);
        expect(report.issues[0].code == "VALIDATION_TIMEOUT");
        expect(report.result == ValidationResult::ValidWithWarnings);
    };

    "category switches turn off whole groups"_test = [] {
        ValidatorConfig config;
        config.checkFonts = false;
        PreSaveValidator validator(config);
        auto doc = FakeDocument::withPages(1);
        doc.pages[0].fonts = {{"Arial", ""}};
        expect(validator.validate(doc).result == ValidationResult::Valid);
    };

    "pages to check limits the per-page rules"_test = [] {
        ValidatorConfig config;
        config.pagesToCheck = {1, 9};
        PreSaveValidator validator(config);
        auto doc = FakeDocument::withPages(2);
        doc.pages[0].fonts = {{"Arial", ""}};
        doc.pages[0].textError = true;
        auto report = validator.validate(doc);
        expect(report.result == ValidationResult::Valid);
        expect(report.fontsChecked == 1_i);
    };
};

suite validator_page_tests = [] {
    "validatePage checks one page"_test = [] {
        PreSaveValidator validator;
        auto doc = FakeDocument::withPages(3);
        doc.pages[0].fonts = {{"Arial", ""}};
        doc.pages[2].fonts = {{"Arial", ""}};

        auto clean = validator.validatePage(doc, 1);
        expect(clean.result == ValidationResult::Valid);
        expect(clean.pagesChecked == 1_i);

        auto dirty = validator.validatePage(doc, 2);
        expect((dirty.issues.size() == 1_u) >> fatal);
        expect(dirty.issues[0].code == "FONT_001");
        expect(dirty.issues[0].page == std::optional(2));
        expect(dirty.issues[0].toString().ends_with("(page 2)")) << dirty.issues[0].toString();
    };

    "validatePage rejects missing pages"_test = [] {
        PreSaveValidator validator;
        auto doc = FakeDocument::withPages(3);
        doc.pages[1].reachable = false;

        for (int page : {1, 5, -1}) {
            auto report = validator.validatePage(doc, page);
            expect((report.issues.size() == 1_u) >> fatal);
            expect(report.issues[0].code == "PAGE_VALIDATION_ERROR") << "page" << page;
            expect(report.result == ValidationResult::Invalid);
        }
    };

    "quickValidate runs critical rules only"_test = [] {
        PreSaveValidator validator;
        expect(validator.quickValidate(FakeDocument::withPages(1)));
        expect(!validator.quickValidate(FakeDocument()));

        auto doc = FakeDocument::withPages(1);
        doc.pages[0].fonts = {{"Arial", ""}};
        expect(validator.quickValidate(doc));
    };
};

suite validator_report_tests = [] {
    "issue formatting"_test = [] {
        ValidationIssue issue;
        issue.severity = Severity::Error;
        issue.code = "FONT_001";
        issue.message = "required fonts not available: Arial";
        expect(issue.toString() == "[ERROR] FONT_001: required fonts not available: Arial");
        issue.page = 2;
        expect(issue.toString() == "[ERROR] FONT_001: required fonts not available: Arial (page 2)");
        expect(!issue.autoFixHint().has_value());
        issue.autoFixAction = "embed_font";
        expect(issue.autoFixHint() == std::optional<std::string>("embed_font"));
    };

    "result follows the worst issue"_test = [] {
        ValidationReport report;
        report.computeResult();
        expect(report.result == ValidationResult::Valid);

        ValidationIssue info;
        info.severity = Severity::Info;
        report.addIssue(info);
        expect(report.result == ValidationResult::ValidWithWarnings);

        ValidationIssue critical;
        critical.severity = Severity::Critical;
        critical.category = Category::Fonts;
        report.addIssue(critical);
        expect(report.result == ValidationResult::Invalid);
        expect(report.blockingIssues().size() == 1_u);
        expect(report.errors().size() == 1_u);
        expect(report.byCategory(Category::Fonts).size() == 1_u);
    };

    "summary leads with the result"_test = [] {
        PreSaveValidator validator;
        auto report = validator.validate(FakeDocument());
        auto summary = report.summary();
        expect(summary.starts_with("Result: INVALID\n")) << summary;
        expect(summary.find("Total issues: 1") != std::string::npos);
    };
};
