#pragma once

#include <retext/document.h>
#include <retext/result.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace retext {

class Config;

enum class Severity {
    Info,
    Warning,
    Error,
    Critical,
};

enum class Category {
    Structure,
    Fonts,
    Content,
    Resources,
    Annotations,
    Metadata,
    Security,
    Modifications,
};

enum class ValidationResult {
    Valid,
    ValidWithWarnings,
    Invalid,
    Unknown,
};

const char* toString(Severity severity);
const char* toString(Category category);
const char* toString(ValidationResult result);

//=============================================================================
// ValidationIssue
//=============================================================================
struct ValidationIssue {
    Severity severity = Severity::Info;
    Category category = Category::Structure;
    std::string code;
    std::string message;

    std::optional<int> page;
    std::optional<std::string> location;

    std::map<std::string, std::string> details;
    std::optional<std::string> suggestion;

    bool canAutoFix = false;
    std::optional<std::string> autoFixAction;

    bool isBlocking() const { return severity == Severity::Error || severity == Severity::Critical; }

    // autoFixAction, or "auto_fix_available" when fixable without one
    std::optional<std::string> autoFixHint() const;

    // "[ERROR] FONT_001: message (page 2)"
    std::string toString() const;
};

//=============================================================================
// ValidationReport
//=============================================================================
struct ValidationReport {
    ValidationResult result = ValidationResult::Unknown;
    std::vector<ValidationIssue> issues;

    int pagesChecked = 0;
    int fontsChecked = 0;
    int objectsChecked = 0;
    double elapsedMs = 0.0;

    std::optional<std::string> documentPath;

    void addIssue(ValidationIssue issue);

    // INVALID on any blocking issue, VALID_WITH_WARNINGS on any issue
    void computeResult();

    bool isValid() const {
        return result == ValidationResult::Valid || result == ValidationResult::ValidWithWarnings;
    }

    std::vector<ValidationIssue> blockingIssues() const;
    std::vector<ValidationIssue> warnings() const;
    std::vector<ValidationIssue> errors() const;
    std::vector<ValidationIssue> fixableIssues() const;
    std::vector<ValidationIssue> byCategory(Category category) const;
    std::vector<ValidationIssue> byPage(int page) const;

    std::string summary() const;
};

struct ValidatorConfig {
    bool checkStructure = true;
    bool checkFonts = true;
    bool checkContent = true;
    bool checkResources = true;
    bool checkAnnotations = true;
    bool checkMetadata = true;
    bool checkSecurity = true;
    bool checkModifications = true;

    bool allowMissingFonts = false;
    bool allowSubsetFonts = true;
    bool allowEmptyPages = true;

    size_t maxIssues = 100;
    double timeoutMs = 30000.0;

    // Empty means every page
    std::vector<int> pagesToCheck;

    bool checks(Category category) const;

    static ValidatorConfig fromConfig(const Config& config);
};

struct ModificationRecord {
    std::string type;
    int page = 0;
    std::optional<std::string> originalContent;
    std::optional<std::string> newContent;
    std::chrono::system_clock::time_point timestamp;
    bool validated = false;
    std::vector<std::string> errors;
};

//=============================================================================
// ValidationContext - document snapshot the rules run against
//=============================================================================
struct ValidationContext {
    const Document* document = nullptr;
    int pageCount = 0;
    std::vector<int> pages;                  // pages the per-page rules visit
    std::set<std::string> fonts;             // font inventory of those pages
    std::set<std::string> embeddedFonts;     // the subset of fonts with an embedded program
    int objectCount = 0;
    std::vector<ModificationRecord>* modifications = nullptr;
};

struct ValidationRule;

using RuleCheck = std::function<Result<std::optional<ValidationIssue>>(ValidationContext&,
                                                                      const ValidationRule&)>;

struct ValidationRule {
    std::string code;
    std::string name;
    std::string description;
    Category category = Category::Structure;
    Severity severity = Severity::Error;
    bool enabled = true;
    RuleCheck checkFn;

    // nullopt when disabled, without a check, or when nothing is wrong
    Result<std::optional<ValidationIssue>> check(ValidationContext& context) const;

    // Issue carrying this rule's code, category and severity
    ValidationIssue issue(std::string message) const;
};

using CustomCheck = std::function<Result<std::vector<ValidationIssue>>(const Document&,
                                                                      const ValidationContext&)>;

//=============================================================================
// PreSaveValidator
//
// Rule engine run over a document and the pending modifications before
// they are written. Rules run category by category; a failing rule check
// turns into a WARNING issue instead of stopping the run.
//=============================================================================
class PreSaveValidator {
public:
    explicit PreSaveValidator(ValidatorConfig config = {});

    // Built-in rules are bound to this instance
    PreSaveValidator(const PreSaveValidator&) = delete;
    PreSaveValidator& operator=(const PreSaveValidator&) = delete;

    const ValidatorConfig& config() const { return _config; }

    ValidationReport validate(const Document& document,
                              const std::optional<std::string>& path = std::nullopt);

    // CONTENT, FONTS, RESOURCES and ANNOTATIONS rules for one page
    ValidationReport validatePage(const Document& document, int page);

    // CRITICAL rules only; false on the first blocking issue
    bool quickValidate(const Document& document);

    //-------------------------------------------------------------------------
    // Rules
    //-------------------------------------------------------------------------
    void addRule(ValidationRule rule);
    bool removeRule(const std::string& code);
    bool enableRule(const std::string& code);
    bool disableRule(const std::string& code);
    const ValidationRule* rule(const std::string& code) const;
    const std::vector<ValidationRule>& rules() const { return _rules; }

    void addCustomCheck(CustomCheck check);

    //-------------------------------------------------------------------------
    // Pending modifications
    //-------------------------------------------------------------------------
    void recordModification(const std::string& type, int page,
                            std::optional<std::string> originalContent = std::nullopt,
                            std::optional<std::string> newContent = std::nullopt);
    void clearModifications() { _modifications.clear(); }
    const std::vector<ModificationRecord>& modifications() const { return _modifications; }

    // Object sampling of the xref rule
    void seed(uint32_t value) { _rng.seed(value); }

    static bool isStandardFont(std::string_view name);

    static constexpr size_t MAX_MODIFICATION_BYTES = 100000;

private:
    void registerDefaultRules();

    ValidationContext buildContext(const Document& document, std::optional<int> onlyPage);
    // false once the issue limit stops the run
    bool validateCategory(Category category, ValidationContext& context, ValidationReport& report);
    std::optional<ValidationIssue> runRule(const ValidationRule& rule, ValidationContext& context);

    bool isFontAvailable(const std::string& name, bool embedded) const;
    std::vector<std::string> validateModification(const ModificationRecord& mod,
                                                  const ValidationContext& context) const;

    Result<std::optional<ValidationIssue>> checkPageTree(ValidationContext& ctx, const ValidationRule& rule);
    Result<std::optional<ValidationIssue>> checkXref(ValidationContext& ctx, const ValidationRule& rule);
    Result<std::optional<ValidationIssue>> checkFontsAvailable(ValidationContext& ctx, const ValidationRule& rule);
    Result<std::optional<ValidationIssue>> checkContentStreams(ValidationContext& ctx, const ValidationRule& rule);
    Result<std::optional<ValidationIssue>> checkTextEncoding(ValidationContext& ctx, const ValidationRule& rule);
    Result<std::optional<ValidationIssue>> checkEmptyText(ValidationContext& ctx, const ValidationRule& rule);
    Result<std::optional<ValidationIssue>> checkModifications(ValidationContext& ctx, const ValidationRule& rule);

    ValidatorConfig _config;
    std::vector<ValidationRule> _rules;
    std::vector<CustomCheck> _customChecks;
    std::vector<ModificationRecord> _modifications;
    std::mt19937 _rng;
};

} // namespace retext
