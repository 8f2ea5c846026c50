#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class IssueKind { SyntaxError, InfiniteLoop, ResourceHeavy, Warning };
enum class Severity { High, Medium, Low };

const char* to_string(IssueKind kind);
const char* to_string(Severity severity);

struct CodeIssue {
    IssueKind kind{IssueKind::Warning};
    Severity severity{Severity::Low};
    int line{0};
    std::string message;
    std::optional<std::string> suggestion;
};

struct AnalysisVerdict {
    std::string language;
    std::vector<CodeIssue> issues;
    std::vector<std::string> suggestions;
    bool should_execute{true};

    std::size_t count(Severity severity) const;
};

// should_execute is true only when no high-severity issue was raised.
void finalize_verdict(AnalysisVerdict& verdict);

nlohmann::json to_json(const CodeIssue& issue);
nlohmann::json to_json(const AnalysisVerdict& verdict);

// One static-analysis front-end per submission language.
// analyze() must return a verdict for any input and never throw.
class CodeAnalyzer {
public:
    virtual ~CodeAnalyzer() = default;
    virtual std::string language() const = 0;
    virtual AnalysisVerdict analyze(const std::string& code) const = 0;
};

class AnalyzerSet {
public:
    // The first analyzer added is the default.
    void add(std::unique_ptr<CodeAnalyzer> analyzer);
    const CodeAnalyzer* find(const std::string& language) const;
    const CodeAnalyzer& default_analyzer() const;
    std::vector<std::string> languages() const;

private:
    std::vector<std::unique_ptr<CodeAnalyzer>> analyzers_;
};

// python (default) and shell.
AnalyzerSet make_default_analyzers();
