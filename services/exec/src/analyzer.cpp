#include "analyzer.hpp"
#include "python_analyzer.hpp"
#include "shell_analyzer.hpp"
#include <stdexcept>

using json = nlohmann::json;

const char* to_string(IssueKind kind) {
    switch (kind) {
        case IssueKind::SyntaxError: return "syntax_error";
        case IssueKind::InfiniteLoop: return "infinite_loop";
        case IssueKind::ResourceHeavy: return "resource_heavy";
        case IssueKind::Warning: return "warning";
    }
    return "warning";
}

const char* to_string(Severity severity) {
    switch (severity) {
        case Severity::High: return "high";
        case Severity::Medium: return "medium";
        case Severity::Low: return "low";
    }
    return "low";
}

std::size_t AnalysisVerdict::count(Severity severity) const {
    std::size_t n = 0;
    for (const auto& issue : issues) {
        if (issue.severity == severity) ++n;
    }
    return n;
}

void finalize_verdict(AnalysisVerdict& verdict) {
    verdict.should_execute = verdict.count(Severity::High) == 0;
}

json to_json(const CodeIssue& issue) {
    return {
        {"type", to_string(issue.kind)},
        {"severity", to_string(issue.severity)},
        {"line", issue.line},
        {"message", issue.message},
        {"suggestion", issue.suggestion ? json(*issue.suggestion) : json(nullptr)}
    };
}

json to_json(const AnalysisVerdict& verdict) {
    json issues = json::array();
    for (const auto& issue : verdict.issues) issues.push_back(to_json(issue));
    return {
        {"language", verdict.language},
        {"should_execute", verdict.should_execute},
        {"issues", issues},
        {"suggestions", verdict.suggestions},
        {"analysis_summary", {
            {"total_issues", verdict.issues.size()},
            {"high_severity", verdict.count(Severity::High)},
            {"medium_severity", verdict.count(Severity::Medium)},
            {"low_severity", verdict.count(Severity::Low)}
        }}
    };
}

void AnalyzerSet::add(std::unique_ptr<CodeAnalyzer> analyzer) {
    if (!analyzer) throw std::invalid_argument("null analyzer");
    if (find(analyzer->language())) {
        throw std::invalid_argument("analyzer already registered for " + analyzer->language());
    }
    analyzers_.push_back(std::move(analyzer));
}

const CodeAnalyzer* AnalyzerSet::find(const std::string& language) const {
    for (const auto& a : analyzers_) {
        if (a->language() == language) return a.get();
    }
    return nullptr;
}

const CodeAnalyzer& AnalyzerSet::default_analyzer() const {
    if (analyzers_.empty()) throw std::logic_error("no analyzers registered");
    return *analyzers_.front();
}

std::vector<std::string> AnalyzerSet::languages() const {
    std::vector<std::string> out;
    for (const auto& a : analyzers_) out.push_back(a->language());
    return out;
}

AnalyzerSet make_default_analyzers() {
    AnalyzerSet set;
    set.add(std::make_unique<PythonAnalyzer>());
    set.add(std::make_unique<ShellAnalyzer>());
    return set;
}
