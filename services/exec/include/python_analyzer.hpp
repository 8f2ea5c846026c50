#pragma once
#include "analyzer.hpp"
#include <stdexcept>
#include <string>
#include <vector>

enum class PyTokenType { Name, Number, String, Op, Newline, Indent, Dedent, End };

struct PyToken {
    PyTokenType type{PyTokenType::End};
    std::string text;
    int line{0};
};

class PySyntaxError : public std::runtime_error {
public:
    PySyntaxError(int line, const std::string& msg) : std::runtime_error(msg), line_(line) {}
    int line() const { return line_; }

private:
    int line_;
};

enum class PyNodeKind {
    Module,
    While,
    For,
    If,
    Def,
    Class,
    Try,
    With,
    Match,
    Clause, // elif / else / except / finally / case, sibling of its owner
    Break,
    Continue,
    Return,
    Statement
};

// Statement-level syntax tree. Expressions stay as token runs.
struct PyNode {
    PyNodeKind kind{PyNodeKind::Statement};
    int line{0};
    std::string keyword;
    std::string name;            // def / class name
    std::vector<PyToken> tokens; // header for compound statements, whole statement otherwise
    std::vector<PyNode> body;
};

// Both throw PySyntaxError.
std::vector<PyToken> tokenize_python(const std::string& code);
PyNode parse_python(const std::string& code);

class PythonAnalyzer : public CodeAnalyzer {
public:
    std::string language() const override { return "python"; }
    AnalysisVerdict analyze(const std::string& code) const override;

private:
    void scan_loops(const std::vector<std::string>& lines, AnalysisVerdict& v) const;
    void scan_recursion(const std::vector<std::string>& lines, AnalysisVerdict& v) const;
    void scan_resources(const std::vector<std::string>& lines, AnalysisVerdict& v) const;
    void walk_tree(const PyNode& node, AnalysisVerdict& v) const;
    void suggest(const std::string& code, AnalysisVerdict& v) const;
};
