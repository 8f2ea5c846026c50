#pragma once
#include "analyzer.hpp"
#include <stdexcept>
#include <string>
#include <vector>

class ShSyntaxError : public std::runtime_error {
public:
    ShSyntaxError(int line, const std::string& msg) : std::runtime_error(msg), line_(line) {}
    int line() const { return line_; }

private:
    int line_;
};

enum class ShNodeKind { Script, Loop, If, Case, Group, Function, Command };

struct ShNode {
    ShNodeKind kind{ShNodeKind::Command};
    int line{0};
    std::string keyword;            // while / until / for / if / case / { / (
    std::vector<std::string> words; // loop condition or command words
    std::vector<ShNode> body;
};

// Throws ShSyntaxError.
ShNode parse_shell(const std::string& script);

class ShellAnalyzer : public CodeAnalyzer {
public:
    std::string language() const override { return "shell"; }
    AnalysisVerdict analyze(const std::string& code) const override;

private:
    void scan_loops(const std::vector<std::string>& lines, AnalysisVerdict& v) const;
    void scan_resources(const std::vector<std::string>& lines, AnalysisVerdict& v) const;
    void walk_tree(const ShNode& node, AnalysisVerdict& v) const;
};
