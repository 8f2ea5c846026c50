#include "shell_analyzer.hpp"
#include "util.hpp"
#include <algorithm>
#include <regex>
#include <cctype>
#include <iterator>

namespace {

const std::size_t kMaxScanLine = 2000;
const std::size_t kMaxNesting = 100;

enum class ShTokKind { Word, Op, Newline };

struct ShToken {
    ShTokKind kind{ShTokKind::Word};
    std::string text;
    int line{0};
};

bool is_op_char(char c) {
    return c == ';' || c == '&' || c == '|' || c == '(' || c == ')' || c == '<' || c == '>';
}

class Lexer {
public:
    explicit Lexer(const std::string& src) : src_(src) {}

    std::vector<ShToken> run() {
        while (pos_ < src_.size()) {
            char c = src_[pos_];
            if (c == '\n') {
                out_.push_back({ShTokKind::Newline, "\n", line_});
                ++pos_;
                ++line_;
                read_heredocs();
                continue;
            }
            if (c == ' ' || c == '\t' || c == '\r') { ++pos_; continue; }
            if (c == '#') {
                while (pos_ < src_.size() && src_[pos_] != '\n') ++pos_;
                continue;
            }
            if (c == '\\' && pos_ + 1 < src_.size() && src_[pos_ + 1] == '\n') {
                pos_ += 2;
                ++line_;
                continue;
            }
            if (c == '(' && pos_ + 1 < src_.size() && src_[pos_ + 1] == '(' && at_word_boundary()) {
                read_arith();
                continue;
            }
            if (is_op_char(c)) { read_op(); continue; }
            read_word();
        }
        return std::move(out_);
    }

private:
    bool at_word_boundary() const {
        return out_.empty() || out_.back().kind != ShTokKind::Word || pos_ == 0 ||
               src_[pos_ - 1] == ' ' || src_[pos_ - 1] == '\t' || src_[pos_ - 1] == '\n' ||
               is_op_char(src_[pos_ - 1]);
    }

    [[noreturn]] void unterminated(int line, const std::string& what) {
        throw ShSyntaxError(line, "unexpected EOF while looking for matching `" + what + "'");
    }

    void read_op() {
        static const char* two[] = {"&&", "||", ";;", "|&", ">>", "<<", ">&", "<&", "&>"};
        for (const char* op : two) {
            if (src_.compare(pos_, 2, op) == 0) {
                out_.push_back({ShTokKind::Op, op, line_});
                pos_ += 2;
                if (std::string(op) == "<<") read_heredoc_word();
                return;
            }
        }
        out_.push_back({ShTokKind::Op, std::string(1, src_[pos_]), line_});
        ++pos_;
    }

    void read_heredoc_word() {
        bool strip_tabs = false;
        if (pos_ < src_.size() && src_[pos_] == '-') { strip_tabs = true; ++pos_; }
        while (pos_ < src_.size() && (src_[pos_] == ' ' || src_[pos_] == '\t')) ++pos_;
        std::string delim;
        while (pos_ < src_.size() && !std::isspace(static_cast<unsigned char>(src_[pos_])) && !is_op_char(src_[pos_])) {
            char c = src_[pos_++];
            if (c != '\'' && c != '"' && c != '\\') delim.push_back(c);
        }
        if (delim.empty()) throw ShSyntaxError(line_, "syntax error near unexpected token `newline'");
        pending_heredocs_.push_back({delim, strip_tabs});
    }

    // Heredoc bodies start on the line after the redirection.
    void read_heredocs() {
        for (const auto& doc : pending_heredocs_) {
            while (pos_ < src_.size()) {
                std::size_t eol = src_.find('\n', pos_);
                std::string line = src_.substr(pos_, eol == std::string::npos ? std::string::npos : eol - pos_);
                pos_ = eol == std::string::npos ? src_.size() : eol + 1;
                ++line_;
                if (!line.empty() && line.back() == '\r') line.pop_back();
                if (doc.second) line.erase(0, line.find_first_not_of('\t') == std::string::npos ? line.size() : line.find_first_not_of('\t'));
                if (line == doc.first) break;
            }
        }
        pending_heredocs_.clear();
    }

    void read_arith() {
        int start_line = line_;
        std::string word = "((";
        pos_ += 2;
        int depth = 2;
        while (depth > 0) {
            if (pos_ >= src_.size()) unterminated(start_line, "))");
            char c = src_[pos_++];
            if (c == '\n') ++line_;
            if (c == '(') ++depth;
            if (c == ')') --depth;
            word.push_back(c);
        }
        out_.push_back({ShTokKind::Word, word, start_line});
    }

    void read_quoted(std::string& word, char quote) {
        int start_line = line_;
        word.push_back(src_[pos_++]);
        while (true) {
            if (pos_ >= src_.size()) unterminated(start_line, std::string(1, quote));
            char c = src_[pos_++];
            word.push_back(c);
            if (c == '\n') ++line_;
            if (c == '\\' && quote != '\'' && pos_ < src_.size()) {
                if (src_[pos_] == '\n') ++line_;
                word.push_back(src_[pos_++]);
                continue;
            }
            if (c == quote) return;
        }
    }

    // $( ... ) and ${ ... }, nesting and quotes respected.
    void read_expansion(std::string& word, char open, char close) {
        int start_line = line_;
        word.push_back(src_[pos_++]); // '$'
        word.push_back(src_[pos_++]); // open
        int depth = 1;
        while (depth > 0) {
            if (pos_ >= src_.size()) unterminated(start_line, std::string(1, close));
            char c = src_[pos_];
            if (c == '\'' || c == '"' || c == '`') { read_quoted(word, c); continue; }
            ++pos_;
            word.push_back(c);
            if (c == '\n') ++line_;
            if (c == '\\' && pos_ < src_.size()) { word.push_back(src_[pos_++]); continue; }
            if (c == open) ++depth;
            if (c == close) --depth;
        }
    }

    void read_word() {
        int start_line = line_;
        std::string word;
        while (pos_ < src_.size()) {
            char c = src_[pos_];
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || is_op_char(c)) break;
            if (c == '\'' || c == '"' || c == '`') { read_quoted(word, c); continue; }
            if (c == '$' && pos_ + 1 < src_.size() && src_[pos_ + 1] == '(') { read_expansion(word, '(', ')'); continue; }
            if (c == '$' && pos_ + 1 < src_.size() && src_[pos_ + 1] == '{') { read_expansion(word, '{', '}'); continue; }
            if (c == '\\' && pos_ + 1 < src_.size()) {
                word.push_back(c);
                word.push_back(src_[pos_ + 1]);
                pos_ += 2;
                continue;
            }
            word.push_back(c);
            ++pos_;
        }
        out_.push_back({ShTokKind::Word, word, start_line});
    }

    const std::string& src_;
    std::size_t pos_{0};
    int line_{1};
    std::vector<ShToken> out_;
    std::vector<std::pair<std::string, bool>> pending_heredocs_;
};

class Parser {
public:
    explicit Parser(std::vector<ShToken> toks) : toks_(std::move(toks)) {}

    ShNode parse() {
        Frame root;
        root.node.kind = ShNodeKind::Script;
        root.node.line = 1;
        root.stage = "body";
        frames_.push_back(std::move(root));

        for (std::size_t i = 0; i < toks_.size(); ++i) {
            const ShToken& t = toks_[i];
            if (t.kind == ShTokKind::Newline) { separator(); continue; }
            if (t.kind == ShTokKind::Op) { op(t, i); continue; }
            word(t);
        }
        flush();
        if (frames_.size() > 1) {
            const Frame& open = frames_.back();
            throw ShSyntaxError(open.node.line, "syntax error: unexpected end of file (unclosed '" +
                                                    open.node.keyword + "' from line " +
                                                    std::to_string(open.node.line) + ")");
        }
        return std::move(frames_.front().node);
    }

private:
    struct Frame {
        ShNode node;
        std::string stage; // cond / header / body / else / subject / pattern
        bool stage_has_cmd{false};
    };

    Frame& top() { return frames_.back(); }

    [[noreturn]] void unexpected(const ShToken& t) {
        throw ShSyntaxError(t.line, "syntax error near unexpected token `" + t.text + "'");
    }

    void flush() {
        if (cur_.words.empty()) return;
        Frame& f = top();
        if (f.stage == "cond") {
            f.node.words.insert(f.node.words.end(), cur_.words.begin(), cur_.words.end());
        } else if (f.stage == "header" || f.stage == "subject" || f.stage == "pattern") {
            // loop lists, case subjects and patterns carry no commands
        } else {
            f.node.body.push_back(cur_);
        }
        f.stage_has_cmd = true;
        cur_ = ShNode{};
    }

    void separator() {
        flush();
        cmd_start_ = true;
    }

    void push(ShNodeKind kind, const ShToken& t, const std::string& stage) {
        if (frames_.size() >= kMaxNesting) throw ShSyntaxError(t.line, "nesting too deep");
        flush();
        Frame f;
        f.node.kind = kind;
        f.node.line = t.line;
        f.node.keyword = t.text;
        f.stage = stage;
        frames_.push_back(std::move(f));
        cmd_start_ = true;
    }

    void pop(const ShToken& t) {
        flush();
        if (!top().stage_has_cmd) unexpected(t);
        ShNode done = std::move(top().node);
        frames_.pop_back();
        top().node.body.push_back(std::move(done));
        top().stage_has_cmd = true;
        cmd_start_ = false;
    }

    void next_stage(const std::string& stage) {
        flush();
        top().stage = stage;
        top().stage_has_cmd = false;
        cmd_start_ = true;
    }

    void op(const ShToken& t, std::size_t& i) {
        const std::string& o = t.text;
        if (o == ";" || o == "&" || o == "&&" || o == "||" || o == "|" || o == "|&") {
            if (o != ";" && o != "&" && cur_.words.empty() && cmd_start_) unexpected(t);
            if (top().stage == "pattern") { cmd_start_ = true; return; }
            separator();
            return;
        }
        if (o == ";;") {
            if (top().node.kind != ShNodeKind::Case || top().stage != "body") unexpected(t);
            flush();
            top().stage = "pattern";
            cmd_start_ = true;
            return;
        }
        if (o == "(") {
            if (top().stage == "pattern") return;
            if (!pending_function_.empty() || (cur_.words.size() == 1 && !cmd_start_)) {
                // name ( ) { ... }
                if (i + 1 >= toks_.size() || toks_[i + 1].text != ")") unexpected(t);
                ++i;
                if (pending_function_.empty()) pending_function_ = cur_.words.front();
                cur_ = ShNode{};
                cmd_start_ = true;
                return;
            }
            if (!cmd_start_) unexpected(t);
            push(ShNodeKind::Group, t, "body");
            return;
        }
        if (o == ")") {
            if (top().node.kind == ShNodeKind::Case && top().stage == "pattern") {
                cur_ = ShNode{};
                next_stage("body");
                return;
            }
            if (top().node.kind == ShNodeKind::Group && top().node.keyword == "(") {
                pop(t);
                return;
            }
            unexpected(t);
        }
        // redirections: the target word becomes part of the current command
    }

    void word(const ShToken& t) {
        const std::string& w = t.text;
        Frame& f = top();

        if (f.node.kind == ShNodeKind::Case && f.stage == "subject") {
            if (w == "in") next_stage("pattern");
            return;
        }
        if (f.node.kind == ShNodeKind::Case && f.stage == "pattern") {
            if (w == "esac") { f.stage = "body"; f.stage_has_cmd = true; pop(t); return; }
            return;
        }
        if (f.stage == "header") {
            if (w == "do" && cmd_start_) { next_stage("body"); return; }
            f.node.words.push_back(w);
            cmd_start_ = false;
            return;
        }

        if (!pending_function_.empty() && w != "{") unexpected(t);

        if (cmd_start_) {
            if (w == "if") { push(ShNodeKind::If, t, "cond"); return; }
            if (w == "then") {
                if (f.node.kind != ShNodeKind::If || f.stage != "cond") unexpected(t);
                flush();
                if (!top().stage_has_cmd) unexpected(t);
                next_stage("body");
                return;
            }
            if (w == "elif" || w == "else") {
                if (f.node.kind != ShNodeKind::If || f.stage != "body") unexpected(t);
                flush();
                if (!top().stage_has_cmd) unexpected(t);
                next_stage(w == "elif" ? "cond" : "else");
                return;
            }
            if (w == "fi") {
                if (f.node.kind != ShNodeKind::If || (f.stage != "body" && f.stage != "else")) unexpected(t);
                pop(t);
                return;
            }
            if (w == "while" || w == "until") { push(ShNodeKind::Loop, t, "cond"); return; }
            if (w == "for" || w == "select") { push(ShNodeKind::Loop, t, "header"); return; }
            if (w == "do") {
                if (f.node.kind != ShNodeKind::Loop || f.stage != "cond") unexpected(t);
                flush();
                if (!top().stage_has_cmd) unexpected(t);
                next_stage("body");
                return;
            }
            if (w == "done") {
                if (f.node.kind != ShNodeKind::Loop || f.stage != "body") unexpected(t);
                pop(t);
                return;
            }
            if (w == "case") { push(ShNodeKind::Case, t, "subject"); return; }
            if (w == "esac") {
                if (f.node.kind != ShNodeKind::Case || f.stage != "body") unexpected(t);
                flush();
                f.stage_has_cmd = true;
                pop(t);
                return;
            }
            if (w == "{") {
                bool fn = !pending_function_.empty();
                push(fn ? ShNodeKind::Function : ShNodeKind::Group, t, "body");
                if (fn) top().node.words.push_back(pending_function_);
                pending_function_.clear();
                return;
            }
            if (w == "}") {
                if (f.node.kind != ShNodeKind::Group && f.node.kind != ShNodeKind::Function) unexpected(t);
                if (f.node.keyword != "{") unexpected(t);
                pop(t);
                return;
            }
            if (w == "function") { expect_function_name_ = true; cmd_start_ = true; return; }
            if (w == "!") return;
            if (expect_function_name_) {
                expect_function_name_ = false;
                pending_function_ = w;
                return;
            }
        }
        if (cur_.words.empty()) cur_.line = t.line;
        cur_.kind = ShNodeKind::Command;
        cur_.words.push_back(w);
        cmd_start_ = false;
    }

    std::vector<ShToken> toks_;
    std::vector<Frame> frames_;
    ShNode cur_;
    bool cmd_start_{true};
    bool expect_function_name_{false};
    std::string pending_function_;
};

bool contains_escape(const std::vector<ShNode>& body) {
    for (const auto& n : body) {
        if (n.kind == ShNodeKind::Command && !n.words.empty() &&
            (n.words.front() == "break" || n.words.front() == "exit")) {
            return true;
        }
        if (contains_escape(n.body)) return true;
    }
    return false;
}

int loop_depth(const ShNode& node) {
    int inner = 0;
    for (const auto& child : node.body) inner = std::max(inner, loop_depth(child));
    return inner + (node.kind == ShNodeKind::Loop ? 1 : 0);
}

std::string strip_spaces(const std::string& s) {
    std::string out;
    for (char c : s) if (c != ' ' && c != '\t') out.push_back(c);
    return out;
}

bool unconditioned(const ShNode& loop) {
    const auto& w = loop.words;
    if (loop.keyword == "while") {
        if (w.size() == 1 && (w[0] == "true" || w[0] == ":" || strip_spaces(w[0]) == "((1))")) return true;
        if (w.size() == 3 && ((w[0] == "[" && w[2] == "]") || (w[0] == "[[" && w[2] == "]]")) && w[1] == "1") return true;
        return false;
    }
    if (loop.keyword == "until") return w.size() == 1 && w[0] == "false";
    if (loop.keyword == "for") return w.size() == 1 && strip_spaces(w[0]) == "((;;))";
    return false;
}

} // namespace

ShNode parse_shell(const std::string& script) {
    std::size_t nul = script.find('\0');
    if (nul != std::string::npos) {
        int line = 1 + static_cast<int>(std::count(script.begin(), script.begin() + nul, '\n'));
        throw ShSyntaxError(line, "script contains a null byte");
    }
    return Parser(Lexer(script).run()).parse();
}

AnalysisVerdict ShellAnalyzer::analyze(const std::string& code) const {
    AnalysisVerdict v;
    v.language = language();
    try {
        ShNode tree;
        try {
            tree = parse_shell(code);
        } catch (const ShSyntaxError& e) {
            v.issues.push_back({IssueKind::SyntaxError, Severity::High, e.line(),
                                std::string("Syntax error: ") + e.what(),
                                std::string("Fix syntax errors before execution")});
            v.should_execute = false;
            return v;
        }
        auto lines = split_lines(code);
        scan_loops(lines, v);
        scan_resources(lines, v);
        walk_tree(tree, v);
        bool loops = std::any_of(v.issues.begin(), v.issues.end(),
                                 [](const CodeIssue& i) { return i.kind == IssueKind::InfiniteLoop; });
        if (loops) {
            v.suggestions.push_back("Bound the loop, e.g. for i in $(seq 1 100); do ...; done");
            v.suggestions.push_back("Wrap long-running commands with timeout(1), e.g. timeout 60 <cmd>");
        }
    } catch (const std::exception& e) {
        v.issues.push_back({IssueKind::Warning, Severity::High, 0,
                            std::string("Analysis aborted: ") + e.what(),
                            std::string("Simplify the submission or resubmit with allow_risky")});
    }
    finalize_verdict(v);
    return v;
}

void ShellAnalyzer::scan_loops(const std::vector<std::string>& lines, AnalysisVerdict& v) const {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(\bwhile\s+(true|:)\s*(;|$|do\b))"),
        std::regex(R"(\bwhile\s+\[\s*1\s*\]\s*(;|$))"),
        std::regex(R"(\buntil\s+false\s*(;|$|do\b))"),
        std::regex(R"(\bfor\s*\(\(\s*;\s*;\s*\)\))"),
    };
    static const std::regex fork_bomb(R"(([A-Za-z_]\w*|:)\s*\(\)\s*\{\s*\1\s*\|\s*\1\s*&\s*\}\s*;?\s*\1)");
    static const std::regex do_word(R"(\bdo\b)");
    static const std::regex done_word(R"(\bdone\b)");
    static const std::regex escape(R"(\b(break|exit|return)\b)");

    auto count = [](const std::string& s, const std::regex& re) {
        return static_cast<int>(std::distance(std::sregex_iterator(s.begin(), s.end(), re), std::sregex_iterator()));
    };

    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].size() > kMaxScanLine) continue;
        int lineno = static_cast<int>(i) + 1;
        if (std::regex_search(lines[i], fork_bomb)) {
            v.issues.push_back({IssueKind::InfiniteLoop, Severity::High, lineno,
                                "Fork bomb pattern detected",
                                std::string("Remove the self-replicating function")});
            continue;
        }
        for (const auto& re : patterns) {
            std::smatch m;
            if (!std::regex_search(lines[i], m, re)) continue;

            // Walk forward until the loop's done closes it.
            std::string text = m.suffix().str();
            bool has_escape = false;
            int depth = 0;
            bool opened = false;
            std::size_t j = i;
            while (true) {
                if (text.size() <= kMaxScanLine) {
                    has_escape = has_escape || std::regex_search(text, escape);
                    depth += count(text, do_word);
                    opened = opened || depth > 0;
                    depth -= count(text, done_word);
                }
                if ((opened && depth <= 0) || ++j >= lines.size()) break;
                text = lines[j];
            }
            if (!has_escape) {
                v.issues.push_back({IssueKind::InfiniteLoop, Severity::High, lineno,
                                    "Potential infinite loop detected with no break condition",
                                    std::string("Add a break or exit condition, or bound the loop")});
            } else {
                v.issues.push_back({IssueKind::InfiniteLoop, Severity::Medium, lineno,
                                    "Unconditioned loop detected (has break/exit)",
                                    std::string("Consider using a more explicit condition")});
            }
            break;
        }
    }
}

void ShellAnalyzer::scan_resources(const std::vector<std::string>& lines, AnalysisVerdict& v) const {
    struct Rule {
        std::regex re;
        const char* message;
    };
    static const std::vector<Rule> rules = {
        {std::regex(R"(/dev/(zero|u?random)\b)"), "Reads from an endless device"},
        {std::regex(R"((^|[;&|]|\s)yes(\s|$|\|))"), "Endless output from yes"},
        {std::regex(R"(\bseq\s+([-\w.]+\s+)*\d{6,}\b)"), "Large iteration count in seq"},
        {std::regex(R"(\{\d+\.\.\d{6,}\})"), "Large brace expansion"},
        {std::regex(R"(\b(curl|wget)\b)"), "Network request"},
        {std::regex(R"(\bdd\b.*\bcount=\d{5,})"), "Large dd copy"},
    };
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].size() > kMaxScanLine) continue;
        for (const auto& rule : rules) {
            if (!std::regex_search(lines[i], rule.re)) continue;
            v.issues.push_back({IssueKind::ResourceHeavy, Severity::Medium, static_cast<int>(i) + 1,
                                std::string("Resource-intensive operation detected: ") + rule.message,
                                std::string("Consider adding limits or a timeout")});
        }
    }
}

void ShellAnalyzer::walk_tree(const ShNode& node, AnalysisVerdict& v) const {
    if (node.kind == ShNodeKind::Loop) {
        int depth = loop_depth(node);
        if (depth > 2) {
            v.issues.push_back({IssueKind::Warning, Severity::Medium, node.line,
                                "Deeply nested loops (" + std::to_string(depth) + " levels) detected",
                                std::string("Consider refactoring to reduce nesting")});
        }
        if (unconditioned(node) && !contains_escape(node.body)) {
            v.issues.push_back({IssueKind::InfiniteLoop, Severity::High, node.line,
                                node.keyword + " loop with constant condition and no break statement",
                                std::string("Add a break condition to prevent an infinite loop")});
        }
    }
    for (const auto& child : node.body) walk_tree(child, v);
}
