#include "python_analyzer.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <regex>
#include <set>

namespace {

const std::size_t kMaxIndentLevels = 100;
const std::size_t kMaxParenDepth = 200;
// Longer lines are skipped by the regex passes; std::regex recurses per character.
const std::size_t kMaxScanLine = 2000;

bool scannable(const std::string& line) { return line.size() <= kMaxScanLine; }

const std::set<std::string>& keywords() {
    static const std::set<std::string> kw = {
        "and", "as", "assert", "async", "await", "break", "class", "continue", "def", "del",
        "elif", "else", "except", "finally", "for", "from", "global", "if", "import", "in",
        "is", "lambda", "nonlocal", "not", "or", "pass", "raise", "return", "try", "while",
        "with", "yield"
    };
    return kw;
}

const std::set<std::string>& compound_keywords() {
    static const std::set<std::string> kw = {
        "if", "elif", "else", "while", "for", "def", "class", "try", "except", "finally", "with"
    };
    return kw;
}

bool is_keyword(const PyToken& t) {
    return t.type == PyTokenType::Name && keywords().count(t.text) > 0;
}

bool is_op(const PyToken& t, const char* text) {
    return t.type == PyTokenType::Op && t.text == text;
}

bool is_name(const PyToken& t, const char* text) {
    return t.type == PyTokenType::Name && t.text == text;
}

bool is_ident_start(unsigned char c) { return std::isalpha(c) || c == '_' || c >= 0x80; }
bool is_ident_char(unsigned char c) { return std::isalnum(c) || c == '_' || c >= 0x80; }

bool is_string_prefix(const std::string& word) {
    std::string w;
    for (char c : word) w.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return w == "r" || w == "u" || w == "b" || w == "f" ||
           w == "br" || w == "rb" || w == "fr" || w == "rf";
}

bool valid_number(const std::string& text) {
    static const std::regex re(
        R"(^(0[xX][0-9a-fA-F_]+|0[oO][0-7_]+|0[bB][01_]+|(\d[\d_]*\.?[\d_]*|\.\d[\d_]*)([eE][+-]?\d[\d_]*)?[jJ]?)$)");
    return std::regex_match(text, re);
}

// Returns the 1-based line of the first malformed UTF-8 sequence, 0 when valid.
int find_invalid_utf8(const std::string& s) {
    int line = 1;
    std::size_t i = 0;
    while (i < s.size()) {
        unsigned char c = s[i];
        if (c == '\n') ++line;
        std::size_t extra = 0;
        if (c < 0x80) extra = 0;
        else if ((c & 0xE0) == 0xC0 && c >= 0xC2) extra = 1;
        else if ((c & 0xF0) == 0xE0) extra = 2;
        else if ((c & 0xF8) == 0xF0 && c <= 0xF4) extra = 3;
        else return line;
        if (i + extra >= s.size() && extra > 0) return line;
        for (std::size_t k = 1; k <= extra; ++k) {
            if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return line;
        }
        i += extra + 1;
    }
    return 0;
}

class Tokenizer {
public:
    explicit Tokenizer(const std::string& src) : src_(src) {}

    std::vector<PyToken> run() {
        std::size_t nul = src_.find('\0');
        if (nul != std::string::npos) {
            int line = 1 + static_cast<int>(std::count(src_.begin(), src_.begin() + nul, '\n'));
            throw PySyntaxError(line, "source code cannot contain null bytes");
        }
        if (int bad = find_invalid_utf8(src_)) {
            throw PySyntaxError(bad, "invalid utf-8 sequence in source");
        }
        bool line_start = true;
        while (true) {
            if (line_start && parens_.empty()) {
                line_start = false;
                if (!handle_indentation()) {
                    if (pos_ >= src_.size()) break;
                    line_start = true;
                    continue;
                }
            }
            if (pos_ >= src_.size()) break;
            unsigned char c = src_[pos_];
            if (c == '\n') {
                if (parens_.empty()) {
                    end_logical_line();
                    line_start = true;
                }
                ++pos_;
                ++line_;
                continue;
            }
            if (c == '\r' || c == ' ' || c == '\t' || c == '\f') { ++pos_; continue; }
            if (c == '#') { skip_comment(); continue; }
            if (c == '\\') { continuation(); continue; }
            if (c < 0x20 || c == 0x7f) {
                char buf[8];
                snprintf(buf, sizeof(buf), "%04X", static_cast<unsigned>(c));
                throw PySyntaxError(line_, std::string("invalid non-printable character U+") + buf);
            }
            if (c == '"' || c == '\'') { read_string(pos_, pos_); continue; }
            if (is_ident_start(c)) { read_name(); continue; }
            if (std::isdigit(c) || (c == '.' && pos_ + 1 < src_.size() &&
                                    std::isdigit(static_cast<unsigned char>(src_[pos_ + 1])))) {
                read_number();
                continue;
            }
            if (c == '(' || c == '[' || c == '{') { open_bracket(static_cast<char>(c)); continue; }
            if (c == ')' || c == ']' || c == '}') { close_bracket(static_cast<char>(c)); continue; }
            read_op();
        }
        if (!parens_.empty()) {
            throw PySyntaxError(parens_.back().second,
                                std::string("'") + parens_.back().first + "' was never closed");
        }
        end_logical_line();
        while (indents_.size() > 1) {
            indents_.pop_back();
            emit(PyTokenType::Dedent, "", line_);
        }
        emit(PyTokenType::End, "", line_);
        return std::move(out_);
    }

private:
    void emit(PyTokenType type, std::string text, int line) {
        out_.push_back(PyToken{type, std::move(text), line});
    }

    void end_logical_line() {
        if (out_.empty()) return;
        PyTokenType last = out_.back().type;
        if (last != PyTokenType::Newline && last != PyTokenType::Indent && last != PyTokenType::Dedent) {
            emit(PyTokenType::Newline, "", line_);
        }
    }

    // Returns false for blank and comment-only lines, which never change indentation.
    bool handle_indentation() {
        std::size_t col = 0;
        std::size_t p = pos_;
        while (p < src_.size() && (src_[p] == ' ' || src_[p] == '\t' || src_[p] == '\f')) {
            if (src_[p] == ' ') ++col;
            else if (src_[p] == '\t') col = (col / 8 + 1) * 8;
            else col = 0;
            ++p;
        }
        pos_ = p;
        if (p >= src_.size()) return false;
        char c = src_[p];
        if (c == '#' || c == '\n' || c == '\r') {
            if (c == '#') skip_comment();
            while (pos_ < src_.size() && src_[pos_] == '\r') ++pos_;
            if (pos_ < src_.size() && src_[pos_] == '\n') {
                ++pos_;
                ++line_;
            }
            return false;
        }
        if (col > indents_.back()) {
            if (indents_.size() >= kMaxIndentLevels) {
                throw PySyntaxError(line_, "too many levels of indentation");
            }
            indents_.push_back(col);
            emit(PyTokenType::Indent, "", line_);
        } else {
            while (col < indents_.back()) {
                indents_.pop_back();
                emit(PyTokenType::Dedent, "", line_);
            }
            if (col != indents_.back()) {
                throw PySyntaxError(line_, "unindent does not match any outer indentation level");
            }
        }
        return true;
    }

    void skip_comment() {
        while (pos_ < src_.size() && src_[pos_] != '\n') ++pos_;
    }

    void continuation() {
        std::size_t n = pos_ + 1;
        while (n < src_.size() && src_[n] == '\r') ++n;
        if (n >= src_.size()) throw PySyntaxError(line_, "unexpected EOF while parsing");
        if (src_[n] != '\n') {
            throw PySyntaxError(line_, "unexpected character after line continuation character");
        }
        pos_ = n + 1;
        ++line_;
    }

    void read_name() {
        std::size_t start = pos_;
        while (pos_ < src_.size() && is_ident_char(static_cast<unsigned char>(src_[pos_]))) ++pos_;
        std::string word = src_.substr(start, pos_ - start);
        if (pos_ < src_.size() && (src_[pos_] == '"' || src_[pos_] == '\'') && is_string_prefix(word)) {
            read_string(start, pos_);
            return;
        }
        emit(PyTokenType::Name, std::move(word), line_);
    }

    void read_string(std::size_t start, std::size_t quote_pos) {
        const char q = src_[quote_pos];
        const bool triple = quote_pos + 2 < src_.size() && src_[quote_pos + 1] == q && src_[quote_pos + 2] == q;
        const int start_line = line_;
        pos_ = quote_pos + (triple ? 3 : 1);
        while (true) {
            if (pos_ >= src_.size()) {
                throw PySyntaxError(start_line, std::string(triple ? "unterminated triple-quoted string literal"
                                                                   : "unterminated string literal") +
                                                    " (detected at line " + std::to_string(line_) + ")");
            }
            char ch = src_[pos_];
            if (ch == '\\') {
                if (pos_ + 1 < src_.size() && src_[pos_ + 1] == '\n') ++line_;
                pos_ += 2;
                continue;
            }
            if (ch == '\n') {
                if (!triple) {
                    throw PySyntaxError(start_line, "unterminated string literal (detected at line " +
                                                        std::to_string(line_) + ")");
                }
                ++line_;
                ++pos_;
                continue;
            }
            if (ch == q) {
                if (!triple) { ++pos_; break; }
                if (pos_ + 2 < src_.size() && src_[pos_ + 1] == q && src_[pos_ + 2] == q) {
                    pos_ += 3;
                    break;
                }
            }
            ++pos_;
        }
        emit(PyTokenType::String, src_.substr(start, pos_ - start), start_line);
    }

    void read_number() {
        std::size_t start = pos_;
        bool hex = src_[pos_] == '0' && pos_ + 1 < src_.size() && (src_[pos_ + 1] == 'x' || src_[pos_ + 1] == 'X');
        while (pos_ < src_.size()) {
            unsigned char ch = src_[pos_];
            if (std::isalnum(ch) || ch == '_' || ch == '.') {
                ++pos_;
            } else if ((ch == '+' || ch == '-') && !hex && pos_ > start &&
                       (src_[pos_ - 1] == 'e' || src_[pos_ - 1] == 'E')) {
                ++pos_;
            } else {
                break;
            }
        }
        std::string text = src_.substr(start, pos_ - start);
        if (!valid_number(text)) throw PySyntaxError(line_, "invalid decimal literal");
        emit(PyTokenType::Number, std::move(text), line_);
    }

    void open_bracket(char c) {
        if (parens_.size() >= kMaxParenDepth) throw PySyntaxError(line_, "too many nested parentheses");
        parens_.push_back({c, line_});
        emit(PyTokenType::Op, std::string(1, c), line_);
        ++pos_;
    }

    void close_bracket(char c) {
        if (parens_.empty()) throw PySyntaxError(line_, std::string("unmatched '") + c + "'");
        char open = parens_.back().first;
        bool match = (open == '(' && c == ')') || (open == '[' && c == ']') || (open == '{' && c == '}');
        if (!match) {
            throw PySyntaxError(line_, std::string("closing parenthesis '") + c +
                                           "' does not match opening parenthesis '" + open + "'");
        }
        parens_.pop_back();
        emit(PyTokenType::Op, std::string(1, c), line_);
        ++pos_;
    }

    void read_op() {
        static const char* three[] = {"**=", "//=", ">>=", "<<=", "..."};
        static const char* two[] = {"**", "//", ">>", "<<", "<=", ">=", "==", "!=", "->", "+=", "-=",
                                    "*=", "/=", "%=", "&=", "|=", "^=", "@=", ":="};
        for (const char* op : three) {
            if (src_.compare(pos_, 3, op) == 0) {
                emit(PyTokenType::Op, op, line_);
                pos_ += 3;
                return;
            }
        }
        for (const char* op : two) {
            if (src_.compare(pos_, 2, op) == 0) {
                emit(PyTokenType::Op, op, line_);
                pos_ += 2;
                return;
            }
        }
        static const std::string singles = "+-*/%@&|^~<>=.,:;";
        char c = src_[pos_];
        if (singles.find(c) == std::string::npos) throw PySyntaxError(line_, "invalid syntax");
        emit(PyTokenType::Op, std::string(1, c), line_);
        ++pos_;
    }

    const std::string& src_;
    std::size_t pos_{0};
    int line_{1};
    std::vector<std::size_t> indents_{0};
    std::vector<std::pair<char, int>> parens_;
    std::vector<PyToken> out_;
};

// Expression-level sanity checks over a token run: adjacent operands and dangling operators.
void check_tokens(const std::vector<PyToken>& toks, bool from_import) {
    if (toks.empty()) return;
    static const std::set<std::string> bad_start = {
        "=", "==", "!=", "<", ">", "<=", ">=", ".", ",", ":", ";", "/", "//", "%", "**", "|", "&",
        "^", "<<", ">>", "+=", "-=", "*=", "/=", "//=", "%=", "**=", "&=", "|=", "^=", ">>=",
        "<<=", "@=", ":=", "->"
    };
    static const std::set<std::string> bad_end = {
        "+", "-", "/", "//", "%", "**", "=", "==", "!=", "<", ">", "<=", ">=", "&", "|", "^", "<<",
        ">>", "@", "+=", "-=", "*=", "/=", "//=", "%=", "**=", "&=", "|=", "^=", ">>=", "<<=",
        "@=", ":=", "->", ".", "~"
    };
    const PyToken& first = toks.front();
    if (first.type == PyTokenType::Op && bad_start.count(first.text)) {
        throw PySyntaxError(first.line, "invalid syntax");
    }
    const PyToken& last = toks.back();
    if (last.type == PyTokenType::Op && (bad_end.count(last.text) || (last.text == "*" && !from_import))) {
        throw PySyntaxError(last.line, "invalid syntax");
    }
    auto operand_end = [](const PyToken& t) {
        return (t.type == PyTokenType::Name && !is_keyword(t)) || t.type == PyTokenType::Number ||
               t.type == PyTokenType::String ||
               (t.type == PyTokenType::Op && (t.text == ")" || t.text == "]" || t.text == "}"));
    };
    auto operand_start = [](const PyToken& t) {
        return (t.type == PyTokenType::Name && !is_keyword(t)) || t.type == PyTokenType::Number ||
               t.type == PyTokenType::String;
    };
    for (std::size_t i = 0; i + 1 < toks.size(); ++i) {
        const PyToken& a = toks[i];
        const PyToken& b = toks[i + 1];
        if (!operand_end(a) || !operand_start(b)) continue;
        if (a.type == PyTokenType::String && b.type == PyTokenType::String) continue;
        // soft keyword: type X = ...
        if (i == 0 && is_name(a, "type") && toks.size() > 2 &&
            (is_op(toks[2], "=") || is_op(toks[2], "["))) {
            continue;
        }
        if (i == 0 && (is_name(a, "print") || is_name(a, "exec"))) {
            throw PySyntaxError(b.line, "Missing parentheses in call to '" + a.text + "'");
        }
        throw PySyntaxError(b.line, "invalid syntax");
    }
}

class Parser {
public:
    explicit Parser(std::vector<PyToken> toks) : toks_(std::move(toks)) {}

    PyNode parse_module() {
        PyNode module;
        module.kind = PyNodeKind::Module;
        module.line = 1;
        parse_block(module.body, true);
        return module;
    }

private:
    struct Chain {
        std::string owner; // if / for / while / try / match, empty when no clause may follow
        std::string last;  // last clause keyword seen for that owner
    };

    const PyToken& peek() const { return toks_[pos_]; }
    bool at(PyTokenType t) const { return peek().type == t; }

    void close_chain(Chain& chain, int line) {
        if (chain.owner == "try" && chain.last.empty()) {
            throw PySyntaxError(line, "expected 'except' or 'finally' block");
        }
        chain = Chain{};
    }

    void parse_block(std::vector<PyNode>& out, bool top_level) {
        Chain chain;
        while (true) {
            if (at(PyTokenType::End)) {
                close_chain(chain, peek().line);
                return;
            }
            if (at(PyTokenType::Dedent)) {
                close_chain(chain, peek().line);
                ++pos_;
                if (!top_level) return;
                continue;
            }
            if (at(PyTokenType::Indent)) throw PySyntaxError(peek().line, "unexpected indent");
            if (at(PyTokenType::Newline)) { ++pos_; continue; }
            parse_statement(out, chain);
        }
    }

    std::vector<PyToken> take_logical_line() {
        std::vector<PyToken> line;
        while (!at(PyTokenType::Newline) && !at(PyTokenType::End)) {
            line.push_back(peek());
            ++pos_;
        }
        if (at(PyTokenType::Newline)) ++pos_;
        return line;
    }

    void parse_statement(std::vector<PyNode>& out, Chain& chain) {
        std::vector<PyToken> line = take_logical_line();
        if (line.empty()) return;
        const PyToken& first = line.front();
        std::size_t kw_index = 0;
        std::string kw = first.type == PyTokenType::Name ? first.text : "";
        if (kw == "async") {
            if (line.size() < 2 || !(is_name(line[1], "def") || is_name(line[1], "for") || is_name(line[1], "with"))) {
                throw PySyntaxError(first.line, "invalid syntax");
            }
            kw_index = 1;
            kw = line[1].text;
        }
        bool soft_compound = (kw == "match" || kw == "case") && line.size() > 2 && is_op(line.back(), ":") &&
                             !(line[1].type == PyTokenType::Op &&
                               (line[1].text == "=" || line[1].text == "." || line[1].text == ":" ||
                                line[1].text == ","));
        if (compound_keywords().count(kw) || soft_compound) {
            parse_compound(line, kw_index, kw, out, chain);
        } else {
            close_chain(chain, first.line);
            parse_simple(line, out);
        }
    }

    void check_clause(const std::string& kw, Chain& chain, int line) {
        bool ok = false;
        if (kw == "elif") {
            ok = chain.owner == "if" && (chain.last.empty() || chain.last == "elif");
        } else if (kw == "else") {
            if (chain.owner == "if") ok = chain.last.empty() || chain.last == "elif";
            else if (chain.owner == "for" || chain.owner == "while") ok = chain.last.empty();
            else if (chain.owner == "try") ok = chain.last == "except";
        } else if (kw == "except") {
            ok = chain.owner == "try" && (chain.last.empty() || chain.last == "except");
        } else if (kw == "finally") {
            ok = chain.owner == "try" &&
                 (chain.last.empty() || chain.last == "except" || chain.last == "else");
        }
        if (!ok) throw PySyntaxError(line, "invalid syntax");
        chain.last = kw;
    }

    void check_header(const std::string& kw, const std::vector<PyToken>& header, int line) {
        const bool empty = header.empty();
        if ((kw == "else" || kw == "try" || kw == "finally") && !empty) {
            throw PySyntaxError(line, "invalid syntax");
        }
        if (empty && kw != "else" && kw != "try" && kw != "finally" && kw != "except") {
            throw PySyntaxError(line, "invalid syntax");
        }
        if (kw == "for") {
            int depth = 0;
            bool found = false;
            for (std::size_t i = 0; i < header.size(); ++i) {
                const PyToken& t = header[i];
                if (t.type == PyTokenType::Op && (t.text == "(" || t.text == "[" || t.text == "{")) ++depth;
                if (t.type == PyTokenType::Op && (t.text == ")" || t.text == "]" || t.text == "}")) --depth;
                if (depth == 0 && is_name(t, "in") && i > 0 && i + 1 < header.size()) { found = true; break; }
            }
            if (!found) throw PySyntaxError(line, "invalid syntax");
        }
        if (kw == "def") {
            if (header.size() < 3 || header[0].type != PyTokenType::Name || is_keyword(header[0]) ||
                !is_op(header[1], "(")) {
                throw PySyntaxError(line, "invalid syntax");
            }
        }
        if (kw == "class") {
            if (header[0].type != PyTokenType::Name || is_keyword(header[0])) {
                throw PySyntaxError(line, "invalid syntax");
            }
        }
        check_tokens(header, false);
    }

    void parse_compound(const std::vector<PyToken>& line, std::size_t kw_index, const std::string& kw,
                        std::vector<PyNode>& out, Chain& chain) {
        const int lineno = line[kw_index].line;

        int depth = 0;
        int lambdas = 0;
        std::size_t colon = std::string::npos;
        for (std::size_t i = kw_index + 1; i < line.size(); ++i) {
            const PyToken& t = line[i];
            if (t.type == PyTokenType::Op && (t.text == "(" || t.text == "[" || t.text == "{")) ++depth;
            else if (t.type == PyTokenType::Op && (t.text == ")" || t.text == "]" || t.text == "}")) --depth;
            else if (depth == 0 && is_name(t, "lambda")) ++lambdas;
            else if (depth == 0 && is_op(t, ":")) {
                if (lambdas > 0) { --lambdas; continue; }
                colon = i;
                break;
            }
        }
        if (colon == std::string::npos) throw PySyntaxError(lineno, "expected ':'");

        std::vector<PyToken> header(line.begin() + kw_index + 1, line.begin() + colon);
        std::vector<PyToken> rest(line.begin() + colon + 1, line.end());
        check_header(kw, header, lineno);

        PyNode node;
        node.line = lineno;
        node.keyword = kw;
        node.tokens = header;
        if (kw == "elif" || kw == "else" || kw == "except" || kw == "finally") {
            check_clause(kw, chain, lineno);
            node.kind = PyNodeKind::Clause;
        } else if (kw == "case") {
            node.kind = PyNodeKind::Clause;
        } else {
            close_chain(chain, lineno);
            if (kw == "while") node.kind = PyNodeKind::While;
            else if (kw == "for") node.kind = PyNodeKind::For;
            else if (kw == "if") node.kind = PyNodeKind::If;
            else if (kw == "def") node.kind = PyNodeKind::Def;
            else if (kw == "class") node.kind = PyNodeKind::Class;
            else if (kw == "try") node.kind = PyNodeKind::Try;
            else if (kw == "with") node.kind = PyNodeKind::With;
            else node.kind = PyNodeKind::Match;
            if (kw == "if" || kw == "for" || kw == "while" || kw == "try") chain.owner = kw;
            if (node.kind == PyNodeKind::Def || node.kind == PyNodeKind::Class) node.name = header[0].text;
        }

        const int saved_loops = loop_depth_;
        const int saved_funcs = func_depth_;
        if (node.kind == PyNodeKind::While || node.kind == PyNodeKind::For) {
            ++loop_depth_;
        } else if (node.kind == PyNodeKind::Def) {
            loop_depth_ = 0;
            ++func_depth_;
        } else if (node.kind == PyNodeKind::Class) {
            loop_depth_ = 0;
            func_depth_ = 0;
        }

        if (!rest.empty()) {
            const PyToken& head = rest.front();
            if (head.type == PyTokenType::Name && (compound_keywords().count(head.text) || head.text == "async")) {
                throw PySyntaxError(head.line, "invalid syntax");
            }
            parse_simple(rest, node.body);
        } else {
            if (!at(PyTokenType::Indent)) {
                int err_line = at(PyTokenType::End) ? lineno + 1 : peek().line;
                throw PySyntaxError(err_line, "expected an indented block after '" + kw +
                                                  "' statement on line " + std::to_string(lineno));
            }
            ++pos_;
            parse_block(node.body, false);
        }

        loop_depth_ = saved_loops;
        func_depth_ = saved_funcs;
        out.push_back(std::move(node));
    }

    void parse_simple(const std::vector<PyToken>& toks, std::vector<PyNode>& out) {
        std::vector<std::vector<PyToken>> parts(1);
        int depth = 0;
        for (const auto& t : toks) {
            if (t.type == PyTokenType::Op && (t.text == "(" || t.text == "[" || t.text == "{")) ++depth;
            if (t.type == PyTokenType::Op && (t.text == ")" || t.text == "]" || t.text == "}")) --depth;
            if (depth == 0 && is_op(t, ";")) {
                if (parts.back().empty()) throw PySyntaxError(t.line, "invalid syntax");
                parts.emplace_back();
                continue;
            }
            parts.back().push_back(t);
        }
        if (parts.size() > 1 && parts.back().empty()) parts.pop_back();

        for (auto& seg : parts) {
            if (seg.empty()) continue;
            const PyToken& first = seg.front();
            if (first.type == PyTokenType::Name && compound_keywords().count(first.text)) {
                throw PySyntaxError(first.line, "invalid syntax");
            }
            check_tokens(seg, is_name(first, "from"));

            PyNode node;
            node.line = first.line;
            node.keyword = first.type == PyTokenType::Name ? first.text : "";
            if (is_name(first, "break")) {
                if (loop_depth_ == 0) throw PySyntaxError(first.line, "'break' outside loop");
                if (seg.size() != 1) throw PySyntaxError(seg[1].line, "invalid syntax");
                node.kind = PyNodeKind::Break;
            } else if (is_name(first, "continue")) {
                if (loop_depth_ == 0) throw PySyntaxError(first.line, "'continue' not properly in loop");
                if (seg.size() != 1) throw PySyntaxError(seg[1].line, "invalid syntax");
                node.kind = PyNodeKind::Continue;
            } else if (is_name(first, "return")) {
                if (func_depth_ == 0) throw PySyntaxError(first.line, "'return' outside function");
                node.kind = PyNodeKind::Return;
            } else {
                node.kind = PyNodeKind::Statement;
            }
            for (const auto& t : seg) {
                if (is_name(t, "yield") && func_depth_ == 0) {
                    throw PySyntaxError(t.line, "'yield' outside function");
                }
            }
            node.tokens = std::move(seg);
            out.push_back(std::move(node));
        }
    }

    std::vector<PyToken> toks_;
    std::size_t pos_{0};
    int loop_depth_{0};
    int func_depth_{0};
};

bool contains_break(const std::vector<PyNode>& body) {
    for (const auto& n : body) {
        if (n.kind == PyNodeKind::Break) return true;
        if (contains_break(n.body)) return true;
    }
    return false;
}

int loop_depth(const PyNode& node) {
    int inner = 0;
    for (const auto& child : node.body) inner = std::max(inner, loop_depth(child));
    bool is_loop = node.kind == PyNodeKind::While || node.kind == PyNodeKind::For;
    return inner + (is_loop ? 1 : 0);
}

bool falsy_constant(const std::vector<PyToken>& t) {
    if (t.size() != 1) return false;
    if (is_name(t[0], "False") || is_name(t[0], "None")) return true;
    if (t[0].type == PyTokenType::Number) {
        return t[0].text.find_first_of("123456789") == std::string::npos;
    }
    return false;
}

std::vector<PyToken> strip_parens(std::vector<PyToken> t) {
    while (t.size() >= 2 && is_op(t.front(), "(") && is_op(t.back(), ")")) {
        t = std::vector<PyToken>(t.begin() + 1, t.end() - 1);
    }
    return t;
}

// True for conditions whose value is known without running the code.
bool always_true(const std::vector<PyToken>& header) {
    std::vector<PyToken> t = strip_parens(header);
    if (t.empty()) return false;
    if (t.size() == 1) {
        const PyToken& tok = t[0];
        if (is_name(tok, "True")) return true;
        if (tok.type == PyTokenType::Number) {
            std::string digits = tok.text;
            std::size_t e = digits.find_first_of("eE");
            bool hex = digits.size() > 1 && (digits[1] == 'x' || digits[1] == 'X');
            if (e != std::string::npos && !hex) digits = digits.substr(0, e);
            if (digits.size() > 1 && (hex || digits[1] == 'o' || digits[1] == 'O' || digits[1] == 'b' || digits[1] == 'B')) {
                digits = digits.substr(2);
            }
            return digits.find_first_of(hex ? "123456789abcdefABCDEF" : "123456789") != std::string::npos;
        }
        if (tok.type == PyTokenType::String) {
            std::size_t q = tok.text.find_first_of("'\"");
            std::string body = tok.text.substr(q);
            std::size_t quote_len = (body.size() >= 6 && body[0] == body[1] && body[1] == body[2]) ? 3 : 1;
            return body.size() > 2 * quote_len;
        }
        return false;
    }
    if (is_name(t[0], "not")) {
        return falsy_constant(strip_parens(std::vector<PyToken>(t.begin() + 1, t.end())));
    }
    return false;
}

// for ... in itertools.count(...) / itertools.cycle(...)
bool iterates_forever(const std::vector<PyToken>& header) {
    for (std::size_t i = 0; i + 3 < header.size(); ++i) {
        if (is_name(header[i], "itertools") && is_op(header[i + 1], ".") &&
            (is_name(header[i + 2], "count") || is_name(header[i + 2], "cycle")) &&
            is_op(header[i + 3], "(")) {
            return true;
        }
    }
    return false;
}

std::size_t block_end(const std::vector<std::string>& lines, std::size_t start) {
    std::size_t indent = leading_indent(lines[start]);
    for (std::size_t j = start + 1; j < lines.size(); ++j) {
        std::string t = trim(lines[j]);
        if (t.empty() || t[0] == '#') continue;
        if (leading_indent(lines[j]) <= indent) return j;
    }
    return lines.size();
}

} // namespace

std::vector<PyToken> tokenize_python(const std::string& code) {
    return Tokenizer(code).run();
}

PyNode parse_python(const std::string& code) {
    return Parser(tokenize_python(code)).parse_module();
}

AnalysisVerdict PythonAnalyzer::analyze(const std::string& code) const {
    AnalysisVerdict v;
    v.language = language();
    try {
        PyNode tree;
        try {
            tree = parse_python(code);
        } catch (const PySyntaxError& e) {
            v.issues.push_back({IssueKind::SyntaxError, Severity::High, e.line(),
                                std::string("Syntax error: ") + e.what(),
                                std::string("Fix syntax errors before execution")});
            v.should_execute = false;
            return v;
        }
        auto lines = split_lines(code);
        scan_loops(lines, v);
        scan_recursion(lines, v);
        scan_resources(lines, v);
        walk_tree(tree, v);
        suggest(code, v);
    } catch (const std::exception& e) {
        v.issues.push_back({IssueKind::Warning, Severity::High, 0,
                            std::string("Analysis aborted: ") + e.what(),
                            std::string("Simplify the submission or resubmit with allow_risky")});
    }
    finalize_verdict(v);
    return v;
}

void PythonAnalyzer::scan_loops(const std::vector<std::string>& lines, AnalysisVerdict& v) const {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(\bwhile\s*\(*\s*(True|1)\s*\)*\s*:)"),
        std::regex(R"(\bwhile\s+not\s+\(*\s*(False|0|None)\s*\)*\s*:)"),
        std::regex(R"(\bfor\s+\w+\s+in\s+itertools\.(count|cycle)\([^)]*\)\s*:)"),
    };
    static const std::regex escape(R"(\b(break|return)\b)");

    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (!scannable(lines[i])) continue;
        for (const auto& re : patterns) {
            std::smatch m;
            if (!std::regex_search(lines[i], m, re)) continue;
            bool has_escape = std::regex_search(m.suffix().str(), escape);
            std::size_t end = block_end(lines, i);
            for (std::size_t j = i + 1; j < end && !has_escape; ++j) {
                has_escape = scannable(lines[j]) ? std::regex_search(lines[j], escape)
                                                 : lines[j].find("break") != std::string::npos;
            }
            int lineno = static_cast<int>(i) + 1;
            if (!has_escape) {
                v.issues.push_back({IssueKind::InfiniteLoop, Severity::High, lineno,
                                    "Potential infinite loop detected with no break condition",
                                    std::string("Add a break condition or use a different loop structure")});
            } else {
                v.issues.push_back({IssueKind::InfiniteLoop, Severity::Medium, lineno,
                                    "Unconditioned loop detected (has break/return)",
                                    std::string("Consider using a more explicit condition")});
            }
            break;
        }
    }
}

void PythonAnalyzer::scan_recursion(const std::vector<std::string>& lines, AnalysisVerdict& v) const {
    static const std::regex def_re(R"(^\s*(?:async\s+)?def\s+(\w+)\s*\()");
    static const std::regex base_case(R"(\bif\b)");
    static const std::regex early_return(R"(\b(return|break)\b)");

    for (std::size_t i = 0; i < lines.size(); ++i) {
        std::smatch m;
        if (!scannable(lines[i]) || !std::regex_search(lines[i], m, def_re)) continue;
        const std::string name = m[1].str();
        // Attribute calls such as self.conn.name() reach another object.
        const std::regex call(R"((?:^|[^.\w]))" + name + R"(\s*\()");

        std::vector<std::string> body;
        std::size_t colon = lines[i].find("):");
        if (colon != std::string::npos && colon + 2 < lines[i].size()) body.push_back(lines[i].substr(colon + 2));
        std::size_t end = block_end(lines, i);
        for (std::size_t j = i + 1; j < end; ++j) body.push_back(lines[j]);

        bool recursive = false;
        bool conditional = false;
        bool escape = false;
        for (const auto& l : body) {
            if (!scannable(l)) continue;
            bool calls = std::regex_search(l, call);
            recursive = recursive || calls;
            conditional = conditional || std::regex_search(l, base_case);
            if (!calls && std::regex_search(l, early_return)) escape = true;
        }
        if (!recursive || conditional) continue;

        int lineno = static_cast<int>(i) + 1;
        if (!escape) {
            v.issues.push_back({IssueKind::InfiniteLoop, Severity::High, lineno,
                                "Recursive function '" + name + "' has no visible base case",
                                std::string("Add a base case that returns without recursing")});
        } else {
            v.issues.push_back({IssueKind::InfiniteLoop, Severity::Medium, lineno,
                                "Recursive function '" + name + "' returns early but has no conditional base case",
                                std::string("Guard the recursive call with an explicit condition")});
        }
    }
}

void PythonAnalyzer::scan_resources(const std::vector<std::string>& lines, AnalysisVerdict& v) const {
    struct Rule {
        std::regex re;
        const char* message;
    };
    static const std::vector<Rule> rules = {
        {std::regex(R"(\brange\([^)]*\b\d{6,}\b)"), "Large iteration count in range()"},
        {std::regex(R"(\.read(lines)?\(\s*\))"), "Unbounded read without a size limit"},
        {std::regex(R"(\brequests\.(get|post|put|delete|request)\()"), "Network request"},
        {std::regex(R"(\burllib\.request\b)"), "Network request"},
        {std::regex(R"(\.recv\()"), "Socket read"},
        {std::regex(R"(\bsubprocess\.)"), "Subprocess execution"},
        {std::regex(R"(\[\s*\w+\s*\*\s*\d{4,}\s*\])"), "Large list comprehension"},
        {std::regex(R"(\[[^\]]*\]\s*\*\s*\d{5,})"), "Large fixed-size list allocation"},
        {std::regex(R"(\b(numpy|np)\.(zeros|ones|empty)\(\s*\(?\s*\d{5,})"), "Large array allocation"},
        {std::regex(R"(\bbytearray\(\s*\d{7,})"), "Large buffer allocation"},
    };

    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (!scannable(lines[i])) {
            v.issues.push_back({IssueKind::Warning, Severity::Low, static_cast<int>(i) + 1,
                                "Line too long to scan for resource usage",
                                std::string("Split very long lines")});
            continue;
        }
        for (const auto& rule : rules) {
            if (!std::regex_search(lines[i], rule.re)) continue;
            v.issues.push_back({IssueKind::ResourceHeavy, Severity::Medium, static_cast<int>(i) + 1,
                                std::string("Resource-intensive operation detected: ") + rule.message,
                                std::string("Consider adding progress monitoring or limits")});
        }
    }
}

void PythonAnalyzer::walk_tree(const PyNode& node, AnalysisVerdict& v) const {
    if (node.kind == PyNodeKind::While || node.kind == PyNodeKind::For) {
        int depth = loop_depth(node);
        if (depth > 2) {
            v.issues.push_back({IssueKind::Warning, Severity::Medium, node.line,
                                "Deeply nested loops (" + std::to_string(depth) + " levels) detected",
                                std::string("Consider refactoring to reduce nesting")});
        }
        bool unconditioned = node.kind == PyNodeKind::While ? always_true(node.tokens)
                                                            : iterates_forever(node.tokens);
        if (unconditioned && !contains_break(node.body)) {
            v.issues.push_back({IssueKind::InfiniteLoop, Severity::High, node.line,
                                node.kind == PyNodeKind::While ? "while loop with constant true condition and no break statement"
                                                               : "for loop over an endless iterator with no break statement",
                                std::string("Add break condition to prevent infinite loop")});
        }
    }
    for (const auto& child : node.body) walk_tree(child, v);
}

void PythonAnalyzer::suggest(const std::string& code, AnalysisVerdict& v) const {
    static const std::regex while_true(R"(\bwhile\s+True\s*:)");
    static const std::regex large_range(R"(range\(\s*\d{6,}\s*\))");
    bool loops = false;
    bool ranges = false;
    for (const auto& line : split_lines(code)) {
        if (!scannable(line)) continue;
        loops = loops || std::regex_search(line, while_true);
        ranges = ranges || std::regex_search(line, large_range);
    }
    if (loops) {
        v.suggestions.push_back("Consider using 'for i in range(max_iterations)' with a reasonable limit");
        v.suggestions.push_back("Add a counter variable and check it in the while condition");
    }
    if (ranges) {
        v.suggestions.push_back("For large ranges, consider using generators or batch processing");
        v.suggestions.push_back("Add progress monitoring: if i % 1000 == 0: print(f'Progress: {i}')");
    }
}
