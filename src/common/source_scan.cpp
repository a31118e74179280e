#include "common/source_scan.hpp"
#include <boost/algorithm/string/trim.hpp>

namespace grader {
using namespace std;

bool source_line::is_blank() const {
    return boost::algorithm::trim_copy(text).empty();
}

bool source_line::is_comment() const {
    if (is_blank()) return false;
    string trimmed = boost::algorithm::trim_copy(code);
    if (trimmed.empty()) return true;
    return trimmed.find_first_not_of("\"'") == string::npos;
}

size_t source_line::indent() const {
    size_t width = 0;
    for (char c : text) {
        if (c == ' ')
            width++;
        else if (c == '\t')
            width += 4;
        else
            break;
    }
    return width;
}

namespace {

enum class scan_state { CODE, LINE_COMMENT, BLOCK_COMMENT, STRING };

struct scanner {
    comment_style style;
    scan_state state = scan_state::CODE;
    char quote = 0;
    bool triple = false;
    vector<source_line> lines;
    source_line current;

    void flush() {
        current.number = lines.size() + 1;
        lines.push_back(move(current));
        current = source_line();
        if (state == scan_state::LINE_COMMENT) state = scan_state::CODE;
        // 单引号字符串不能跨行（JavaScript 模板字符串和三引号字符串除外）
        if (state == scan_state::STRING && !triple && quote != '`') state = scan_state::CODE;
    }

    void comment_char(char c) {
        current.has_comment = true;
        current.comment += c;
    }

    void run(const string &source) {
        for (size_t i = 0; i < source.size(); ++i) {
            char c = source[i];
            if (c == '\n') {
                flush();
                continue;
            }
            current.text += c;
            char next = i + 1 < source.size() ? source[i + 1] : 0;

            switch (state) {
                case scan_state::CODE:
                    if (style == comment_style::HASH && c == '#') {
                        state = scan_state::LINE_COMMENT;
                        current.has_comment = true;
                    } else if (style == comment_style::C_STYLE && c == '/' && next == '/') {
                        state = scan_state::LINE_COMMENT;
                        current.has_comment = true;
                        current.text += next;
                        ++i;
                    } else if (style == comment_style::C_STYLE && c == '/' && next == '*') {
                        state = scan_state::BLOCK_COMMENT;
                        current.has_comment = true;
                        current.text += next;
                        ++i;
                    } else if (c == '"' || c == '\'' || (style == comment_style::C_STYLE && c == '`')) {
                        quote = c;
                        triple = style == comment_style::HASH && source.compare(i, 3, string(3, c)) == 0;
                        state = scan_state::STRING;
                        current.code += c;
                        if (triple) {
                            current.text += string(2, c);
                            i += 2;
                        }
                    } else {
                        current.code += c;
                    }
                    break;
                case scan_state::LINE_COMMENT:
                    comment_char(c);
                    break;
                case scan_state::BLOCK_COMMENT:
                    if (c == '*' && next == '/') {
                        state = scan_state::CODE;
                        current.text += next;
                        ++i;
                    } else {
                        comment_char(c);
                    }
                    break;
                case scan_state::STRING:
                    if (c == '\\' && next && next != '\n') {
                        current.text += next;
                        ++i;
                    } else if (c == quote && (!triple || source.compare(i, 3, string(3, c)) == 0)) {
                        state = scan_state::CODE;
                        current.code += c;
                        if (triple) {
                            current.text += string(2, c);
                            i += 2;
                        }
                    }
                    break;
            }
        }
        if (!current.text.empty() || lines.empty()) flush();
    }
};

}  // namespace

vector<source_line> scan_source(const string &source, comment_style style) {
    scanner s;
    s.style = style;
    s.run(source);
    return move(s.lines);
}

string strip_comments(const string &source, comment_style style) {
    string result;
    for (auto &line : scan_source(source, style)) {
        result += line.code;
        result += '\n';
    }
    return result;
}

size_t find_matching(const string &code, size_t open) {
    if (open >= code.size()) return string::npos;
    char left = code[open];
    char right = left == '(' ? ')' : left == '[' ? ']' : left == '{' ? '}' : left == '<' ? '>' : 0;
    if (!right) return string::npos;
    int depth = 0;
    for (size_t i = open; i < code.size(); ++i) {
        if (code[i] == left)
            depth++;
        else if (code[i] == right && --depth == 0)
            return i;
    }
    return string::npos;
}

vector<string> split_top_level(const string &list) {
    vector<string> parts;
    string current;
    int depth = 0;
    for (char c : list) {
        if (c == '(' || c == '[' || c == '{' || c == '<')
            depth++;
        else if (c == ')' || c == ']' || c == '}' || c == '>')
            depth--;
        if (c == ',' && depth == 0) {
            parts.push_back(boost::algorithm::trim_copy(current));
            current.clear();
        } else {
            current += c;
        }
    }
    if (!boost::algorithm::trim_copy(current).empty())
        parts.push_back(boost::algorithm::trim_copy(current));
    return parts;
}

}  // namespace grader
