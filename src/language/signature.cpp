#include "language/signature.hpp"
#include <boost/algorithm/string.hpp>
#include <regex>

namespace grader {
using namespace std;

static const regex class_regex(R"(\b(public\s+)?(?:(?:abstract|final|static)\s+)*(?:class|struct|interface|record)\s+(\w+))");

const class_region *declaration_scan::class_at(size_t position) const {
    for (auto &region : classes)
        if (region.open < position && position < region.close) return &region;
    return nullptr;
}

string declaration_scan::line(size_t index) const {
    size_t begin = line_offsets[index];
    size_t end = index + 1 < line_offsets.size() ? line_offsets[index + 1] - 1 : code.size();
    return code.substr(begin, end - begin);
}

declaration_scan scan_declarations(const string &source) {
    declaration_scan scan;
    scan.code = strip_comments(source, comment_style::C_STYLE);
    scan.depths.assign(scan.code.size() + 1, 0);
    int depth = 0;
    scan.line_offsets.push_back(0);
    for (size_t i = 0; i < scan.code.size(); ++i) {
        scan.depths[i] = depth;
        if (scan.code[i] == '{') depth++;
        if (scan.code[i] == '}') depth--;
        if (scan.code[i] == '\n' && i + 1 < scan.code.size()) scan.line_offsets.push_back(i + 1);
    }
    scan.depths[scan.code.size()] = depth;

    for (sregex_iterator it(scan.code.begin(), scan.code.end(), class_regex), end; it != end; ++it) {
        size_t position = it->position(0);
        if (scan.depths[position] != 0) continue;
        size_t open = scan.code.find_first_of("{;", position);
        if (open == string::npos || scan.code[open] != '{') continue;
        size_t close = find_matching(scan.code, open);
        if (close == string::npos) continue;
        scan.classes.push_back({(*it)[2], open, close, (*it)[1].matched});
    }
    return scan;
}

bool has_body_after(const string &code, size_t close) {
    size_t i = close + 1;
    while (i < code.size()) {
        char c = code[i];
        if (isspace((unsigned char)c)) {
            ++i;
        } else if (c == '{') {
            return true;
        } else if (c == '-' && i + 1 < code.size() && code[i + 1] == '>') {
            size_t next = code.find_first_of("{;", i);
            return next != string::npos && code[next] == '{';
        } else if (isalpha((unsigned char)c)) {
            size_t end = i;
            while (end < code.size() && (isalnum((unsigned char)code[end]) || code[end] == '_')) ++end;
            string word = code.substr(i, end - i);
            if (word == "throws") {
                size_t next = code.find_first_of("{;", end);
                return next != string::npos && code[next] == '{';
            }
            if (word != "const" && word != "noexcept" && word != "override" && word != "final" && word != "volatile")
                return false;
            i = end;
        } else {
            return false;
        }
    }
    return false;
}

string simplify_type(string type) {
    static const regex qualifier_regex(R"(\b(const|final|volatile|mutable)\b)");
    type = regex_replace(type, qualifier_regex, "");
    boost::algorithm::erase_all(type, "&");
    static const regex space_regex(R"(\s+)");
    type = regex_replace(type, space_regex, " ");
    boost::algorithm::trim(type);
    // "vector<int> " 与 "vector < int >" 统一为 "vector<int>"
    static const regex bracket_space_regex(R"(\s*([<>,\[\]])\s*)");
    return regex_replace(type, bracket_space_regex, "$1");
}

parameter parse_typed_parameter(const string &raw) {
    string text = raw.substr(0, raw.find('='));
    // 去掉注解，如 @NonNull
    static const regex annotation_regex(R"(@\w+(\([^)]*\))?)");
    text = regex_replace(text, annotation_regex, "");
    boost::algorithm::trim(text);

    size_t end = text.size();
    while (end > 0 && text[end - 1] == ']') {
        size_t open = text.find_last_of('[', end - 1);
        if (open == string::npos) break;
        end = open;
    }
    size_t begin = end;
    while (begin > 0 && (isalnum((unsigned char)text[begin - 1]) || text[begin - 1] == '_')) --begin;

    parameter param;
    param.name = text.substr(begin, end - begin);
    // C 风格的数组声明 int nums[] 等价于 int[] nums
    string type = text.substr(0, begin) + text.substr(end);
    param.type = simplify_type(type);
    if (param.type.empty()) {
        // 只有类型没有参数名，如 C++ 的 int foo(int)
        param.type = simplify_type(param.name);
        param.name = "";
    }
    return param;
}

}  // namespace grader
