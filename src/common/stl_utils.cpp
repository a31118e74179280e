#include "common/stl_utils.hpp"

namespace grader {
using namespace std;

string truncate_string(const string &s, size_t limit) {
    if (s.size() <= limit) return s;
    return s.substr(0, limit) + "\n[truncated]";
}

}  // namespace grader
