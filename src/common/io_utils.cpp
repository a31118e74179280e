#include "common/io_utils.hpp"
#include <fstream>
#include <system_error>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin)
        throw system_error(errno, generic_category(), "unable to open " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, generic_category(), "unable to open " + path.string());
    fout << content;
    if (!fout)
        throw system_error(errno, generic_category(), "unable to write " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath.find("..") != string::npos || subpath.front() == '/')
        throw invalid_argument_error("subpath is not safe " + subpath);
    return subpath;
}

string remove_directory(const fs::path &dir) {
    error_code ec;
    fs::remove_all(dir, ec);
    if (!ec) return "";

    // 选手程序可能把文件权限改掉了，恢复权限后再试一次
    for (auto it = fs::recursive_directory_iterator(dir, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        error_code perm_ec;
        fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, perm_ec);
    }
    ec.clear();
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::add, ec);
    ec.clear();
    fs::remove_all(dir, ec);
    return ec ? ec.message() : "";
}

}  // namespace grader
