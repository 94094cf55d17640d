#include "grader/common/io_utils.hpp"
#include <errno.h>
#include <fstream>
#include <iterator>
#include <system_error>

namespace grader {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string());
    if (!fin)
        throw system_error(errno, system_category(), "unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    if (path.has_parent_path())
        fs::create_directories(path.parent_path());
    ofstream fout(path.string(), ios::out | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open file " + path.string());
    fout << content;
    fout.flush();
    if (!fout)
        throw system_error(errno, system_category(), "error when writing file " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath.find("../") != string::npos || subpath == ".." || subpath.find('/') != string::npos)
        throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

}  // namespace grader
