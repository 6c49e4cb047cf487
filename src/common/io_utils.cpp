#include "common/io_utils.hpp"
#include <cerrno>
#include <fstream>
#include <iterator>
#include <system_error>

namespace grader {
using namespace std;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin)
        throw system_error(errno, generic_category(), "unable to open " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const filesystem::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, generic_category(), "unable to create " + path.string());
    fout.write(content.data(), content.size());
    fout.flush();
    if (!fout)
        throw system_error(errno, generic_category(), "unable to write " + path.string());
}

string last_line(const string &text) {
    size_t end = text.find_last_not_of("\r\n \t");
    if (end == string::npos) return "";
    size_t begin = text.rfind('\n', end);
    begin = begin == string::npos ? 0 : begin + 1;
    return text.substr(begin, end - begin + 1);
}

}  // namespace grader
