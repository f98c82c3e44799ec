#include "common/io_utils.hpp"
#include <cctype>
#include <fstream>
#include <system_error>
#include "common/exceptions.hpp"

namespace runbox {
using namespace std;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const filesystem::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    fout.write(content.data(), content.size());
    fout.close();
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

string assert_safe_path(const string &segment) {
    if (segment.empty() || segment == "." || segment == ".." ||
        segment.find('/') != string::npos ||
        segment.find('\0') != string::npos ||
        segment.front() == '-' ||
        segment.size() > 255)
        throw validation_error("filename is not safe: " + segment);
    return segment;
}

bool is_safe_identifier(const string &id) {
    if (id.empty() || id.size() > 64) return false;
    for (char c : id)
        if (!isalnum((unsigned char)c) && c != '-' && c != '_') return false;
    return true;
}

}  // namespace runbox
