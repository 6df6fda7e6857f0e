#include "common/io_utils.hpp"
#include <fstream>
#include <iterator>
#include "common/exceptions.hpp"

namespace runner {
using namespace std;

string read_file_content(const filesystem::path &path) {
    ifstream fin(path, ios::binary);
    if (!fin)
        throw internal_error("unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const filesystem::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout)
        throw internal_error("unable to create file " + path.string());
    fout.write(content.data(), content.size());
    fout.flush();
    if (!fout)
        throw internal_error("unable to write file " + path.string());
}

bool utf8_check_is_valid(const string &string) {
    int c, i, ix, n, j;
    for (i = 0, ix = string.length(); i < ix; i++) {
        c = (unsigned char)string[i];
        if (0x00 <= c && c <= 0x7f)
            n = 0;  // 0bbbbbbb
        else if ((c & 0xE0) == 0xC0)
            n = 1;  // 110bbbbb
        else if (c == 0xed && i < (ix - 1) && ((unsigned char)string[i + 1] & 0xa0) == 0xa0)
            return false;  // U+d800 to U+dfff
        else if ((c & 0xF0) == 0xE0)
            n = 2;  // 1110bbbb
        else if ((c & 0xF8) == 0xF0)
            n = 3;  // 11110bbb
        else
            return false;
        for (j = 0; j < n && i < ix; j++) {  // n bytes matching 10bbbbbb follow ?
            if ((++i == ix) || (((unsigned char)string[i] & 0xC0) != 0x80))
                return false;
        }
    }
    return true;
}

string assert_safe_path(const string &filename) {
    if (filename.empty() ||
        filename == "." ||
        filename.find("..") != string::npos ||
        filename.find('/') != string::npos ||
        filename.find('\0') != string::npos)
        throw internal_error("file name is not safe: " + filename);
    return filename;
}

}  // namespace runner
