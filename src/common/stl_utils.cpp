#include "common/stl_utils.hpp"
#include <algorithm>
#include <cctype>

using namespace std;

size_t line_of(const string &text, size_t pos) {
    pos = min(pos, text.size());
    return 1 + count(text.begin(), text.begin() + pos, '\n');
}

collapsed_text collapse_whitespace(const string &text) {
    collapsed_text result;
    result.text.reserve(text.size());
    result.offsets.reserve(text.size());
    for (size_t i = 0; i < text.size();) {
        if (!isspace((unsigned char)text[i])) {
            result.text += text[i];
            result.offsets.push_back(i++);
            continue;
        }
        size_t start = i;
        bool newline = false;
        for (; i < text.size() && isspace((unsigned char)text[i]); ++i)
            newline = newline || text[i] == '\n';
        result.text += newline ? '\n' : ' ';
        result.offsets.push_back(start);
    }
    return result;
}
