#include "MRZNormalizer.h"
#include <algorithm>
#include <cctype>

using namespace std;

namespace mrzscan {

static char toUpperAscii(char c) {
    return static_cast<char>(toupper(static_cast<unsigned char>(c)));
}

bool MRZNormalizer::isMRZChar(char c) {
    return (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') ||
           c == MRZ_FILLER;
}

bool MRZNormalizer::isMRZCharset(const string& line) {
    return all_of(line.begin(), line.end(), isMRZChar);
}

string MRZNormalizer::normalizeLine(const string& text) {
    string out;
    out.reserve(text.length());

    for (char c : text) {
        char upper = toUpperAscii(c);
        if (isMRZChar(upper)) {
            out += upper;
        }
    }

    return out;
}

string MRZNormalizer::normalizeBlock(const string& text) {
    string out;
    out.reserve(text.length());

    for (char c : text) {
        if (c == '\n') {
            out += c;
            continue;
        }
        if (isspace(static_cast<unsigned char>(c))) {
            continue;  // spaces, tabs, '\r' from CRLF input
        }
        out += toUpperAscii(c);
    }

    return out;
}

vector<string> MRZNormalizer::splitLines(const string& block) {
    vector<string> lines;
    string current;

    for (char c : block) {
        if (c == '\n') {
            if (!current.empty()) lines.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) lines.push_back(current);

    return lines;
}

} // namespace mrzscan
