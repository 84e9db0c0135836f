#include "MRZValidator.h"
#include <cctype>

using namespace std;

namespace mrzscan {

const int MRZValidator::WEIGHTS[3] = {7, 3, 1};

int MRZValidator::charToValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'Z') return c - 'A' + 10;
    return 0;  // '<' filler
}

int MRZValidator::calculateChecksum(const string& data) {
    int sum = 0;
    for (size_t i = 0; i < data.length(); ++i) {
        int value = charToValue(data[i]);
        int weight = WEIGHTS[i % 3];
        sum += value * weight;
    }
    return sum % 10;
}

char MRZValidator::checkDigitChar(const string& data) {
    return static_cast<char>('0' + calculateChecksum(data));
}

bool MRZValidator::validateCheckDigit(const string& data, char checkDigit) {
    if (!isdigit(static_cast<unsigned char>(checkDigit))) return false;
    int expected = calculateChecksum(data);
    int actual = checkDigit - '0';
    return expected == actual;
}

} // namespace mrzscan
