#ifndef MRZ_VALIDATOR_H
#define MRZ_VALIDATOR_H

#include <string>

namespace mrzscan {

/**
 * MRZValidator - ICAO 9303 check digit arithmetic
 *
 * Each character maps to a value (0-9 -> 0-9, A-Z -> 10-35, '<' -> 0),
 * values are weighted 7-3-1 repeating and the check digit is the sum mod 10.
 */
class MRZValidator {
public:
    /**
     * Convert MRZ character to numeric value
     * 0-9 -> 0-9, A-Z -> 10-35, < -> 0
     */
    static int charToValue(char c);

    /**
     * Calculate ICAO checksum for data
     * @param data Fixed-width field (fill characters included)
     * @return Check digit 0-9
     */
    static int calculateChecksum(const std::string& data);

    /**
     * Same as calculateChecksum, as the printed character '0'-'9'
     */
    static char checkDigitChar(const std::string& data);

    /**
     * Validate single check digit
     * @param data Data to validate
     * @param checkDigit Expected check character
     * @return true if checkDigit is a digit equal to the computed one
     */
    static bool validateCheckDigit(const std::string& data, char checkDigit);

private:
    // ICAO 7-3-1 weights
    static const int WEIGHTS[3];
};

} // namespace mrzscan

#endif // MRZ_VALIDATOR_H
