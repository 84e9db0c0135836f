#ifndef MRZ_NORMALIZER_H
#define MRZ_NORMALIZER_H

#include <string>
#include <vector>

namespace mrzscan {

constexpr char MRZ_FILLER = '<';

/**
 * MRZNormalizer - text cleanup shared by the parser and the OCR heuristic
 *
 * Normalization never fails. Missing data shows up further downstream
 * as empty lines or a structural parse error.
 */
class MRZNormalizer {
public:
    /**
     * Normalize a single OCR line
     * Uppercases and keeps only MRZ characters (newlines dropped too).
     * @param text Raw OCR text
     * @return Filtered line, possibly empty
     */
    static std::string normalizeLine(const std::string& text);

    /**
     * Normalize a multi-line MRZ block for the parser
     * Uppercases and strips whitespace except '\n'. Other symbols are kept
     * so the charset check can reject them.
     * @param text Raw MRZ text, lines separated by '\n'
     * @return Normalized block
     */
    static std::string normalizeBlock(const std::string& text);

    /**
     * Split a normalized block on '\n', dropping empty lines
     */
    static std::vector<std::string> splitLines(const std::string& block);

    /**
     * True if c is A-Z, 0-9 or '<'
     */
    static bool isMRZChar(char c);

    /**
     * True if every character of line is A-Z, 0-9 or '<'
     */
    static bool isMRZCharset(const std::string& line);
};

} // namespace mrzscan

#endif // MRZ_NORMALIZER_H
