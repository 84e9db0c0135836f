#ifndef MRZ_PARSER_H
#define MRZ_PARSER_H

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "MRZLayout.h"
#include "MRZResult.h"

namespace mrzscan {

/**
 * MRZParser - format detection, field extraction and check digit validation
 *
 * Accepts an already assembled MRZ block (2 or 3 lines separated by '\n').
 * Structural problems are returned as MRZParseError; check digit mismatches
 * are recorded in MRZResult::Checks.
 */
class MRZParser {
public:
    /**
     * Parse and validate an MRZ block
     * @param rawText MRZ lines separated by '\n', whitespace is ignored
     * @return ParseResult holding the record or the structural error
     */
    static ParseResult parseAndValidate(const std::string& rawText);

    /**
     * Parse rawText and derive the chip access key
     * @param rawText MRZ block as accepted by parseAndValidate
     * @return mrzKey of the parsed record, or nullopt on structural error
     */
    static std::optional<std::string> buildMRZKey(const std::string& rawText);

    /**
     * Structural format detection (line count + exact line length only)
     * @param lines Normalized, non-empty lines
     * @return Detected format or nullopt when no layout matches
     */
    static std::optional<MRZFormat> detectFormat(const std::vector<std::string>& lines);

    /**
     * Decode an MRZ name field into surname and given names
     * "ERIKSSON<<ANNA<MARIA<<<<" -> {"ERIKSSON", "ANNA MARIA"}
     * @param field Raw name field including fill characters
     * @return {surnames, givenNames}
     */
    static std::pair<std::string, std::string> parseNames(const std::string& field);

    /**
     * Remove '<' fill characters and surrounding whitespace
     */
    static std::string unfill(const std::string& value);

private:
    using Extractor = MRZResult (*)(const std::vector<std::string>& lines);

    /**
     * Dispatch table entry keyed by (line count, line length)
     */
    struct FormatEntry {
        MRZFormat format;
        size_t lineCount;
        size_t lineLength;
        Extractor extract;
    };

    static const FormatEntry FORMAT_TABLE[3];

    static const FormatEntry* findFormat(const std::vector<std::string>& lines);

    static MRZResult extractTD1(const std::vector<std::string>& lines);
    static MRZResult extractTD2(const std::vector<std::string>& lines);
    static MRZResult extractTD3(const std::vector<std::string>& lines);

    /**
     * Slice a field out of the block. Bounds were validated by findFormat.
     */
    static std::string field(const std::vector<std::string>& lines, const FieldRange& range);
    static char charAt(const std::vector<std::string>& lines, const FieldRange& range);

    static bool validateField(const std::vector<std::string>& lines,
                              const FieldRange& data,
                              const FieldRange& checkDigit,
                              const char* label);
    static bool validateComposite(const std::vector<std::string>& lines, const CompositeRule& rule);

    /**
     * Collapse '<' runs into single spaces and trim
     */
    static std::string decodeNameSegment(const std::string& segment);
};

} // namespace mrzscan

#endif // MRZ_PARSER_H
