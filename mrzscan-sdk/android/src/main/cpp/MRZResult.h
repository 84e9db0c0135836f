#ifndef MRZ_RESULT_H
#define MRZ_RESULT_H

#include <optional>
#include <string>
#include <utility>

namespace mrzscan {

/**
 * ICAO 9303 MRZ layout classes
 * TD1: 3 lines x 30 (ID-1 card)
 * TD2: 2 lines x 36 (ID-2 document)
 * TD3: 2 lines x 44 (passport booklet)
 */
enum class MRZFormat : int {
    TD1 = 0,
    TD2 = 1,
    TD3 = 2
};

/**
 * Structural parse failures. Checksum mismatches are not errors,
 * they are reported through MRZResult::Checks.
 */
enum class MRZParseError : int {
    NotEnoughLines = 0,  // Fewer than 2 non-empty lines
    WrongLength = 1,     // Line count/length combination matches no format
    InvalidCharset = 2   // Character outside A-Z, 0-9, <
};

/**
 * Per-field check digit outcome
 */
struct Checks {
    bool lineLengthsOK;
    bool charsetOK;
    bool documentNumberOK;
    bool birthDateOK;
    bool expiryDateOK;
    bool optionalDataOK;  // Always true for TD1/TD2 (no separate check digit)
    bool compositeOK;

    /**
     * Primary validity. Optional data and composite results are
     * informational and do not take part, for every format.
     */
    bool isValid() const {
        return lineLengthsOK && charsetOK &&
               documentNumberOK && birthDateOK && expiryDateOK;
    }

    /**
     * All seven flags, including optional data and composite
     */
    bool isStrictlyValid() const {
        return isValid() && optionalDataOK && compositeOK;
    }
};

/**
 * Parsed MRZ record
 * Produced once by MRZParser, treated as read-only afterwards.
 */
struct MRZResult {
    MRZFormat format;
    std::string documentType;
    std::string issuingCountry;
    std::string surnames;
    std::string givenNames;

    std::string documentNumber;     // Fill characters removed
    std::string documentNumberRaw;  // Fixed width, as printed
    char documentNumberCheckDigit;
    std::string nationality;
    std::string birthDateYYMMDD;
    char birthDateCheckDigit;
    std::string sex;
    std::string expiryDateYYMMDD;
    char expiryDateCheckDigit;
    std::string optionalData;       // Fill characters removed

    Checks checks;

    /**
     * Chip access key (BAC/PACE MRZ password):
     * document number + CD + birth date + CD + expiry date + CD.
     * Always derived from the fields, never stored.
     */
    std::string mrzKey() const {
        std::string key;
        key.reserve(documentNumberRaw.size() + birthDateYYMMDD.size() + expiryDateYYMMDD.size() + 3);
        key += documentNumberRaw;
        key += documentNumberCheckDigit;
        key += birthDateYYMMDD;
        key += birthDateCheckDigit;
        key += expiryDateYYMMDD;
        key += expiryDateCheckDigit;
        return key;
    }
};

/**
 * Outcome of MRZParser::parseAndValidate: a record or a structural error
 */
struct ParseResult {
    std::optional<MRZResult> mrz;
    MRZParseError error = MRZParseError::NotEnoughLines;  // Meaningful only when mrz is empty

    bool ok() const { return mrz.has_value(); }

    static ParseResult success(MRZResult result) {
        ParseResult r;
        r.mrz = std::move(result);
        return r;
    }

    static ParseResult failure(MRZParseError e) {
        ParseResult r;
        r.error = e;
        return r;
    }
};

const char* toString(MRZFormat format);
const char* toString(MRZParseError error);

} // namespace mrzscan

#endif // MRZ_RESULT_H
