#ifndef MRZ_LAYOUT_H
#define MRZ_LAYOUT_H

/**
 * MRZLayout - ICAO 9303 fixed field positions for TD1, TD2 and TD3
 *
 * All ranges are 0-indexed and half-open [start, end) within one line.
 * Line lengths are validated once by format detection, so every range
 * below is in bounds for a line that reached the extractor.
 */

namespace mrzscan {

/**
 * Field position inside an MRZ block
 */
struct FieldRange {
    int line;   // 0-based line index
    int start;  // First character
    int end;    // One past the last character

    constexpr int length() const { return end - start; }
};

/**
 * Composite check: concatenation of parts validated against checkDigit
 */
constexpr int MAX_COMPOSITE_PARTS = 4;

struct CompositeRule {
    FieldRange parts[MAX_COMPOSITE_PARTS];
    int partCount;
    FieldRange checkDigit;
};

/**
 * TD3 - passport booklet, 2 lines x 44
 *
 * P<UTOERIKSSON<<ANNA<MARIA<<<<<<<<<<<<<<<<<<<
 * L898902C36UTO7408122F1204159ZE184226B<<<<<10
 */
namespace TD3Layout {

    constexpr int LINE_COUNT = 2;
    constexpr int LINE_LENGTH = 44;

    constexpr FieldRange DOCUMENT_TYPE = {.line = 0, .start = 0, .end = 2};
    constexpr FieldRange ISSUING_COUNTRY = {.line = 0, .start = 2, .end = 5};
    constexpr FieldRange NAME = {.line = 0, .start = LINE_LENGTH - 39, .end = LINE_LENGTH};

    constexpr FieldRange DOCUMENT_NUMBER = {.line = 1, .start = 0, .end = 9};
    constexpr FieldRange DOCUMENT_NUMBER_CD = {.line = 1, .start = 9, .end = 10};
    constexpr FieldRange NATIONALITY = {.line = 1, .start = 10, .end = 13};
    constexpr FieldRange BIRTH_DATE = {.line = 1, .start = 13, .end = 19};
    constexpr FieldRange BIRTH_DATE_CD = {.line = 1, .start = 19, .end = 20};
    constexpr FieldRange SEX = {.line = 1, .start = 20, .end = 21};
    constexpr FieldRange EXPIRY_DATE = {.line = 1, .start = 21, .end = 27};
    constexpr FieldRange EXPIRY_DATE_CD = {.line = 1, .start = 27, .end = 28};
    constexpr FieldRange OPTIONAL_DATA = {.line = 1, .start = 28, .end = 42};  // Personal number
    constexpr FieldRange OPTIONAL_DATA_CD = {.line = 1, .start = 42, .end = 43};

    constexpr CompositeRule COMPOSITE = {
        .parts = {
            {.line = 1, .start = 0, .end = 10},   // Document number + CD
            {.line = 1, .start = 13, .end = 20},  // Birth date + CD
            {.line = 1, .start = 21, .end = 28},  // Expiry date + CD
            {.line = 1, .start = 28, .end = 43}   // Personal number + CD
        },
        .partCount = 4,
        .checkDigit = {.line = 1, .start = 43, .end = 44}
    };
}

/**
 * TD2 - 2 lines x 36
 *
 * I<UTOERIKSSON<<ANNA<MARIA<<<<<<<<<<<
 * D231458907UTO7408122F1204159<<<<<<<6
 */
namespace TD2Layout {

    constexpr int LINE_COUNT = 2;
    constexpr int LINE_LENGTH = 36;

    constexpr FieldRange DOCUMENT_TYPE = {.line = 0, .start = 0, .end = 2};
    constexpr FieldRange ISSUING_COUNTRY = {.line = 0, .start = 2, .end = 5};
    constexpr FieldRange NAME = {.line = 0, .start = LINE_LENGTH - 31, .end = LINE_LENGTH};

    constexpr FieldRange DOCUMENT_NUMBER = {.line = 1, .start = 0, .end = 9};
    constexpr FieldRange DOCUMENT_NUMBER_CD = {.line = 1, .start = 9, .end = 10};
    constexpr FieldRange NATIONALITY = {.line = 1, .start = 10, .end = 13};
    constexpr FieldRange BIRTH_DATE = {.line = 1, .start = 13, .end = 19};
    constexpr FieldRange BIRTH_DATE_CD = {.line = 1, .start = 19, .end = 20};
    constexpr FieldRange SEX = {.line = 1, .start = 20, .end = 21};
    constexpr FieldRange EXPIRY_DATE = {.line = 1, .start = 21, .end = 27};
    constexpr FieldRange EXPIRY_DATE_CD = {.line = 1, .start = 27, .end = 28};
    constexpr FieldRange OPTIONAL_DATA = {.line = 1, .start = 28, .end = 35};

    constexpr CompositeRule COMPOSITE = {
        .parts = {
            {.line = 1, .start = 0, .end = 10},
            {.line = 1, .start = 13, .end = 20},
            {.line = 1, .start = 21, .end = 28},
            {.line = 1, .start = 28, .end = 35}
        },
        .partCount = 4,
        .checkDigit = {.line = 1, .start = 35, .end = 36}
    };
}

/**
 * TD1 - ID-1 card, 3 lines x 30
 *
 * I<UTOD231458907<<<<<<<<<<<<<<<
 * 7408122F1204159UTO<<<<<<<<<<<6
 * ERIKSSON<<ANNA<MARIA<<<<<<<<<<
 */
namespace TD1Layout {

    constexpr int LINE_COUNT = 3;
    constexpr int LINE_LENGTH = 30;

    constexpr FieldRange DOCUMENT_TYPE = {.line = 0, .start = 0, .end = 2};
    constexpr FieldRange ISSUING_COUNTRY = {.line = 0, .start = 2, .end = 5};
    constexpr FieldRange DOCUMENT_NUMBER = {.line = 0, .start = 5, .end = 14};
    constexpr FieldRange DOCUMENT_NUMBER_CD = {.line = 0, .start = 14, .end = 15};
    constexpr FieldRange OPTIONAL_DATA_1 = {.line = 0, .start = 15, .end = 30};

    constexpr FieldRange BIRTH_DATE = {.line = 1, .start = 0, .end = 6};
    constexpr FieldRange BIRTH_DATE_CD = {.line = 1, .start = 6, .end = 7};
    constexpr FieldRange SEX = {.line = 1, .start = 7, .end = 8};
    constexpr FieldRange EXPIRY_DATE = {.line = 1, .start = 8, .end = 14};
    constexpr FieldRange EXPIRY_DATE_CD = {.line = 1, .start = 14, .end = 15};
    constexpr FieldRange NATIONALITY = {.line = 1, .start = 15, .end = 18};
    constexpr FieldRange OPTIONAL_DATA_2 = {.line = 1, .start = 18, .end = 29};

    constexpr FieldRange NAME = {.line = 2, .start = 0, .end = LINE_LENGTH};

    // Composite = line1[5-29] + line2[0-6] + line2[8-14] + line2[18-28]
    constexpr CompositeRule COMPOSITE = {
        .parts = {
            {.line = 0, .start = 5, .end = 30},   // Doc number + CD + optional 1
            {.line = 1, .start = 0, .end = 7},    // Birth date + CD
            {.line = 1, .start = 8, .end = 15},   // Expiry date + CD
            {.line = 1, .start = 18, .end = 29}   // Optional 2
        },
        .partCount = 4,
        .checkDigit = {.line = 1, .start = 29, .end = 30}
    };
}

} // namespace mrzscan

#endif // MRZ_LAYOUT_H
