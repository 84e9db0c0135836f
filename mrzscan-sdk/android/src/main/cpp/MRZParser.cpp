#define TAG "MRZParser"

#include "MRZParser.h"
#include "MRZNormalizer.h"
#include "MRZValidator.h"
#include "Log.h"
#include <tuple>

using namespace std;

namespace mrzscan {

const char* toString(MRZFormat format) {
    switch (format) {
        case MRZFormat::TD1: return "TD1";
        case MRZFormat::TD2: return "TD2";
        case MRZFormat::TD3: return "TD3";
    }
    return "UNKNOWN";
}

const char* toString(MRZParseError error) {
    switch (error) {
        case MRZParseError::NotEnoughLines: return "NotEnoughLines";
        case MRZParseError::WrongLength: return "WrongLength";
        case MRZParseError::InvalidCharset: return "InvalidCharset";
    }
    return "Unknown";
}

// ==================== Format Dispatch ====================

const MRZParser::FormatEntry MRZParser::FORMAT_TABLE[3] = {
    {MRZFormat::TD1, TD1Layout::LINE_COUNT, TD1Layout::LINE_LENGTH, &MRZParser::extractTD1},
    {MRZFormat::TD3, TD3Layout::LINE_COUNT, TD3Layout::LINE_LENGTH, &MRZParser::extractTD3},
    {MRZFormat::TD2, TD2Layout::LINE_COUNT, TD2Layout::LINE_LENGTH, &MRZParser::extractTD2},
};

const MRZParser::FormatEntry* MRZParser::findFormat(const vector<string>& lines) {
    for (const auto& entry : FORMAT_TABLE) {
        if (lines.size() != entry.lineCount) continue;

        bool lengthsMatch = true;
        for (const auto& line : lines) {
            if (line.length() != entry.lineLength) {
                lengthsMatch = false;
                break;
            }
        }
        if (lengthsMatch) return &entry;
    }
    return nullptr;
}

optional<MRZFormat> MRZParser::detectFormat(const vector<string>& lines) {
    const FormatEntry* entry = findFormat(lines);
    if (entry == nullptr) return nullopt;
    return entry->format;
}

ParseResult MRZParser::parseAndValidate(const string& rawText) {
    vector<string> lines = MRZNormalizer::splitLines(MRZNormalizer::normalizeBlock(rawText));

    if (lines.size() < 2) {
        LOGD("parseAndValidate: %zu line(s), need at least 2", lines.size());
        return ParseResult::failure(MRZParseError::NotEnoughLines);
    }

    for (size_t i = 0; i < lines.size(); ++i) {
        if (!MRZNormalizer::isMRZCharset(lines[i])) {
            LOGD("parseAndValidate: line %zu has characters outside the MRZ set", i + 1);
            return ParseResult::failure(MRZParseError::InvalidCharset);
        }
    }

    const FormatEntry* entry = findFormat(lines);
    if (entry == nullptr) {
        LOGD("parseAndValidate: no layout for %zu lines (first line %zu chars)",
             lines.size(), lines[0].length());
        return ParseResult::failure(MRZParseError::WrongLength);
    }

    MRZResult result = entry->extract(lines);

    LOGD("MRZ %s parsed: doc=%d dob=%d exp=%d opt=%d comp=%d valid=%d",
         toString(result.format),
         result.checks.documentNumberOK, result.checks.birthDateOK,
         result.checks.expiryDateOK, result.checks.optionalDataOK,
         result.checks.compositeOK, result.checks.isValid());

    return ParseResult::success(std::move(result));
}

optional<string> MRZParser::buildMRZKey(const string& rawText) {
    ParseResult parsed = parseAndValidate(rawText);
    if (!parsed.ok()) {
        LOGE("buildMRZKey: not an MRZ (%s)", toString(parsed.error));
        return nullopt;
    }
    return parsed.mrz->mrzKey();
}

// ==================== Field Helpers ====================

string MRZParser::field(const vector<string>& lines, const FieldRange& range) {
    return lines[range.line].substr(range.start, range.length());
}

char MRZParser::charAt(const vector<string>& lines, const FieldRange& range) {
    return lines[range.line][range.start];
}

bool MRZParser::validateField(const vector<string>& lines,
                              const FieldRange& data,
                              const FieldRange& checkDigit,
                              const char* label) {
    string value = field(lines, data);
    char check = charAt(lines, checkDigit);

    if (MRZValidator::validateCheckDigit(value, check)) {
        return true;
    }

    LOGD("MRZ %s INVALID: %s check=%c, expected=%d",
         label, value.c_str(), check, MRZValidator::calculateChecksum(value));
    return false;
}

bool MRZParser::validateComposite(const vector<string>& lines, const CompositeRule& rule) {
    string compositeData;
    for (int i = 0; i < rule.partCount; ++i) {
        compositeData += field(lines, rule.parts[i]);
    }

    char compositeCheck = charAt(lines, rule.checkDigit);
    if (MRZValidator::validateCheckDigit(compositeData, compositeCheck)) {
        return true;
    }

    LOGD("MRZ Composite INVALID, check=%c, expected=%d",
         compositeCheck, MRZValidator::calculateChecksum(compositeData));
    return false;
}

string MRZParser::unfill(const string& value) {
    string out;
    out.reserve(value.length());
    for (char c : value) {
        if (c != MRZ_FILLER) out += c;
    }

    size_t first = out.find_first_not_of(" \t");
    if (first == string::npos) return "";
    size_t last = out.find_last_not_of(" \t");
    return out.substr(first, last - first + 1);
}

string MRZParser::decodeNameSegment(const string& segment) {
    string out;
    bool pendingSpace = false;

    for (char c : segment) {
        if (c == MRZ_FILLER || c == ' ') {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out += ' ';
            pendingSpace = false;
        }
        out += c;
    }

    return out;
}

pair<string, string> MRZParser::parseNames(const string& nameField) {
    size_t separator = nameField.find("<<");
    if (separator == string::npos) {
        return {decodeNameSegment(nameField), ""};
    }

    return {decodeNameSegment(nameField.substr(0, separator)),
            decodeNameSegment(nameField.substr(separator + 2))};
}

// ==================== Per-Format Extraction ====================

MRZResult MRZParser::extractTD3(const vector<string>& lines) {
    using namespace TD3Layout;

    MRZResult r;
    r.format = MRZFormat::TD3;
    r.documentType = field(lines, DOCUMENT_TYPE);
    r.issuingCountry = field(lines, ISSUING_COUNTRY);
    tie(r.surnames, r.givenNames) = parseNames(field(lines, NAME));

    r.documentNumberRaw = field(lines, DOCUMENT_NUMBER);
    r.documentNumber = unfill(r.documentNumberRaw);
    r.documentNumberCheckDigit = charAt(lines, DOCUMENT_NUMBER_CD);
    r.nationality = field(lines, NATIONALITY);
    r.birthDateYYMMDD = field(lines, BIRTH_DATE);
    r.birthDateCheckDigit = charAt(lines, BIRTH_DATE_CD);
    r.sex = field(lines, SEX);
    r.expiryDateYYMMDD = field(lines, EXPIRY_DATE);
    r.expiryDateCheckDigit = charAt(lines, EXPIRY_DATE_CD);
    r.optionalData = unfill(field(lines, OPTIONAL_DATA));

    r.checks.lineLengthsOK = true;
    r.checks.charsetOK = true;
    r.checks.documentNumberOK = validateField(lines, DOCUMENT_NUMBER, DOCUMENT_NUMBER_CD, "DocNum");
    r.checks.birthDateOK = validateField(lines, BIRTH_DATE, BIRTH_DATE_CD, "DOB");
    r.checks.expiryDateOK = validateField(lines, EXPIRY_DATE, EXPIRY_DATE_CD, "Expiry");
    r.checks.optionalDataOK = validateField(lines, OPTIONAL_DATA, OPTIONAL_DATA_CD, "Personal");
    r.checks.compositeOK = validateComposite(lines, COMPOSITE);

    return r;
}

MRZResult MRZParser::extractTD2(const vector<string>& lines) {
    using namespace TD2Layout;

    MRZResult r;
    r.format = MRZFormat::TD2;
    r.documentType = field(lines, DOCUMENT_TYPE);
    r.issuingCountry = field(lines, ISSUING_COUNTRY);
    tie(r.surnames, r.givenNames) = parseNames(field(lines, NAME));

    r.documentNumberRaw = field(lines, DOCUMENT_NUMBER);
    r.documentNumber = unfill(r.documentNumberRaw);
    r.documentNumberCheckDigit = charAt(lines, DOCUMENT_NUMBER_CD);
    r.nationality = field(lines, NATIONALITY);
    r.birthDateYYMMDD = field(lines, BIRTH_DATE);
    r.birthDateCheckDigit = charAt(lines, BIRTH_DATE_CD);
    r.sex = field(lines, SEX);
    r.expiryDateYYMMDD = field(lines, EXPIRY_DATE);
    r.expiryDateCheckDigit = charAt(lines, EXPIRY_DATE_CD);
    r.optionalData = unfill(field(lines, OPTIONAL_DATA));

    r.checks.lineLengthsOK = true;
    r.checks.charsetOK = true;
    r.checks.documentNumberOK = validateField(lines, DOCUMENT_NUMBER, DOCUMENT_NUMBER_CD, "DocNum");
    r.checks.birthDateOK = validateField(lines, BIRTH_DATE, BIRTH_DATE_CD, "DOB");
    r.checks.expiryDateOK = validateField(lines, EXPIRY_DATE, EXPIRY_DATE_CD, "Expiry");
    r.checks.optionalDataOK = true;  // No optional data check digit in TD2
    r.checks.compositeOK = validateComposite(lines, COMPOSITE);

    return r;
}

MRZResult MRZParser::extractTD1(const vector<string>& lines) {
    using namespace TD1Layout;

    MRZResult r;
    r.format = MRZFormat::TD1;
    r.documentType = field(lines, DOCUMENT_TYPE);
    r.issuingCountry = field(lines, ISSUING_COUNTRY);
    tie(r.surnames, r.givenNames) = parseNames(field(lines, NAME));

    r.documentNumberRaw = field(lines, DOCUMENT_NUMBER);
    r.documentNumber = unfill(r.documentNumberRaw);
    r.documentNumberCheckDigit = charAt(lines, DOCUMENT_NUMBER_CD);
    r.birthDateYYMMDD = field(lines, BIRTH_DATE);
    r.birthDateCheckDigit = charAt(lines, BIRTH_DATE_CD);
    r.sex = field(lines, SEX);
    r.expiryDateYYMMDD = field(lines, EXPIRY_DATE);
    r.expiryDateCheckDigit = charAt(lines, EXPIRY_DATE_CD);
    r.nationality = field(lines, NATIONALITY);
    r.optionalData = unfill(field(lines, OPTIONAL_DATA_1) + field(lines, OPTIONAL_DATA_2));

    r.checks.lineLengthsOK = true;
    r.checks.charsetOK = true;
    r.checks.documentNumberOK = validateField(lines, DOCUMENT_NUMBER, DOCUMENT_NUMBER_CD, "DocNum");
    r.checks.birthDateOK = validateField(lines, BIRTH_DATE, BIRTH_DATE_CD, "DOB");
    r.checks.expiryDateOK = validateField(lines, EXPIRY_DATE, EXPIRY_DATE_CD, "Expiry");
    r.checks.optionalDataOK = true;  // No optional data check digit in TD1
    r.checks.compositeOK = validateComposite(lines, COMPOSITE);

    return r;
}

} // namespace mrzscan
