#define TAG "CandidateExtractor"

#include "CandidateExtractor.h"
#include "MRZNormalizer.h"
#include "Log.h"
#include <algorithm>
#include <cctype>

using namespace std;

namespace mrzscan {

// ==================== MRZ Line Assembly ====================

int CandidateExtractor::scoreLine(const string& line, int fillerWeight) {
    int fillers = static_cast<int>(count(line.begin(), line.end(), MRZ_FILLER));
    return fillers * fillerWeight + static_cast<int>(line.length());
}

vector<CandidateExtractor::CandidateLine> CandidateExtractor::collectMRZLike(
    const vector<string>& lines,
    const HeuristicConfig& config
) {
    vector<CandidateLine> candidates;

    for (const auto& raw : lines) {
        string line = MRZNormalizer::normalizeLine(raw);
        if (line.empty()) continue;

        // MRZ lines are long and padded with "<<"
        if (static_cast<int>(line.length()) < config.minLineLength) continue;
        if (line.find("<<") == string::npos) continue;

        candidates.push_back({line, scoreLine(line, config.fillerWeight)});
    }

    return candidates;
}

void CandidateExtractor::rankByScore(vector<CandidateLine>& candidates) {
    stable_sort(candidates.begin(), candidates.end(),
                [](const CandidateLine& a, const CandidateLine& b) {
                    return a.score > b.score;
                });
}

optional<string> CandidateExtractor::extractMRZCandidate(
    const vector<string>& lines,
    const HeuristicConfig& config
) {
    vector<CandidateLine> mrzLike = collectMRZLike(lines, config);
    if (mrzLike.empty()) {
        return nullopt;
    }

    // Step 1: TD1 (3 lines, ~30 chars each)
    vector<CandidateLine> td1;
    for (const auto& c : mrzLike) {
        int len = static_cast<int>(c.text.length());
        if (len >= config.td1MinLength && len <= config.td1MaxLength) {
            td1.push_back(c);
        }
    }

    if (td1.size() >= 3) {
        rankByScore(td1);

        // Ranked order, not document order
        bool longEnough = true;
        for (size_t i = 0; i < 3; ++i) {
            if (static_cast<int>(td1[i].text.length()) < config.td1MinLength) longEnough = false;
        }

        if (longEnough) {
            LOGD("extractMRZCandidate: TD1 candidate, scores %d/%d/%d",
                 td1[0].score, td1[1].score, td1[2].score);
            return td1[0].text + "\n" + td1[1].text + "\n" + td1[2].text;
        }
    }

    // Step 2: TD2/TD3 (2 lines)
    if (mrzLike.size() >= 2) {
        rankByScore(mrzLike);

        const CandidateLine& l1 = mrzLike[0];
        const CandidateLine& l2 = mrzLike[1];
        if (static_cast<int>(l1.text.length()) >= config.twoLineMinLength &&
            static_cast<int>(l2.text.length()) >= config.twoLineMinLength) {
            LOGD("extractMRZCandidate: 2-line candidate, lengths %zu/%zu",
                 l1.text.length(), l2.text.length());
            return l1.text + "\n" + l2.text;
        }
    }

    return nullopt;
}

// ==================== CAN ====================

vector<string> CandidateExtractor::digitRuns(const string& text) {
    vector<string> runs;
    string current;

    for (char c : text) {
        if (c >= '0' && c <= '9') {
            current += c;
        } else if (!current.empty()) {
            runs.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        runs.push_back(current);
    }

    return runs;
}

optional<string> CandidateExtractor::firstRunOfLength(const vector<string>& lines, int length) {
    for (const auto& line : lines) {
        for (const auto& run : digitRuns(line)) {
            if (static_cast<int>(run.length()) == length) {
                return run;
            }
        }
    }
    return nullopt;
}

optional<string> CandidateExtractor::extractCAN(
    const vector<string>& lines,
    const HeuristicConfig& config
) {
    // CAN is printed away from the MRZ
    vector<string> eligible;
    for (const auto& line : lines) {
        if (line.find(MRZ_FILLER) == string::npos) {
            eligible.push_back(line);
        }
    }

    vector<string> labeled;
    for (const auto& line : eligible) {
        string upper = line;
        transform(upper.begin(), upper.end(), upper.begin(),
                  [](unsigned char c) { return static_cast<char>(toupper(c)); });

        for (const auto& label : config.canLabels) {
            if (upper.find(label) != string::npos) {
                labeled.push_back(line);
                break;
            }
        }
    }

    optional<string> can = firstRunOfLength(labeled, config.canLength);
    if (can) {
        LOGD("extractCAN: labeled match");
        return can;
    }

    return firstRunOfLength(eligible, config.canLength);
}

} // namespace mrzscan
