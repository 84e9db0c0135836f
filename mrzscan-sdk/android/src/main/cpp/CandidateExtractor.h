#ifndef CANDIDATE_EXTRACTOR_H
#define CANDIDATE_EXTRACTOR_H

#include <optional>
#include <string>
#include <vector>
#include "ScanConfig.h"

namespace mrzscan {

/**
 * CandidateExtractor - picks MRZ lines and the CAN out of raw OCR output
 *
 * OCR returns lines unordered, partial and noisy. The extractor keeps lines
 * that look like MRZ (long, containing "<<"), ranks them and assembles a
 * 3-line (TD1) or 2-line (TD2/TD3) block for MRZParser. It does not validate:
 * off-length lines simply fail format detection later.
 *
 * All functions are pure and safe to call concurrently.
 */
class CandidateExtractor {
public:
    /**
     * Assemble the most likely MRZ block from one frame's OCR lines
     * @param lines Raw OCR strings, any order
     * @param config Thresholds
     * @return Lines joined by '\n' in ranked order, or nullopt
     */
    static std::optional<std::string> extractMRZCandidate(
        const std::vector<std::string>& lines,
        const HeuristicConfig& config = HeuristicConfig());

    /**
     * Find a Card Access Number in lines that are not MRZ
     * Labeled lines (CAN / CARD / ACCESS) are searched first, then all lines
     * in input order.
     * @param lines Raw OCR strings
     * @param config CAN length and label hints
     * @return First digit run of exactly config.canLength digits, or nullopt
     */
    static std::optional<std::string> extractCAN(
        const std::vector<std::string>& lines,
        const HeuristicConfig& config = HeuristicConfig());

    /**
     * MRZ-likeness score: count('<') * fillerWeight + length
     */
    static int scoreLine(const std::string& line, int fillerWeight = FILLER_SCORE_WEIGHT);

    /**
     * Maximal runs of ASCII digits, in order of appearance
     * "CAN 12-345678" -> {"12", "345678"}
     */
    static std::vector<std::string> digitRuns(const std::string& text);

private:
    /**
     * Normalized OCR line with its MRZ-likeness score
     */
    struct CandidateLine {
        std::string text;
        int score;  // fillers * fillerWeight + length
    };

    /**
     * Normalize, drop empties, keep lines with length >= minLineLength and "<<"
     */
    static std::vector<CandidateLine> collectMRZLike(
        const std::vector<std::string>& lines,
        const HeuristicConfig& config);

    /**
     * Stable descending sort by score; ties keep input order
     */
    static void rankByScore(std::vector<CandidateLine>& candidates);

    static std::optional<std::string> firstRunOfLength(
        const std::vector<std::string>& lines, int length);
};

} // namespace mrzscan

#endif // CANDIDATE_EXTRACTOR_H
