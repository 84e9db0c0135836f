#ifndef SCAN_CONFIG_H
#define SCAN_CONFIG_H

#include <string>
#include <vector>

namespace mrzscan {

// MRZ-like line detection
constexpr int MIN_MRZ_LINE_LENGTH = 25;
constexpr int TD1_MIN_LINE_LENGTH = 25;
constexpr int TD1_MAX_LINE_LENGTH = 35;
constexpr int TWO_LINE_MIN_LENGTH = 30;  // TD2/TD3 attempt
constexpr int FILLER_SCORE_WEIGHT = 10;  // score = fillers * weight + length
constexpr int MAX_FILLER_WEIGHT = 1000;   // Keeps fillers * weight within int

// Card Access Number
constexpr int CAN_LENGTH = 6;

// OCR lines below this confidence never reach the heuristic
constexpr float MIN_OCR_CONFIDENCE = 0.4f;

/**
 * Candidate extraction thresholds
 */
struct HeuristicConfig {
    int minLineLength = MIN_MRZ_LINE_LENGTH;
    int td1MinLength = TD1_MIN_LINE_LENGTH;
    int td1MaxLength = TD1_MAX_LINE_LENGTH;
    int twoLineMinLength = TWO_LINE_MIN_LENGTH;
    int fillerWeight = FILLER_SCORE_WEIGHT;
    int canLength = CAN_LENGTH;
    std::vector<std::string> canLabels = {"CAN", "CARD", "ACCESS"};
};

/**
 * Frame pump behaviour
 */
struct PumpConfig {
    float minConfidence = MIN_OCR_CONFIDENCE;
    bool lockOnValid = false;  // Stop publishing after the first valid MRZ until reset
};

struct ScanConfig {
    HeuristicConfig heuristic;
    PumpConfig pump;
    std::string logLevel = "info";
};

/**
 * Load overrides from a YAML/JSON/XML file via cv::FileStorage
 *
 * Example (YAML):
 *   %YAML:1.0
 *   heuristic:
 *     minLineLength: 25
 *     canLabels: [ "CAN", "CARD", "ACCESS" ]
 *   pump:
 *     minConfidence: 0.4
 *     lockOnValid: 1
 *   logLevel: debug
 *
 * Missing keys keep their current value in out. Invalid values are
 * rejected one by one and logged.
 * @param path Config file path
 * @param out Config to update
 * @return false if the file could not be opened or parsed (out untouched)
 */
bool loadScanConfig(const std::string& path, ScanConfig& out);

/**
 * Same as loadScanConfig, reading from an in-memory document
 */
bool loadScanConfigFromString(const std::string& content, ScanConfig& out);

/**
 * Apply logLevel ("trace", "debug", "info", "warn", "error", "off")
 * to the host logger. No-op on Android, where logcat filters by priority.
 * @return false for an unknown level name
 */
bool applyLogLevel(const std::string& level);

} // namespace mrzscan

#endif // SCAN_CONFIG_H
