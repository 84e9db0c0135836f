#define TAG "ScanConfig"

#include "ScanConfig.h"
#include "Log.h"
#include <opencv2/core.hpp>
#include <limits>

using namespace std;

namespace mrzscan {

// ==================== FileNode Readers ====================

static void readInt(const cv::FileNode& parent, const char* key, int& value,
                    int minValue, int maxValue = numeric_limits<int>::max()) {
    cv::FileNode node = parent[key];
    if (node.empty()) return;

    if (!node.isInt()) {
        LOGW("%s is not an integer, keeping %d", key, value);
        return;
    }

    int parsed = static_cast<int>(node);
    if (parsed < minValue) {
        LOGW("%s=%d below minimum %d, keeping %d", key, parsed, minValue, value);
        return;
    }
    if (parsed > maxValue) {
        LOGW("%s=%d above maximum %d, keeping %d", key, parsed, maxValue, value);
        return;
    }
    value = parsed;
}

static void readFloat(const cv::FileNode& parent, const char* key, float& value, float minValue, float maxValue) {
    cv::FileNode node = parent[key];
    if (node.empty()) return;

    if (!node.isReal() && !node.isInt()) {
        LOGW("%s is not a number, keeping %.2f", key, value);
        return;
    }

    float parsed = static_cast<float>(node);
    if (parsed < minValue || parsed > maxValue) {
        LOGW("%s=%.2f outside [%.2f, %.2f], keeping %.2f", key, parsed, minValue, maxValue, value);
        return;
    }
    value = parsed;
}

static void readBool(const cv::FileNode& parent, const char* key, bool& value) {
    cv::FileNode node = parent[key];
    if (node.empty()) return;

    if (node.isInt()) {
        value = static_cast<int>(node) != 0;
        return;
    }
    if (node.isString()) {
        string text = static_cast<string>(node);
        if (text == "true" || text == "TRUE" || text == "yes") {
            value = true;
            return;
        }
        if (text == "false" || text == "FALSE" || text == "no") {
            value = false;
            return;
        }
    }
    LOGW("%s is not a boolean, keeping %d", key, value);
}

static void readString(const cv::FileNode& parent, const char* key, string& value) {
    cv::FileNode node = parent[key];
    if (node.empty()) return;

    if (!node.isString()) {
        LOGW("%s is not a string, keeping \"%s\"", key, value.c_str());
        return;
    }
    value = static_cast<string>(node);
}

static void readStringList(const cv::FileNode& parent, const char* key, vector<string>& value) {
    cv::FileNode node = parent[key];
    if (node.empty()) return;

    if (!node.isSeq()) {
        LOGW("%s is not a list, keeping %zu entries", key, value.size());
        return;
    }

    vector<string> parsed;
    for (cv::FileNodeIterator it = node.begin(); it != node.end(); ++it) {
        cv::FileNode item = *it;
        if (!item.isString()) {
            LOGW("%s contains a non-string entry, keeping %zu entries", key, value.size());
            return;
        }
        string label = static_cast<string>(item);
        if (!label.empty()) parsed.push_back(label);
    }
    value = parsed;
}

// ==================== Loading ====================

static void readConfig(const cv::FileStorage& fs, ScanConfig& out) {
    ScanConfig cfg = out;

    cv::FileNode heuristic = fs["heuristic"];
    if (!heuristic.empty()) {
        HeuristicConfig& h = cfg.heuristic;
        readInt(heuristic, "minLineLength", h.minLineLength, 1);
        readInt(heuristic, "td1MinLength", h.td1MinLength, 1);
        readInt(heuristic, "td1MaxLength", h.td1MaxLength, 1);
        readInt(heuristic, "twoLineMinLength", h.twoLineMinLength, 1);
        readInt(heuristic, "fillerWeight", h.fillerWeight, 0, MAX_FILLER_WEIGHT);
        readInt(heuristic, "canLength", h.canLength, 1);
        readStringList(heuristic, "canLabels", h.canLabels);

        if (h.td1MinLength > h.td1MaxLength) {
            LOGW("td1MinLength %d > td1MaxLength %d, keeping [%d, %d]",
                 h.td1MinLength, h.td1MaxLength,
                 out.heuristic.td1MinLength, out.heuristic.td1MaxLength);
            h.td1MinLength = out.heuristic.td1MinLength;
            h.td1MaxLength = out.heuristic.td1MaxLength;
        }
    }

    cv::FileNode pump = fs["pump"];
    if (!pump.empty()) {
        readFloat(pump, "minConfidence", cfg.pump.minConfidence, 0.0f, 1.0f);
        readBool(pump, "lockOnValid", cfg.pump.lockOnValid);
    }

    readString(fs.root(), "logLevel", cfg.logLevel);

    out = cfg;
}

bool loadScanConfig(const string& path, ScanConfig& out) {
    try {
        cv::FileStorage fs(path, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            LOGE("loadScanConfig: cannot open %s", path.c_str());
            return false;
        }

        readConfig(fs, out);
        LOGI("loadScanConfig: loaded %s (logLevel=%s)", path.c_str(), out.logLevel.c_str());
        return true;

    } catch (const cv::Exception& e) {
        LOGE("loadScanConfig: %s is malformed: %s", path.c_str(), e.what());
        return false;
    }
}

bool loadScanConfigFromString(const string& content, ScanConfig& out) {
    try {
        cv::FileStorage fs(content, cv::FileStorage::READ | cv::FileStorage::MEMORY);
        if (!fs.isOpened()) {
            LOGE("loadScanConfigFromString: unreadable document");
            return false;
        }

        readConfig(fs, out);
        return true;

    } catch (const cv::Exception& e) {
        LOGE("loadScanConfigFromString: malformed document: %s", e.what());
        return false;
    }
}

bool applyLogLevel(const string& level) {
#if defined(__ANDROID__)
    static const char* const LEVELS[] = {"trace", "debug", "info", "warn", "error", "off"};
    for (const char* name : LEVELS) {
        if (level == name) return true;
    }
    LOGW("applyLogLevel: unknown level \"%s\"", level.c_str());
    return false;
#else
    spdlog::level::level_enum parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        LOGW("applyLogLevel: unknown level \"%s\"", level.c_str());
        return false;
    }
    spdlog::set_level(parsed);
    return true;
#endif
}

} // namespace mrzscan
