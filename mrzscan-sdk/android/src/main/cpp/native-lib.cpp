#define TAG "NativeLib"

#include <jni.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "CandidateExtractor.h"
#include "FramePump.h"
#include "MRZParser.h"
#include "ScanConfig.h"
#include "Log.h"

// ==================== Helper Functions ====================

// Convert Java String to std::string (empty for null)
static std::string toStdString(JNIEnv* env, jstring value) {
    if (value == nullptr) return std::string();

    const char* chars = env->GetStringUTFChars(value, 0);
    if (chars == nullptr) return std::string();

    std::string result(chars);
    env->ReleaseStringUTFChars(value, chars);
    return result;
}

// Convert Java String[] to std::vector<std::string>
static std::vector<std::string> toStringVector(JNIEnv* env, jobjectArray array) {
    std::vector<std::string> result;
    if (array == nullptr) return result;

    jsize count = env->GetArrayLength(array);
    result.reserve(count);
    for (jsize i = 0; i < count; ++i) {
        jstring item = static_cast<jstring>(env->GetObjectArrayElement(array, i));
        result.push_back(toStdString(env, item));
        env->DeleteLocalRef(item);
    }
    return result;
}

// Convert std::vector<std::string> to Java String[]
static jobjectArray toJavaStringArray(JNIEnv* env, const std::vector<std::string>& values) {
    jclass stringClass = env->FindClass("java/lang/String");
    jobjectArray array = env->NewObjectArray(static_cast<jsize>(values.size()), stringClass, nullptr);
    if (array == nullptr) {
        LOGE("toJavaStringArray: allocation failed");
        return nullptr;
    }

    for (size_t i = 0; i < values.size(); ++i) {
        jstring item = env->NewStringUTF(values[i].c_str());
        env->SetObjectArrayElement(array, static_cast<jsize>(i), item);
        env->DeleteLocalRef(item);
    }
    return array;
}

static jstring toJavaStringOrNull(JNIEnv* env, const std::optional<std::string>& value) {
    if (!value) return nullptr;
    return env->NewStringUTF(value->c_str());
}

static mrzscan::FramePump* pumpFromHandle(jlong handle) {
    return reinterpret_cast<mrzscan::FramePump*>(handle);
}

// ==================== MRZ Parser ====================

/**
 * Parse and validate an MRZ block
 * @return [format, documentType, issuingCountry, surnames, givenNames,
 *          documentNumber, nationality, birthDate, sex, expiryDate,
 *          optionalData, isValid, mrzKey] or null if not an MRZ
 */
extern "C" JNIEXPORT jobjectArray JNICALL
Java_com_mrzscan_sdk_core_NativeProcessor_parseMRZ(
        JNIEnv* env,
        jobject /* this */,
        jstring raw) {

    try {
        mrzscan::ParseResult parsed = mrzscan::MRZParser::parseAndValidate(toStdString(env, raw));
        if (!parsed.ok()) {
            LOGD("parseMRZ: %s", mrzscan::toString(parsed.error));
            return nullptr;
        }

        const mrzscan::MRZResult& r = *parsed.mrz;
        return toJavaStringArray(env, {
            mrzscan::toString(r.format),
            r.documentType,
            r.issuingCountry,
            r.surnames,
            r.givenNames,
            r.documentNumber,
            r.nationality,
            r.birthDateYYMMDD,
            r.sex,
            r.expiryDateYYMMDD,
            r.optionalData,
            r.checks.isValid() ? "true" : "false",
            r.mrzKey()
        });

    } catch (std::exception& e) {
        LOGE("parseMRZ error: %s", e.what());
        return nullptr;
    }
}

/**
 * Structural error code for an MRZ block
 * @return -1 if it parses, otherwise MRZParseError ordinal
 */
extern "C" JNIEXPORT jint JNICALL
Java_com_mrzscan_sdk_core_NativeProcessor_getMRZError(
        JNIEnv* env,
        jobject /* this */,
        jstring raw) {

    mrzscan::ParseResult parsed = mrzscan::MRZParser::parseAndValidate(toStdString(env, raw));
    if (parsed.ok()) return -1;
    return static_cast<jint>(parsed.error);
}

/**
 * Check digit flags packed as bits:
 * 0 documentNumber, 1 birthDate, 2 expiryDate, 3 optionalData, 4 composite
 * @return Bitmask, or -1 if not an MRZ
 */
extern "C" JNIEXPORT jint JNICALL
Java_com_mrzscan_sdk_core_NativeProcessor_getMRZChecks(
        JNIEnv* env,
        jobject /* this */,
        jstring raw) {

    mrzscan::ParseResult parsed = mrzscan::MRZParser::parseAndValidate(toStdString(env, raw));
    if (!parsed.ok()) return -1;

    const mrzscan::Checks& c = parsed.mrz->checks;
    jint mask = 0;
    if (c.documentNumberOK) mask |= 1 << 0;
    if (c.birthDateOK) mask |= 1 << 1;
    if (c.expiryDateOK) mask |= 1 << 2;
    if (c.optionalDataOK) mask |= 1 << 3;
    if (c.compositeOK) mask |= 1 << 4;
    return mask;
}

/**
 * Chip access key for BAC/PACE
 * @return mrzKey or null if the text is not an MRZ
 */
extern "C" JNIEXPORT jstring JNICALL
Java_com_mrzscan_sdk_core_NativeProcessor_buildMRZKey(
        JNIEnv* env,
        jobject /* this */,
        jstring raw) {

    return toJavaStringOrNull(env, mrzscan::MRZParser::buildMRZKey(toStdString(env, raw)));
}

// ==================== Candidate Extraction ====================

extern "C" JNIEXPORT jstring JNICALL
Java_com_mrzscan_sdk_core_NativeProcessor_extractMRZCandidate(
        JNIEnv* env,
        jobject /* this */,
        jobjectArray lines) {

    try {
        return toJavaStringOrNull(env,
            mrzscan::CandidateExtractor::extractMRZCandidate(toStringVector(env, lines)));
    } catch (std::exception& e) {
        LOGE("extractMRZCandidate error: %s", e.what());
        return nullptr;
    }
}

extern "C" JNIEXPORT jstring JNICALL
Java_com_mrzscan_sdk_core_NativeProcessor_extractCAN(
        JNIEnv* env,
        jobject /* this */,
        jobjectArray lines) {

    try {
        return toJavaStringOrNull(env,
            mrzscan::CandidateExtractor::extractCAN(toStringVector(env, lines)));
    } catch (std::exception& e) {
        LOGE("extractCAN error: %s", e.what());
        return nullptr;
    }
}

// ==================== Frame Pump ====================

/**
 * Create a scan session fed by ML Kit lines from the Java side
 * @param configPath Optional config file, null for defaults
 * @return Opaque handle, 0 on failure
 */
extern "C" JNIEXPORT jlong JNICALL
Java_com_mrzscan_sdk_core_NativeProcessor_createFramePump(
        JNIEnv* env,
        jobject /* this */,
        jstring configPath) {

    try {
        mrzscan::ScanConfig config;
        std::string path = toStdString(env, configPath);
        if (!path.empty() && !mrzscan::loadScanConfig(path, config)) {
            LOGW("createFramePump: using default config");
        }
        if (!mrzscan::applyLogLevel(config.logLevel)) {
            LOGW("createFramePump: ignoring logLevel \"%s\"", config.logLevel.c_str());
        }

        // Ownership passes to the Java handle until destroyFramePump
        auto pump = std::make_unique<mrzscan::FramePump>(nullptr, config);
        return reinterpret_cast<jlong>(pump.release());

    } catch (std::exception& e) {
        LOGE("createFramePump error: %s", e.what());
        return 0;
    }
}

extern "C" JNIEXPORT void JNICALL
Java_com_mrzscan_sdk_core_NativeProcessor_destroyFramePump(
        JNIEnv* /* env */,
        jobject /* this */,
        jlong handle) {

    std::unique_ptr<mrzscan::FramePump> pump(pumpFromHandle(handle));
}

/**
 * Submit one frame's recognized lines
 * @return false if the frame was dropped
 */
extern "C" JNIEXPORT jboolean JNICALL
Java_com_mrzscan_sdk_core_NativeProcessor_submitRecognizedLines(
        JNIEnv* env,
        jobject /* this */,
        jlong handle,
        jobjectArray texts,
        jfloatArray confidences) {

    mrzscan::FramePump* pump = pumpFromHandle(handle);
    if (pump == nullptr || texts == nullptr || confidences == nullptr) {
        LOGE("submitRecognizedLines: invalid arguments");
        return JNI_FALSE;
    }

    try {
        std::vector<std::string> lines = toStringVector(env, texts);
        jsize count = env->GetArrayLength(confidences);
        if (count != static_cast<jsize>(lines.size())) {
            LOGE("submitRecognizedLines: %zu texts but %d confidences", lines.size(), count);
            return JNI_FALSE;
        }

        std::vector<jfloat> scores(count);
        env->GetFloatArrayRegion(confidences, 0, count, scores.data());

        std::vector<mrzscan::RecognizedText> recognized;
        recognized.reserve(lines.size());
        for (size_t i = 0; i < lines.size(); ++i) {
            recognized.push_back({lines[i], scores[i]});
        }

        return pump->submitLines(recognized) ? JNI_TRUE : JNI_FALSE;

    } catch (std::exception& e) {
        LOGE("submitRecognizedLines error: %s", e.what());
        return JNI_FALSE;
    }
}

/**
 * Latest unread result
 * @return [mrz, can (may be null), isValid] or null
 */
extern "C" JNIEXPORT jobjectArray JNICALL
Java_com_mrzscan_sdk_core_NativeProcessor_pollScanResult(
        JNIEnv* env,
        jobject /* this */,
        jlong handle) {

    mrzscan::FramePump* pump = pumpFromHandle(handle);
    if (pump == nullptr) return nullptr;

    std::optional<mrzscan::ScanResult> result = pump->takeResult();
    if (!result) return nullptr;

    bool valid = result->parsed.ok() && result->parsed.mrz->checks.isValid();

    jclass stringClass = env->FindClass("java/lang/String");
    jobjectArray array = env->NewObjectArray(3, stringClass, nullptr);
    if (array == nullptr) return nullptr;

    jstring mrz = env->NewStringUTF(result->mrz.c_str());
    jstring can = toJavaStringOrNull(env, result->can);
    jstring validity = env->NewStringUTF(valid ? "true" : "false");

    env->SetObjectArrayElement(array, 0, mrz);
    env->SetObjectArrayElement(array, 1, can);
    env->SetObjectArrayElement(array, 2, validity);

    env->DeleteLocalRef(mrz);
    if (can != nullptr) env->DeleteLocalRef(can);
    env->DeleteLocalRef(validity);
    return array;
}

extern "C" JNIEXPORT void JNICALL
Java_com_mrzscan_sdk_core_NativeProcessor_resetScanSession(
        JNIEnv* /* env */,
        jobject /* this */,
        jlong handle) {

    mrzscan::FramePump* pump = pumpFromHandle(handle);
    if (pump != nullptr) {
        pump->resetSession();
    }
}
