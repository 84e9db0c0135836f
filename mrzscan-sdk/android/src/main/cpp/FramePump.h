#ifndef FRAME_PUMP_H
#define FRAME_PUMP_H

#include <opencv2/core.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "MRZResult.h"
#include "ScanConfig.h"

namespace mrzscan {

/**
 * One recognized text line from the OCR engine
 */
struct RecognizedText {
    std::string text;
    float confidence;  // 0-1
};

/**
 * OCR engine seam. Implementations wrap the platform recognizer.
 */
class TextRecognizer {
public:
    virtual ~TextRecognizer() = default;

    /**
     * Recognize text lines in a camera frame
     * @param frame BGR or grayscale frame, owned by the caller for the call
     * @return Recognized lines in any order
     */
    virtual std::vector<RecognizedText> recognize(const cv::Mat& frame) = 0;
};

/**
 * Result published by the frame pump
 */
struct ScanResult {
    std::string mrz;                 // Assembled MRZ block, '\n' separated
    std::optional<std::string> can;  // Card Access Number if one was seen
    ParseResult parsed;              // MRZParser outcome for mrz
    uint64_t sequence = 0;           // Admission order of the source frame
};

/**
 * At-most-one-in-flight gate
 */
class ScanGate {
public:
    /**
     * @return true if the caller now owns the gate
     */
    bool tryEnter() { return !busy_.exchange(true, std::memory_order_acquire); }
    void leave() { busy_.store(false, std::memory_order_release); }
    bool isBusy() const { return busy_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> busy_{false};
};

/**
 * Releases a ScanGate on scope exit
 */
class GateGuard {
public:
    explicit GateGuard(ScanGate& gate) : gate_(&gate) {}
    ~GateGuard() { release(); }

    GateGuard(const GateGuard&) = delete;
    GateGuard& operator=(const GateGuard&) = delete;

    void release() {
        if (gate_ != nullptr) {
            gate_->leave();
            gate_ = nullptr;
        }
    }

    /**
     * Give up ownership without leaving; another owner will leave the gate
     */
    void dismiss() { gate_ = nullptr; }

private:
    ScanGate* gate_;
};

/**
 * Remembers the last accepted (mrz, can) pair
 */
class ResultDeduplicator {
public:
    /**
     * @return true if (mrz, can) differs from the last accepted pair;
     *         the pair is then remembered
     */
    bool accept(const std::string& mrz, const std::optional<std::string>& can);
    void reset();

private:
    std::optional<std::string> lastMRZ_;
    std::optional<std::string> lastCAN_;
};

/**
 * Single-value channel with latest-value semantics
 * Publishing over an unread result replaces it. A result whose sequence is
 * older than one already published is dropped.
 */
class LatestResultSlot {
public:
    void publish(ScanResult result);
    std::optional<ScanResult> take();
    std::optional<ScanResult> waitAndTake(std::chrono::milliseconds timeout);
    void clear();

private:
    std::mutex mutex_;
    std::condition_variable ready_;
    std::optional<ScanResult> pending_;
    uint64_t lastSequence_ = 0;
};

/**
 * FramePump - drives OCR over camera frames and publishes MRZ/CAN results
 *
 * Pipeline per admitted frame:
 * - TextRecognizer on the worker thread
 * - Drop lines below minConfidence
 * - CandidateExtractor (MRZ block + CAN)
 * - MRZParser on the assembled block
 * - Suppress repeats of the previous (mrz, can) within the session
 * - Publish into the result slot
 *
 * Frames arriving while another one is processed are dropped, never queued.
 * A frame admitted before resetSession() never publishes into the new session.
 */
class FramePump {
public:
    /**
     * @param recognizer OCR engine, may be null when the host runs OCR itself
     *                   and only calls submitLines
     * @param config Heuristic and pump settings
     */
    explicit FramePump(std::shared_ptr<TextRecognizer> recognizer, ScanConfig config = ScanConfig());
    ~FramePump();

    FramePump(const FramePump&) = delete;
    FramePump& operator=(const FramePump&) = delete;

    /**
     * Hand a frame to the worker thread
     * @param frame Camera frame (copied)
     * @return false if dropped (busy, locked, no recognizer or stopped)
     */
    bool submitFrame(const cv::Mat& frame);

    /**
     * Run the pipeline on lines recognized outside the pump, on the caller thread
     * @param lines OCR output for one frame
     * @return false if dropped (busy or locked)
     */
    bool submitLines(const std::vector<RecognizedText>& lines);

    /**
     * Latest unread result, if any
     */
    std::optional<ScanResult> takeResult();

    /**
     * Block until a result is available or timeout expires
     */
    std::optional<ScanResult> waitForResult(std::chrono::milliseconds timeout);

    /**
     * Start a new scanning session: forget the last result, unlock,
     * discard any unread result and any frame still in flight
     */
    void resetSession();

    bool isBusy() const { return gate_.isBusy(); }
    bool isLocked() const { return locked_.load(std::memory_order_acquire); }
    size_t admittedFrames() const { return admitted_.load(); }
    size_t droppedFrames() const { return dropped_.load(); }

private:
    /**
     * Session and admission order captured when a frame passes the gate
     */
    struct Ticket {
        uint64_t session;
        uint64_t sequence;
    };

    void workerLoop();

    /**
     * Heuristic + parse + dedup + publish. Caller owns the gate until
     * this returns.
     */
    void processLines(const std::vector<RecognizedText>& lines, const Ticket& ticket);

    bool admit(Ticket& ticket);

    std::shared_ptr<TextRecognizer> recognizer_;
    const ScanConfig config_;

    ScanGate gate_;
    LatestResultSlot slot_;

    // Session state: dedup, lock and publish happen under sessionMutex_
    std::mutex sessionMutex_;
    std::atomic<uint64_t> session_{0};
    ResultDeduplicator dedup_;
    uint64_t dedupSession_ = 0;

    std::atomic<bool> locked_{false};
    std::atomic<size_t> admitted_{0};
    std::atomic<size_t> dropped_{0};

    // Worker hand-off: a single pending frame
    std::mutex frameMutex_;
    std::condition_variable frameReady_;
    cv::Mat pendingFrame_;
    Ticket pendingTicket_{0, 0};
    bool hasPendingFrame_ = false;
    bool stopping_ = false;
    std::thread worker_;
};

} // namespace mrzscan

#endif // FRAME_PUMP_H
