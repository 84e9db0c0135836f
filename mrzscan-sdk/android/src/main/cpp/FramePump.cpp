#define TAG "FramePump"

#include "FramePump.h"
#include "CandidateExtractor.h"
#include "MRZParser.h"
#include "Log.h"
#include <exception>
#include <utility>

using namespace std;

namespace mrzscan {

// ==================== ResultDeduplicator ====================

bool ResultDeduplicator::accept(const string& mrz, const optional<string>& can) {
    if (lastMRZ_ && *lastMRZ_ == mrz && lastCAN_ == can) {
        return false;
    }
    lastMRZ_ = mrz;
    lastCAN_ = can;
    return true;
}

void ResultDeduplicator::reset() {
    lastMRZ_.reset();
    lastCAN_.reset();
}

// ==================== LatestResultSlot ====================

void LatestResultSlot::publish(ScanResult result) {
    {
        lock_guard<mutex> lock(mutex_);
        if (result.sequence < lastSequence_) {
            LOGD("publish: result %llu older than %llu, dropped",
                 (unsigned long long) result.sequence, (unsigned long long) lastSequence_);
            return;
        }
        lastSequence_ = result.sequence;
        if (pending_) {
            LOGD("publish: replacing unread result");
        }
        pending_ = std::move(result);
    }
    ready_.notify_all();
}

optional<ScanResult> LatestResultSlot::take() {
    lock_guard<mutex> lock(mutex_);
    optional<ScanResult> out = std::move(pending_);
    pending_.reset();
    return out;
}

optional<ScanResult> LatestResultSlot::waitAndTake(chrono::milliseconds timeout) {
    unique_lock<mutex> lock(mutex_);
    ready_.wait_for(lock, timeout, [this] { return pending_.has_value(); });

    optional<ScanResult> out = std::move(pending_);
    pending_.reset();
    return out;
}

void LatestResultSlot::clear() {
    lock_guard<mutex> lock(mutex_);
    pending_.reset();
}

// ==================== FramePump ====================

FramePump::FramePump(shared_ptr<TextRecognizer> recognizer, ScanConfig config)
    : recognizer_(std::move(recognizer)), config_(std::move(config)) {

    LOGI("FramePump: minConfidence=%.2f lockOnValid=%d recognizer=%s",
         config_.pump.minConfidence, config_.pump.lockOnValid,
         recognizer_ ? "native" : "external");

    if (recognizer_) {
        worker_ = thread(&FramePump::workerLoop, this);
    }
}

FramePump::~FramePump() {
    {
        lock_guard<mutex> lock(frameMutex_);
        stopping_ = true;
    }
    frameReady_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
}

bool FramePump::admit(Ticket& ticket) {
    if (locked_.load(memory_order_acquire)) {
        dropped_++;
        return false;
    }

    if (!gate_.tryEnter()) {
        dropped_++;
        return false;
    }

    ticket.session = session_.load(memory_order_acquire);
    ticket.sequence = ++admitted_;
    return true;
}

bool FramePump::submitFrame(const cv::Mat& frame) {
    if (!recognizer_) {
        LOGE("submitFrame: no recognizer, use submitLines");
        dropped_++;
        return false;
    }

    if (frame.empty()) {
        LOGE("submitFrame: Empty frame");
        dropped_++;
        return false;
    }

    Ticket ticket{0, 0};
    if (!admit(ticket)) {
        return false;
    }

    GateGuard guard(gate_);
    {
        lock_guard<mutex> lock(frameMutex_);
        if (stopping_) {
            return false;
        }
        pendingFrame_ = frame.clone();
        pendingTicket_ = ticket;
        hasPendingFrame_ = true;
    }
    // The worker leaves the gate once the frame is processed
    guard.dismiss();
    frameReady_.notify_one();

    return true;
}

bool FramePump::submitLines(const vector<RecognizedText>& lines) {
    Ticket ticket{0, 0};
    if (!admit(ticket)) {
        return false;
    }

    GateGuard guard(gate_);
    processLines(lines, ticket);
    return true;
}

void FramePump::workerLoop() {
    for (;;) {
        cv::Mat frame;
        Ticket ticket{0, 0};
        {
            unique_lock<mutex> lock(frameMutex_);
            frameReady_.wait(lock, [this] { return stopping_ || hasPendingFrame_; });

            if (stopping_) {
                if (hasPendingFrame_) {
                    hasPendingFrame_ = false;
                    gate_.leave();
                }
                return;
            }

            frame = pendingFrame_;
            ticket = pendingTicket_;
            pendingFrame_.release();
            hasPendingFrame_ = false;
        }

        GateGuard guard(gate_);
        vector<RecognizedText> lines;

        try {
            cv::TickMeter tm;
            tm.start();
            lines = recognizer_->recognize(frame);
            tm.stop();

            LOGD("recognize: %zu lines in %.2f ms", lines.size(), tm.getTimeMilli());

        } catch (const std::exception& e) {
            LOGE("recognize error: %s", e.what());
            continue;
        }

        processLines(lines, ticket);
    }
}

void FramePump::processLines(const vector<RecognizedText>& lines, const Ticket& ticket) {
    vector<string> texts;
    texts.reserve(lines.size());
    for (const auto& line : lines) {
        if (line.confidence >= config_.pump.minConfidence) {
            texts.push_back(line.text);
        }
    }

    optional<string> mrz = CandidateExtractor::extractMRZCandidate(texts, config_.heuristic);
    if (!mrz) {
        return;
    }

    ScanResult result;
    result.mrz = *mrz;
    result.can = CandidateExtractor::extractCAN(texts, config_.heuristic);
    result.parsed = MRZParser::parseAndValidate(*mrz);
    result.sequence = ticket.sequence;

    lock_guard<mutex> lock(sessionMutex_);

    if (ticket.session != session_.load(memory_order_acquire)) {
        LOGD("processLines: frame %llu from a previous session, dropped",
             (unsigned long long) ticket.sequence);
        return;
    }

    if (dedupSession_ != ticket.session) {
        dedup_.reset();
        dedupSession_ = ticket.session;
    }

    if (!dedup_.accept(result.mrz, result.can)) {
        LOGD("processLines: same MRZ/CAN as last result, suppressed");
        return;
    }

    bool valid = result.parsed.ok() && result.parsed.mrz->checks.isValid();
    if (valid && config_.pump.lockOnValid) {
        locked_.store(true, memory_order_release);
        LOGI("processLines: valid %s, session locked", toString(result.parsed.mrz->format));
    }

    slot_.publish(std::move(result));
}

optional<ScanResult> FramePump::takeResult() {
    return slot_.take();
}

optional<ScanResult> FramePump::waitForResult(chrono::milliseconds timeout) {
    return slot_.waitAndTake(timeout);
}

void FramePump::resetSession() {
    lock_guard<mutex> lock(sessionMutex_);
    session_.fetch_add(1, memory_order_acq_rel);
    locked_.store(false, memory_order_release);
    slot_.clear();
    LOGD("resetSession: session %llu", (unsigned long long) session_.load());
}

} // namespace mrzscan
