#include "transcription-batch-policy.h"

TranscriptionBatchPolicy::TranscriptionBatchPolicy(size_t threshold)
    : threshold_(threshold) {}

bool TranscriptionBatchPolicy::is_due(size_t fragment_count) const {
    if (threshold_ == 0 || fragment_count == 0) return false;
    return fragment_count % threshold_ == 0;
}

// At most one outstanding transcription per call
bool TranscriptionBatchPolicy::try_begin(const std::string& call_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return outstanding_.insert(call_id).second;
}

void TranscriptionBatchPolicy::finish(const std::string& call_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    outstanding_.erase(call_id);
}

bool TranscriptionBatchPolicy::is_outstanding(const std::string& call_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outstanding_.count(call_id) > 0;
}
