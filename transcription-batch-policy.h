#pragma once

#include <string>
#include <unordered_set>
#include <mutex>

// Decides when buffered call audio goes to the transcription service.
// An attempt is due on every Nth fragment (N = threshold, 0 disables periodic
// attempts so only the end-of-call flush transcribes). At most one attempt per
// call is outstanding; a due attempt that finds one in flight is skipped, not
// queued.
class TranscriptionBatchPolicy {
public:
    explicit TranscriptionBatchPolicy(size_t threshold = 20);

    size_t threshold() const { return threshold_; }
    bool is_due(size_t fragment_count) const;

    bool try_begin(const std::string& call_id);
    void finish(const std::string& call_id);
    bool is_outstanding(const std::string& call_id) const;

private:
    size_t threshold_;
    std::unordered_set<std::string> outstanding_;
    mutable std::mutex mutex_;
};
