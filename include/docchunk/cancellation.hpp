#pragma once
#include <atomic>

namespace docchunk {

// Shared between a waiting caller and the worker processing its document.
// Long running steps poll it between pages.
class CancellationToken {
public:
    void cancel() { cancelled_ = true; }
    bool cancelled() const { return cancelled_; }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace docchunk
