#pragma once

#include <atomic>
#include <memory>

namespace filesentry {

// Shared flag raised when the detection deadline passes. Analyzers poll it
// between patterns and return early once it is set; the thread pool drops
// queued tasks whose token is already raised.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void Cancel() const { flag_->store(true); }
    bool IsCancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace filesentry
