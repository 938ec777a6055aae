#pragma once
#include <atomic>
#include <memory>

namespace codeloop::runtime {

// Shared cancellation flag. Copies observe the same flag; a
// default-constructed token can still be cancelled by its holders.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace codeloop::runtime
