#include "tree.hpp"

#include "errors.hpp"

namespace vault::server {

PendingCommit::PendingCommit(std::function<void()> action) : action_(std::move(action)) {}

void PendingCommit::apply() {
    if (applied_) {
        throw UploadError(ErrorCode::kPrecondition, "pending tree commit already applied");
    }
    applied_ = true;
    if (action_) {
        action_();
    }
}

}  // namespace vault::server
