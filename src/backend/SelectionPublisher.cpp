#include "backend/SelectionPublisher.hpp"
#include <utility>

namespace castbar::backend {

SelectionPublisher::SelectionPublisher()
    : current_(std::make_shared<const model::Selection>()) {
}

SelectionPublisher::~SelectionPublisher() = default;

void SelectionPublisher::publish(model::Selection selection) {
    std::lock_guard<std::mutex> lock(mutex_);
    selection.seq = current_->seq + 1;
    current_ = std::make_shared<const model::Selection>(std::move(selection));
}

// Called on every frame tick; only copies the shared_ptr under the lock.
std::shared_ptr<const model::Selection> SelectionPublisher::get_current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

}  // namespace castbar::backend
