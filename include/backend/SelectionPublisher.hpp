#pragma once

#include "model/Selection.hpp"
#include <memory>
#include <mutex>

namespace castbar::backend {

/**
 * Latest-value-wins cell for the current selection.
 * Single writer (cycler), single reader (output driver).
 */
class SelectionPublisher {
public:
    SelectionPublisher();
    ~SelectionPublisher();

    void publish(model::Selection selection);
    std::shared_ptr<const model::Selection> get_current() const;

private:
    std::shared_ptr<const model::Selection> current_;
    mutable std::mutex mutex_;
};

}  // namespace castbar::backend
