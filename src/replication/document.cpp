#include "coedit/replication/document.hpp"

namespace coedit::replication {

bool UpdateLogDocument::apply_update(const Bytes& update) {
    std::vector<UpdateObserver> observers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto [it, inserted] = seen_.insert(update);
        if (!inserted) {
            return false;
        }
        updates_.push_back(it);
        observers = observers_;
    }

    // Outside the lock so observers may call back into the document.
    for (const auto& observer : observers) {
        observer(update);
    }
    return true;
}

std::vector<Bytes> UpdateLogDocument::encode_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Bytes> state;
    state.reserve(updates_.size());
    for (const auto& it : updates_) {
        state.push_back(*it);
    }
    return state;
}

void UpdateLogDocument::observe(UpdateObserver observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.push_back(std::move(observer));
}

std::size_t UpdateLogDocument::update_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return updates_.size();
}

} // namespace coedit::replication
