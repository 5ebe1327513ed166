#pragma once

#include "coedit/replication/encoding.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <set>
#include <vector>

namespace coedit::replication {

/**
 * Replicated document state as seen by a room.
 *
 * Merge semantics belong to the implementation; the room only moves opaque
 * updates in and snapshots out. Implementations must be safe to call from
 * several connection handlers at once.
 */
class ReplicatedDocument {
public:
    using UpdateObserver = std::function<void(const Bytes& update)>;

    virtual ~ReplicatedDocument() = default;

    // Returns false when the update was already known (nothing changed).
    virtual bool apply_update(const Bytes& update) = 0;

    // Everything needed to bring an empty replica up to date.
    virtual std::vector<Bytes> encode_state() const = 0;

    // Called after every update that changed the document.
    virtual void observe(UpdateObserver observer) = 0;
};

// Keeps each distinct update once, in arrival order. Clients merge the
// replayed updates themselves, so the log is a complete state.
class UpdateLogDocument : public ReplicatedDocument {
public:
    bool apply_update(const Bytes& update) override;
    std::vector<Bytes> encode_state() const override;
    void observe(UpdateObserver observer) override;

    std::size_t update_count() const;

private:
    mutable std::mutex mutex_;
    // Each update is held once, in seen_; updates_ records arrival order.
    std::set<Bytes> seen_;
    std::vector<std::set<Bytes>::const_iterator> updates_;
    std::vector<UpdateObserver> observers_;
};

} // namespace coedit::replication
