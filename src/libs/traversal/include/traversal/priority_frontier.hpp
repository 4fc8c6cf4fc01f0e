#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <queue>
#include <utility>
#include <vector>

namespace traversal {

// Min-priority queue keyed by score. An item may be pushed several times as
// better scores are found; callers discard stale entries on pop. Equal scores
// pop in insertion order.
template <typename T>
class PriorityFrontier {
public:
    struct Entry {
        double score = 0;
        T item{};
    };

    void push(double score, T item) {
        heap_.push(Slot{ Entry{ score, std::move(item) }, next_seq_++ });
    }

    std::optional<Entry> pop() {
        if (heap_.empty()) return std::nullopt;
        Entry e = heap_.top().entry;
        heap_.pop();
        return e;
    }

    bool empty() const { return heap_.empty(); }
    std::size_t size() const { return heap_.size(); }

    void clear() {
        heap_ = {};
        next_seq_ = 0;
    }

private:
    struct Slot {
        Entry entry;
        std::uint64_t seq = 0;
    };

    struct Later {
        bool operator()(const Slot& a, const Slot& b) const {
            if (a.entry.score != b.entry.score) return a.entry.score > b.entry.score;
            return a.seq > b.seq;
        }
    };

    std::priority_queue<Slot, std::vector<Slot>, Later> heap_;
    std::uint64_t next_seq_ = 0;
};

} // namespace traversal
