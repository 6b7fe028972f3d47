#pragma once
#include <string>
#include <vector>
#include <deque>
#include <unordered_set>

namespace cordbridge {

// Refs of successfully delivered send requests, in delivery order.
// With limit 0 the set only grows; otherwise the oldest refs are evicted
// once more than `limit` are held.
class ProcessedRefSet {
public:
    explicit ProcessedRefSet(size_t limit = 0) : limit_(limit) {}

    bool contains(const std::string& ref) const;

    // Returns false if ref was already present.
    bool add(const std::string& ref);

    // Replace contents (persisted order, oldest first). Duplicates are skipped.
    void assign(const std::vector<std::string>& refs);

    std::vector<std::string> to_vector() const;

    size_t size() const { return order_.size(); }
    size_t limit() const { return limit_; }

private:
    void evict_overflow();

    size_t limit_;
    std::deque<std::string> order_;
    std::unordered_set<std::string> members_;
};

} // namespace cordbridge
