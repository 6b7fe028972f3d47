#include "processed_refs.hpp"

namespace cordbridge {

bool ProcessedRefSet::contains(const std::string& ref) const {
    return members_.count(ref) > 0;
}

bool ProcessedRefSet::add(const std::string& ref) {
    if (ref.empty() || !members_.insert(ref).second) return false;
    order_.push_back(ref);
    evict_overflow();
    return true;
}

void ProcessedRefSet::assign(const std::vector<std::string>& refs) {
    order_.clear();
    members_.clear();
    for (const auto& ref : refs) {
        if (ref.empty() || !members_.insert(ref).second) continue;
        order_.push_back(ref);
    }
    evict_overflow();
}

std::vector<std::string> ProcessedRefSet::to_vector() const {
    return std::vector<std::string>(order_.begin(), order_.end());
}

void ProcessedRefSet::evict_overflow() {
    if (limit_ == 0) return;
    while (order_.size() > limit_) {
        members_.erase(order_.front());
        order_.pop_front();
    }
}

} // namespace cordbridge
