// src/onchain/recent_hashes.cpp
#include "onchain/recent_hashes.hpp"

#include <algorithm>

namespace onchain {

RecentHashes::RecentHashes(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1))
{
}

bool RecentHashes::seen(const std::string& hash)
{
    if (hash.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (members_.count(hash) != 0) {
        return true;
    }

    order_.push_back(hash);
    members_.insert(hash);
    if (order_.size() > capacity_) {
        members_.erase(order_.front());
        order_.pop_front();
    }
    return false;
}

bool RecentHashes::contains(const std::string& hash) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return members_.count(hash) != 0;
}

std::size_t RecentHashes::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return order_.size();
}

} // namespace onchain
