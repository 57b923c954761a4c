// include/onchain/recent_hashes.hpp
#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_set>

namespace onchain {

/**
 * Bounded FIFO of recently seen transaction hashes.
 *
 * Only used to drop duplicate deliveries from the feed. When full, the oldest
 * hash is evicted, so a very late duplicate can be admitted again; downstream
 * handling tolerates that.
 *
 * Thread-safe: one mutex guards the deque and the set together.
 */
class RecentHashes
{
public:
    static constexpr std::size_t kDefaultCapacity = 1000;

    explicit RecentHashes(std::size_t capacity = kDefaultCapacity);

    /// True if `hash` was already admitted. Otherwise admits it and returns
    /// false. An empty hash is never admitted and never reported as seen.
    bool seen(const std::string& hash);

    bool contains(const std::string& hash) const;

    std::size_t size() const;
    std::size_t capacity() const noexcept { return capacity_; }

private:
    const std::size_t               capacity_;
    mutable std::mutex              mutex_;
    std::deque<std::string>         order_;
    std::unordered_set<std::string> members_;
};

} // namespace onchain
