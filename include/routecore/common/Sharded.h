#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <string>

namespace routecore {
namespace common {

// Fixed lock-striping over N shards. Each Shard type carries its own mutex and
// map; a key always hashes to the same shard, so unrelated keys rarely contend.
template <typename Shard, size_t N = 16>
class Sharded {
public:
    static constexpr size_t kShardCount = N;

    Shard& For(const std::string& key) { return shards_[Index(key)]; }
    const Shard& For(const std::string& key) const { return shards_[Index(key)]; }

    template <typename Fn>
    void ForEach(Fn&& fn) {
        for (auto& s : shards_) fn(s);
    }

    template <typename Fn>
    void ForEach(Fn&& fn) const {
        for (const auto& s : shards_) fn(s);
    }

private:
    static size_t Index(const std::string& key) { return std::hash<std::string>{}(key) % N; }

    std::array<Shard, N> shards_;
};

} // namespace common
} // namespace routecore
