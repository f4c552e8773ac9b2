#include "starfit/EmulatorCache.hpp"
#include <cstdint>
#include <cstring>

namespace starfit {

std::size_t EmulatorCache::hash(const Vector& params) noexcept
{
    std::uint64_t seed = 0x5EEDC0DEULL ^ static_cast<std::uint64_t>(params.size());
    for (Eigen::Index i = 0; i < params.size(); ++i) {
        const double x = params[i] + 0.0;        // fold -0.0 onto +0.0
        std::uint64_t bits;
        std::memcpy(&bits, &x, sizeof bits);
        const std::uint64_t h = ankerl::unordered_dense::hash<std::uint64_t>{}(bits);
        seed ^= h + 0x9E3779B97F4A7C15ULL + (seed << 6) + (seed >> 2);
    }
    return static_cast<std::size_t>(seed);
}

EmulatorMatrixPtr EmulatorCache::try_get(const Vector& params) const
{
    std::unique_lock lk(mtx_);
    auto it = cache_.find(hash(params));
    if (it == cache_.end() || it->second.params != params) return nullptr;
    touch_(it);                      // update LRU even on read
    return it->second.value;
}

void EmulatorCache::set_capacity(std::size_t n)
{
    std::unique_lock lk(mtx_);
    max_entries_ = n;
    evict_if_needed_();
}

void EmulatorCache::clear()
{
    std::unique_lock lk(mtx_);
    cache_.clear();
    lru_.clear();
}

std::size_t EmulatorCache::size() const
{
    std::shared_lock lk(mtx_);
    return cache_.size();
}

/* -------- internal L-R-U helpers ------------------------------------ */
void EmulatorCache::touch_(Map::iterator it) const
{
    lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
}

void EmulatorCache::evict_if_needed_()
{
    while (cache_.size() > max_entries_) {
        std::size_t victim = lru_.back();
        lru_.pop_back();
        cache_.erase(victim);        // shared_ptr keeps data alive
    }
}

} // namespace starfit
