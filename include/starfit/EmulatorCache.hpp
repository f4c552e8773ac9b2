/* ===================================================================== *
 *  include/starfit/EmulatorCache.hpp   bounded L-R-U cache of
 *                                          emulator interpolations
 * ===================================================================== */
#pragma once
#include "Types.hpp"

#include <ankerl/unordered_dense.h>
#include <list>
#include <memory>
#include <mutex>
#include <shared_mutex>

namespace starfit {

struct EmulatorMatrix {
    Vector mus;     // M, mean PCA weights
    Matrix C_GP;    // M x M, weight covariance
};

using EmulatorMatrixPtr = std::shared_ptr<const EmulatorMatrix>;

/*
 * Thread-safe bounded cache keyed on the grid parameter vector.
 * The hash only selects the slot; the stored parameter vector is
 * compared exactly before a hit is reported.
 */
class EmulatorCache
{
public:
    explicit EmulatorCache(std::size_t capacity = 256) : max_entries_(capacity) {}

    EmulatorMatrixPtr try_get(const Vector& params) const;

    template<typename Producer>
    EmulatorMatrixPtr insert_if_absent(const Vector& params, Producer&& make);

    void set_capacity(std::size_t n);
    void clear();
    std::size_t size() const;

    static std::size_t hash(const Vector& params) noexcept;

private:
    using LruList = std::list<std::size_t>;
    struct Node {
        Vector            params;
        EmulatorMatrixPtr value;
        LruList::iterator lru_pos;
    };
    using Map = ankerl::unordered_dense::map<std::size_t, Node>;

    void touch_(Map::iterator it) const;
    void evict_if_needed_();

    mutable std::shared_mutex mtx_;
    mutable Map     cache_;
    mutable LruList lru_;
    std::size_t     max_entries_;
};

/* ===================================================================== *
 *  template implementation
 * ===================================================================== */
template<typename Producer>
EmulatorMatrixPtr EmulatorCache::insert_if_absent(const Vector& params,
                                                  Producer&&    make)
{
    if (max_entries_ == 0)
        return std::make_shared<EmulatorMatrix>(std::forward<Producer>(make)());

    const std::size_t h = hash(params);
    {
        std::unique_lock lk(mtx_);
        auto it = cache_.find(h);
        if (it != cache_.end() && it->second.params == params) {
            touch_(it);
            return it->second.value;
        }
    }

    /* ---------- solve outside any lock ----------------------------- */
    EmulatorMatrixPtr fresh = std::make_shared<EmulatorMatrix>(
                                  std::forward<Producer>(make)() );

    std::unique_lock lk(mtx_);
    auto it = cache_.find(h);
    if (it != cache_.end()) {
        if (it->second.params == params) {     // someone else inserted
            touch_(it);
            return it->second.value;
        }
        // hash collision: newest wins
        it->second.params = params;
        it->second.value  = fresh;
        touch_(it);
        return fresh;
    }

    auto lru_it = lru_.insert(lru_.begin(), h);            // MRU front
    cache_.try_emplace(h, Node{params, fresh, lru_it});
    evict_if_needed_();
    return fresh;
}

} // namespace starfit
