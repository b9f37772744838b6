#pragma once

#include <vkfg/config.hpp>
#include <vkfg/device.hpp>
#include <vkfg/graph/access.hpp>
#include <vkfg/graph/resource.hpp>
#include <vkfg/result.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace vkfg::graph {

// Caches are generic over a physical resource type R providing
//   R::Desc, R::Handle, R::Context
//   static Result<R> R::create(const Context&, const Desc&)
//   Handle handle() const
//   void destroy(const Context&)
//
// Ageing: `unused` counts resets since the resource was last handed out.
// A resource handed out in generation g is destroyed by the reset that
// starts generation g + lag, never earlier. Resets happen only after the
// frame slot that last used it was waited on, so lag = kFramesInFlight is
// enough to keep in-flight GPU work safe.
//
// reset() invalidates every handle returned since the previous reset.
// Callers must not touch those handles afterwards.

template <typename R>
struct Tracked {
    R             resource;
    std::uint32_t unused = 0;
};

// A handle plus whether it was created by this call (contents undefined).
template <typename H>
struct Acquired {
    H    handle{};
    bool fresh = false;
};

// Resources sharing one descriptor. The first cursor() entries were handed
// out this generation; the rest are ordered most recently used first.
//
// Thread safety: thread-confined.
template <typename R>
class ResourceList {
public:
    using Desc    = typename R::Desc;
    using Handle  = typename R::Handle;
    using Context = typename R::Context;

    [[nodiscard]] Result<Acquired<Handle>> getOrCreate(const Context& ctx, const Desc& desc) {
        if (cursor_ < resources_.size()) {
            auto& entry  = resources_[cursor_++];
            entry.unused = 0;
            return Acquired<Handle>{entry.resource.handle(), false};
        }

        auto created = R::create(ctx, desc);
        if (!created.ok()) return created.error();

        resources_.push_back(Tracked<R>{std::move(created).value(), 0});
        ++cursor_;
        return Acquired<Handle>{resources_.back().resource.handle(), true};
    }

    void reset(const Context& ctx, std::uint32_t lag = kDestroyLag) {
        for (auto& entry : resources_) ++entry.unused;

        // Entries are handed out from the front, so ages never decrease
        // along the list: everything from the first expired entry on is too.
        std::size_t firstExpired = 0;
        while (firstExpired < resources_.size() && resources_[firstExpired].unused < lag) {
            ++firstExpired;
        }
        for (std::size_t i = firstExpired; i < resources_.size(); ++i) {
            resources_[i].resource.destroy(ctx);
        }
        resources_.erase(resources_.begin() + static_cast<std::ptrdiff_t>(firstExpired),
                         resources_.end());
        cursor_ = 0;
    }

    void destroy(const Context& ctx) {
        for (auto& entry : resources_) entry.resource.destroy(ctx);
        resources_.clear();
        cursor_ = 0;
    }

    [[nodiscard]] std::size_t size()   const { return resources_.size(); }
    [[nodiscard]] std::size_t cursor() const { return cursor_; }
    [[nodiscard]] bool        empty()  const { return resources_.empty(); }

private:
    std::vector<Tracked<R>> resources_;
    std::size_t             cursor_ = 0;
};

// Descriptor-keyed pool allowing several live resources per descriptor.
// Requesting K resources of one shape every frame stabilizes at K.
//
// Thread safety: thread-confined.
template <typename R, typename Hash = std::hash<typename R::Desc>>
class ResourceCache {
public:
    using Desc    = typename R::Desc;
    using Handle  = typename R::Handle;
    using Context = typename R::Context;

    explicit ResourceCache(std::uint32_t lag = kDestroyLag) : lag_(lag) {}

    [[nodiscard]] Result<Acquired<Handle>> getOrCreate(const Context& ctx, const Desc& desc) {
        return lists_[desc].getOrCreate(ctx, desc);
    }

    void reset(const Context& ctx) {
        for (auto it = lists_.begin(); it != lists_.end();) {
            it->second.reset(ctx, lag_);
            if (it->second.empty()) {
                it = lists_.erase(it);
            } else {
                ++it;
            }
        }
    }

    void destroy(const Context& ctx) {
        for (auto& [desc, list] : lists_) list.destroy(ctx);
        lists_.clear();
    }

    [[nodiscard]] std::size_t liveCount() const {
        std::size_t n = 0;
        for (const auto& [desc, list] : lists_) n += list.size();
        return n;
    }

    [[nodiscard]] std::size_t liveCount(const Desc& desc) const {
        auto it = lists_.find(desc);
        return it == lists_.end() ? 0 : it->second.size();
    }

    [[nodiscard]] std::size_t descriptorCount() const { return lists_.size(); }

private:
    std::unordered_map<Desc, ResourceList<R>, Hash> lists_;
    std::uint32_t                                   lag_;
};

// At most one resource per descriptor (image views, singleton buffers).
//
// Thread safety: thread-confined.
template <typename R, typename Hash = std::hash<typename R::Desc>>
class UniqueCache {
public:
    using Desc    = typename R::Desc;
    using Handle  = typename R::Handle;
    using Context = typename R::Context;

    explicit UniqueCache(std::uint32_t lag = kDestroyLag) : lag_(lag) {}

    [[nodiscard]] Result<Acquired<Handle>> get(const Context& ctx, const Desc& desc) {
        auto it = resources_.find(desc);
        if (it != resources_.end()) {
            it->second.unused = 0;
            return Acquired<Handle>{it->second.resource.handle(), false};
        }

        auto created = R::create(ctx, desc);
        if (!created.ok()) return created.error();

        auto [pos, inserted] = resources_.emplace(desc, Tracked<R>{std::move(created).value(), 0});
        return Acquired<Handle>{pos->second.resource.handle(), true};
    }

    void reset(const Context& ctx) {
        for (auto it = resources_.begin(); it != resources_.end();) {
            if (++it->second.unused >= lag_) {
                it->second.resource.destroy(ctx);
                it = resources_.erase(it);
            } else {
                ++it;
            }
        }
    }

    void destroy(const Context& ctx) {
        for (auto& [desc, entry] : resources_) entry.resource.destroy(ctx);
        resources_.clear();
    }

    [[nodiscard]] std::size_t size() const { return resources_.size(); }
    [[nodiscard]] bool contains(const Desc& desc) const { return resources_.count(desc) != 0; }

private:
    std::unordered_map<Desc, Tracked<R>, Hash> resources_;
    std::uint32_t                              lag_;
};

// Result of PersistentCache::get: the handle plus the state the previous
// frame left the resource in. fresh means never written (layout UNDEFINED).
template <typename H>
struct PersistentAcquired {
    H          handle{};
    bool       fresh     = false;
    AccessInfo lastAccess;
    QueueType  lastQueue = QueueType::Graphics;
};

// Graph-owned resources that keep their contents across frames, keyed by a
// caller-held PersistId. A descriptor change replaces the resource; the old
// one is aged out like any other unused entry instead of being destroyed
// while in-flight frames may still read it.
//
// Thread safety: thread-confined.
template <typename R>
class PersistentCache {
public:
    using Desc    = typename R::Desc;
    using Handle  = typename R::Handle;
    using Context = typename R::Context;

    explicit PersistentCache(std::uint32_t lag = kDestroyLag) : lag_(lag) {}

    [[nodiscard]] Result<PersistentAcquired<Handle>> get(const Context& ctx, PersistId id,
                                                         const Desc& desc) {
        auto it = entries_.find(id);
        if (it != entries_.end() && it->second.desc == desc) {
            auto& e = it->second;
            e.tracked.unused = 0;
            return PersistentAcquired<Handle>{e.tracked.resource.handle(), e.fresh,
                                              e.lastAccess, e.lastQueue};
        }

        auto created = R::create(ctx, desc);
        if (!created.ok()) return created.error();

        if (it != entries_.end()) {
            retired_.push_back(Tracked<R>{std::move(it->second.tracked.resource), 0});
            entries_.erase(it);
        }

        Entry e{Tracked<R>{std::move(created).value(), 0}, desc, {}, QueueType::Graphics, true};
        auto [pos, inserted] = entries_.emplace(id, std::move(e));
        return PersistentAcquired<Handle>{pos->second.tracked.resource.handle(), true, {},
                                          QueueType::Graphics};
    }

    // State the resource is left in at the end of the current frame.
    void record(PersistId id, const AccessInfo& access, QueueType queue) {
        auto it = entries_.find(id);
        if (it == entries_.end()) return;
        it->second.lastAccess = access;
        it->second.lastQueue  = queue;
        it->second.fresh      = false;
    }

    void reset(const Context& ctx) {
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (++it->second.tracked.unused >= lag_) {
                it->second.tracked.resource.destroy(ctx);
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
        for (auto& r : retired_) {
            if (++r.unused >= lag_) r.resource.destroy(ctx);
        }
        std::erase_if(retired_, [this](const Tracked<R>& r) { return r.unused >= lag_; });
    }

    void destroy(const Context& ctx) {
        for (auto& [id, e] : entries_) e.tracked.resource.destroy(ctx);
        for (auto& r : retired_) r.resource.destroy(ctx);
        entries_.clear();
        retired_.clear();
    }

    [[nodiscard]] std::size_t size()         const { return entries_.size(); }
    [[nodiscard]] std::size_t retiredCount() const { return retired_.size(); }

private:
    struct Entry {
        Tracked<R> tracked;
        Desc       desc;
        AccessInfo lastAccess;
        QueueType  lastQueue = QueueType::Graphics;
        bool       fresh     = true;
    };

    std::unordered_map<PersistId, Entry> entries_;
    std::vector<Tracked<R>>              retired_;
    std::uint32_t                        lag_;
};

} // namespace vkfg::graph
