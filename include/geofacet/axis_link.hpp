#pragma once

#include <cstdint>
#include <functional>
#include <geofacet/axes.hpp>
#include <geofacet/color.hpp>
#include <mutex>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace geofacet
{

// Which axis dimensions are linked within a group
enum class LinkAxis : uint8_t
{
    X    = 0x01,
    Y    = 0x02,
    Both = 0x03,
};

inline LinkAxis operator|(LinkAxis a, LinkAxis b)
{
    return static_cast<LinkAxis>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}
inline bool has_flag(LinkAxis val, LinkAxis flag)
{
    return (static_cast<uint8_t>(val) & static_cast<uint8_t>(flag)) != 0;
}

using LinkGroupId = uint32_t;

struct LinkGroup
{
    LinkGroupId        id   = 0;
    LinkAxis           axis = LinkAxis::X;
    std::string        name;
    Color              color;   // indicator color, cycles with the id
    std::vector<Axes*> members;

    bool contains(const Axes* ax) const;
    void remove(const Axes* ax);
};

using LinkChangeCallback = std::function<void()>;

// Links axes so that they share a range on one or both dimensions.
// Thread-safe: all public methods lock an internal mutex.
//
//   auto id = mgr.link_all(axes_in_position_1, LinkAxis::Both, "Facet axis 1");
//   // every member now shows the union of the members' ranges
//   mgr.propagate_limits(&ax, new_x, new_y);   // peers follow
//
class AxisLinkManager
{
   public:
    AxisLinkManager();
    ~AxisLinkManager();

    // ── Group lifecycle ──────────────────────────────────────────────

    LinkGroupId create_group(const std::string& name, LinkAxis axis);
    void        remove_group(LinkGroupId id);

    // ── Membership ───────────────────────────────────────────────────

    void add_to_group(LinkGroupId id, Axes* ax);
    void remove_from_group(LinkGroupId id, Axes* ax);
    void remove_from_all(Axes* ax);

    // Link two axes on the given dimension(s), reusing a group one of them
    // already belongs to. Returns 0 for null or identical axes.
    LinkGroupId link(Axes* a, Axes* b, LinkAxis axis);

    // Put every axes in `members` into one new group and synchronise them.
    // Returns 0 when `members` is empty.
    LinkGroupId link_all(std::span<Axes* const> members, LinkAxis axis, const std::string& name);

    // Set every member's linked dimensions to the union of the members'
    // current limits.
    void sync_group(LinkGroupId id);

    // ── Propagation ──────────────────────────────────────────────────

    // Apply `source`'s new limits to it and to every peer sharing a group
    // with it, on the group's linked dimensions.
    void propagate_limits(Axes* source, AxisLimits new_xlim, AxisLimits new_ylim);

    // ── Queries ──────────────────────────────────────────────────────

    std::vector<LinkGroupId> groups_for(const Axes* ax) const;
    std::vector<Axes*>       linked_peers(const Axes* ax) const;
    bool                     is_linked(const Axes* ax) const;
    const LinkGroup*         group(LinkGroupId id) const;
    size_t                   group_count() const;

    // Called after membership or range changes, with the mutex released.
    void set_on_change(LinkChangeCallback cb)
    {
        std::lock_guard lock(mutex_);
        on_change_ = std::move(cb);
    }

   private:
    LinkGroupId insert_group_unlocked(const std::string& name, LinkAxis axis);
    void        sync_group_unlocked(LinkGroup& group);
    void        notify(std::unique_lock<std::mutex>& lock);

    mutable std::mutex                         mutex_;
    std::unordered_map<LinkGroupId, LinkGroup> groups_;
    LinkGroupId                                next_id_ = 1;
    LinkChangeCallback                         on_change_;

    // Guard against re-entrant propagation
    bool propagating_ = false;
};

}   // namespace geofacet
