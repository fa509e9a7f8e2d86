#include <algorithm>
#include <geofacet/axis_link.hpp>
#include <geofacet/logger.hpp>
#include <optional>

namespace geofacet
{

// ─── LinkGroup ───────────────────────────────────────────────────────────────

bool LinkGroup::contains(const Axes* ax) const
{
    return std::find(members.begin(), members.end(), ax) != members.end();
}

void LinkGroup::remove(const Axes* ax)
{
    members.erase(std::remove(members.begin(), members.end(), ax), members.end());
}

// ─── AxisLinkManager ─────────────────────────────────────────────────────────

AxisLinkManager::AxisLinkManager()  = default;
AxisLinkManager::~AxisLinkManager() = default;

LinkGroupId AxisLinkManager::insert_group_unlocked(const std::string& name, LinkAxis axis)
{
    static constexpr Color group_colors[] = {
        {0.34f, 0.65f, 0.96f},   // blue
        {0.96f, 0.49f, 0.31f},   // orange
        {0.30f, 0.78f, 0.47f},   // green
        {0.89f, 0.35f, 0.40f},   // red
        {0.58f, 0.40f, 0.74f},   // purple
        {0.09f, 0.75f, 0.81f},   // cyan
    };

    LinkGroupId id = next_id_++;
    LinkGroup   group;
    group.id    = id;
    group.axis  = axis;
    group.name  = name.empty() ? "Link " + std::to_string(id) : name;
    group.color = group_colors[(id - 1) % std::size(group_colors)];
    groups_[id] = std::move(group);
    return id;
}

// ─── Group lifecycle ─────────────────────────────────────────────────────────

LinkGroupId AxisLinkManager::create_group(const std::string& name, LinkAxis axis)
{
    std::lock_guard lock(mutex_);
    return insert_group_unlocked(name, axis);
}

void AxisLinkManager::remove_group(LinkGroupId id)
{
    std::unique_lock lock(mutex_);
    if (groups_.erase(id) > 0)
        notify(lock);
}

// ─── Membership ──────────────────────────────────────────────────────────────

void AxisLinkManager::add_to_group(LinkGroupId id, Axes* ax)
{
    if (!ax)
        return;
    std::unique_lock lock(mutex_);
    auto it = groups_.find(id);
    if (it == groups_.end() || it->second.contains(ax))
        return;
    it->second.members.push_back(ax);
    notify(lock);
}

void AxisLinkManager::remove_from_group(LinkGroupId id, Axes* ax)
{
    if (!ax)
        return;
    std::unique_lock lock(mutex_);
    auto it = groups_.find(id);
    if (it == groups_.end())
        return;
    it->second.remove(ax);
    if (it->second.members.empty())
        groups_.erase(it);
    notify(lock);
}

void AxisLinkManager::remove_from_all(Axes* ax)
{
    if (!ax)
        return;
    std::unique_lock lock(mutex_);
    bool changed = false;
    for (auto it = groups_.begin(); it != groups_.end();)
    {
        if (!it->second.contains(ax))
        {
            ++it;
            continue;
        }
        it->second.remove(ax);
        changed = true;
        if (it->second.members.empty())
            it = groups_.erase(it);
        else
            ++it;
    }
    if (changed)
        notify(lock);
}

LinkGroupId AxisLinkManager::link(Axes* a, Axes* b, LinkAxis axis)
{
    if (!a || !b || a == b)
        return 0;
    std::unique_lock lock(mutex_);

    for (auto& [id, group] : groups_)
    {
        if (group.axis != axis)
            continue;
        const bool has_a = group.contains(a);
        const bool has_b = group.contains(b);
        if (has_a && has_b)
            return id;
        if (has_a || has_b)
        {
            group.members.push_back(has_a ? b : a);
            sync_group_unlocked(group);
            const LinkGroupId found = id;
            notify(lock);
            return found;
        }
    }

    LinkGroupId id    = insert_group_unlocked({}, axis);
    auto&       group = groups_[id];
    group.members     = {a, b};
    sync_group_unlocked(group);
    notify(lock);
    return id;
}

LinkGroupId AxisLinkManager::link_all(std::span<Axes* const> members, LinkAxis axis, const std::string& name)
{
    if (members.empty())
        return 0;
    std::unique_lock lock(mutex_);

    LinkGroupId id    = insert_group_unlocked(name, axis);
    auto&       group = groups_[id];
    for (Axes* ax : members)
    {
        if (ax && !group.contains(ax))
            group.members.push_back(ax);
    }
    sync_group_unlocked(group);
    GEOFACET_LOG_DEBUG("facet.link", "group {} '{}' links {} axes", id, group.name, group.members.size());
    notify(lock);
    return id;
}

void AxisLinkManager::sync_group(LinkGroupId id)
{
    std::lock_guard lock(mutex_);
    auto it = groups_.find(id);
    if (it != groups_.end())
        sync_group_unlocked(it->second);
}

void AxisLinkManager::sync_group_unlocked(LinkGroup& group)
{
    // Axes with neither data nor explicit limits (placeholders) take the
    // group range but do not contribute to it.
    std::optional<AxisLimits> x;
    std::optional<AxisLimits> y;
    for (const Axes* ax : group.members)
    {
        if (auto mx = ax->x_extent())
            x = x ? AxisLimits{std::min(x->min, mx->min), std::max(x->max, mx->max)} : *mx;
        if (auto my = ax->y_extent())
            y = y ? AxisLimits{std::min(y->min, my->min), std::max(y->max, my->max)} : *my;
    }

    for (Axes* ax : group.members)
    {
        if (x && has_flag(group.axis, LinkAxis::X))
            ax->xlim(x->min, x->max);
        if (y && has_flag(group.axis, LinkAxis::Y))
            ax->ylim(y->min, y->max);
    }
}

// ─── Propagation ─────────────────────────────────────────────────────────────

void AxisLinkManager::propagate_limits(Axes* source, AxisLimits new_xlim, AxisLimits new_ylim)
{
    if (!source)
        return;
    std::lock_guard lock(mutex_);
    if (propagating_)
        return;
    propagating_ = true;

    source->xlim(new_xlim.min, new_xlim.max);
    source->ylim(new_ylim.min, new_ylim.max);

    for (auto& [id, group] : groups_)
    {
        if (!group.contains(source))
            continue;

        for (Axes* peer : group.members)
        {
            if (peer == source)
                continue;
            if (has_flag(group.axis, LinkAxis::X))
                peer->xlim(new_xlim.min, new_xlim.max);
            if (has_flag(group.axis, LinkAxis::Y))
                peer->ylim(new_ylim.min, new_ylim.max);
        }
    }

    propagating_ = false;
}

// ─── Queries ─────────────────────────────────────────────────────────────────

std::vector<LinkGroupId> AxisLinkManager::groups_for(const Axes* ax) const
{
    std::lock_guard          lock(mutex_);
    std::vector<LinkGroupId> result;
    for (const auto& [id, group] : groups_)
    {
        if (group.contains(ax))
            result.push_back(id);
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<Axes*> AxisLinkManager::linked_peers(const Axes* ax) const
{
    std::lock_guard    lock(mutex_);
    std::vector<Axes*> result;
    for (const auto& [id, group] : groups_)
    {
        if (!group.contains(ax))
            continue;
        for (Axes* member : group.members)
        {
            // Axes can sit in several groups; report each peer once.
            if (member != ax && std::find(result.begin(), result.end(), member) == result.end())
                result.push_back(member);
        }
    }
    return result;
}

bool AxisLinkManager::is_linked(const Axes* ax) const
{
    std::lock_guard lock(mutex_);
    return std::any_of(groups_.begin(),
                       groups_.end(),
                       [&](const auto& kv) { return kv.second.contains(ax) && kv.second.members.size() > 1; });
}

const LinkGroup* AxisLinkManager::group(LinkGroupId id) const
{
    std::lock_guard lock(mutex_);
    auto            it = groups_.find(id);
    return it != groups_.end() ? &it->second : nullptr;
}

size_t AxisLinkManager::group_count() const
{
    std::lock_guard lock(mutex_);
    return groups_.size();
}

// ─── Internal ────────────────────────────────────────────────────────────────

// Runs the change callback with the mutex released so it may query the
// manager.
void AxisLinkManager::notify(std::unique_lock<std::mutex>& lock)
{
    LinkChangeCallback cb = on_change_;
    lock.unlock();
    if (cb)
        cb();
}

}   // namespace geofacet
