#include "vigil/registry.hpp"

#include <mutex>
#include <utility>

#include "lcr/log/logger.hpp"


namespace vigil {

void Registry::add(std::unique_ptr<LivenessCheck> check) {
    if (!check) [[unlikely]] {
        VG_WARN("[REGISTRY] Ignoring null liveness check.");
        return;
    }
    std::string key = check->name();
    bool replaced = false;
    std::unique_ptr<LivenessCheck> previous;
    {
        std::unique_lock lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            // Destroy the old check outside the lock
            previous = std::move(it->second);
            it->second = std::move(check);
            replaced = true;
        } else {
            entries_.emplace(key, std::move(check));
        }
    }
    if (replaced) {
        VG_DEBUG("[REGISTRY] Replaced liveness check '" << key << "'.");
    } else {
        VG_DEBUG("[REGISTRY] Added liveness check '" << key << "'.");
    }
}

bool Registry::remove(std::string_view name) {
    std::unique_ptr<LivenessCheck> removed;
    {
        std::unique_lock lock(mutex_);
        auto it = entries_.find(name);
        if (it == entries_.end()) {
            return false;
        }
        removed = std::move(it->second);
        entries_.erase(it);
    }
    VG_DEBUG("[REGISTRY] Removed liveness check '" << name << "'.");
    return true;
}

bool Registry::whack(std::string_view name) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        return false;
    }
    it->second->reset();
    return true;
}

bool Registry::contains(std::string_view name) const {
    std::shared_lock lock(mutex_);
    return entries_.find(name) != entries_.end();
}

std::size_t Registry::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

std::vector<std::string> Registry::names() const {
    std::vector<std::string> out;
    std::shared_lock lock(mutex_);
    out.reserve(entries_.size());
    for (const auto& [name, check] : entries_) {
        out.push_back(name);
    }
    return out;
}

Status Registry::check_all() const {
    std::vector<std::string> expired;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [name, check] : entries_) {
            if (check->expired()) {
                expired.push_back(name);
            }
        }
    }
    if (expired.empty()) {
        return Status::success();
    }
    return Status::aggregate_failure(std::move(expired));
}

} // namespace vigil
