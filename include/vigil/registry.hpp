#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "vigil/error.hpp"
#include "vigil/liveness_check.hpp"


namespace vigil {

/*
===============================================================================
 Registry
===============================================================================

Owns a set of liveness checks keyed by name.

Locking:
  - add() / remove()         -> exclusive lock (structural writes)
  - check_all() / whack()    -> shared lock
  - contains() / size() / names() -> shared lock

A whack only touches the check's own atomic state, so components may whack
concurrently with each other and with a running check_all().

Re-adding a name replaces the previous check (last writer wins).
===============================================================================
*/
class Registry {
public:
    Registry() = default;
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // Inserts or replaces by check->name(). Null checks are ignored.
    void add(std::unique_ptr<LivenessCheck> check);

    // Returns true if an entry was removed.
    bool remove(std::string_view name);

    // Resets the named check. Returns false if no such check is registered.
    [[nodiscard]] bool whack(std::string_view name) const;

    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] std::size_t size() const;

    // Registered names in ascending order.
    [[nodiscard]] std::vector<std::string> names() const;

    // One consistent pass over all entries. Ok if nothing is expired,
    // otherwise AggregateFailure naming every expired check in sorted order.
    [[nodiscard]] Status check_all() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::unique_ptr<LivenessCheck>, std::less<>> entries_;
};

} // namespace vigil
