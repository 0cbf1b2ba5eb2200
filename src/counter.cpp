/**
 * CardForge Engine - Counter Implementation
 */

#include "counter.hpp"
#include "errors.hpp"
#include "types.hpp"
#include <algorithm>
#include <set>

namespace cardforge {
namespace counters {

void validate(const Counter& counter) {
    if (counter.type.empty()) {
        throw ValidationError("Counter type cannot be empty");
    }
    if (counter.count < 0) {
        throw ValidationError("Counter count cannot be negative");
    }
}

void validate(const CounterList& list) {
    std::set<std::string> seen;
    for (const auto& counter : list) {
        validate(counter);
        if (!seen.insert(counter.type).second) {
            throw ValidationError("Duplicate counter type: " + counter.type);
        }
    }
}

const Counter* find(const CounterList& list, const std::string& type) {
    auto it = std::find_if(list.begin(), list.end(),
                           [&](const Counter& c) { return c.type == type; });
    return it != list.end() ? &(*it) : nullptr;
}

int count_of(const CounterList& list, const std::string& type) {
    const Counter* counter = find(list, type);
    return counter ? counter->count : 0;
}

CounterList added(const CounterList& list, const Counter& counter) {
    validate(counter);

    CounterList result = list;
    for (auto& existing : result) {
        if (existing.type == counter.type) {
            std::optional<int> total = checked_add(existing.count, counter.count);
            if (!total) {
                throw ActionError("Counter count overflow");
            }
            existing.count = *total;
            return result;
        }
    }
    result.push_back(counter);
    return result;
}

CounterList removed(const CounterList& list, const Counter& counter) {
    validate(counter);

    CounterList result = list;
    auto it = std::find_if(result.begin(), result.end(),
                           [&](const Counter& c) { return c.type == counter.type; });
    if (it == result.end()) {
        throw ActionError("Cannot remove counters that do not exist");
    }
    if (it->count < counter.count) {
        throw ActionError("Cannot remove more counters than exist");
    }

    it->count -= counter.count;
    if (it->count == 0) {
        result.erase(it);
    }
    return result;
}

} // namespace counters
} // namespace cardforge
