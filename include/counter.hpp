/**
 * CardForge Engine - Counters
 *
 * Typed markers carried by cards and players (+1/+1, poison, charge, ...).
 * A counter list holds at most one record per type.
 */

#pragma once

#include <string>
#include <vector>

namespace cardforge {

struct Counter {
    std::string type;
    int count = 0;

    bool operator==(const Counter& other) const {
        return type == other.type && count == other.count;
    }
    bool operator!=(const Counter& other) const { return !(*this == other); }
};

using CounterList = std::vector<Counter>;

namespace counters {

/**
 * Check a single counter record. Throws ValidationError on an empty type
 * or a negative count.
 */
void validate(const Counter& counter);

/**
 * Check a whole list, including the one-record-per-type rule.
 */
void validate(const CounterList& list);

const Counter* find(const CounterList& list, const std::string& type);

int count_of(const CounterList& list, const std::string& type);

/**
 * Merge a counter into the list. Adding to an existing type sums the counts.
 * Throws ActionError("Counter count overflow") when the sum leaves int range.
 */
CounterList added(const CounterList& list, const Counter& counter);

/**
 * Remove some of a counter type. Reaching exactly zero drops the record.
 *
 * Throws ActionError when the type is absent or the list holds fewer.
 */
CounterList removed(const CounterList& list, const Counter& counter);

} // namespace counters

} // namespace cardforge
