// day_sequence.cpp

#include <algorithm>

#include "day_sequence.hpp"
#include "errors.hpp"
#include "utils.hpp"

std::string DayGroup::date_string() const {
    return format_local_time(local_day_start(day_index), "%Y-%m-%d");
}

std::vector<DayGroup> group_by_day(std::vector<CorrectedFrame> frames) {
    if (frames.empty()) {
        throw EmptyInputError("No frames survived day/night classification");
    }

    std::stable_sort(frames.begin(), frames.end(),
        [](const CorrectedFrame& a, const CorrectedFrame& b) {
            if (a.corrected_timestamp != b.corrected_timestamp) {
                return a.corrected_timestamp < b.corrected_timestamp;
            }
            return a.source.source_order < b.source.source_order;
        });

    // Sorted by time means sorted by date, so each date is one contiguous run
    std::vector<DayGroup> groups;
    for (auto& frame : frames) {
        long day = local_day_index(frame.corrected_timestamp);
        if (groups.empty() || groups.back().day_index != day) {
            DayGroup group;
            group.day_index = day;
            groups.push_back(group);
        }
        groups.back().frames.push_back(std::move(frame));
    }
    return groups;
}

size_t count_frames(const std::vector<DayGroup>& groups) {
    size_t total = 0;
    for (const auto& group : groups) {
        total += group.frames.size();
    }
    return total;
}
