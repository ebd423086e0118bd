// day_sequence.hpp

#pragma once

#include <ctime>
#include <string>
#include <vector>

#include "frame.hpp"

struct DayGroup {
    long day_index = 0;
    std::vector<CorrectedFrame> frames;

    std::time_t first_timestamp() const { return frames.front().corrected_timestamp; }
    std::time_t last_timestamp() const { return frames.back().corrected_timestamp; }
    std::string date_string() const;
};

// Groups by the local calendar date of the corrected timestamp. Frames inside
// a group are ordered by corrected time, ties by source order; groups by date.
// Throws EmptyInputError when frames is empty.
std::vector<DayGroup> group_by_day(std::vector<CorrectedFrame> frames);

size_t count_frames(const std::vector<DayGroup>& groups);
