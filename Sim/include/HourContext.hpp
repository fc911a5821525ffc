#pragma once

// Fixed calendar of the dispatch year: 365 identical days, no leap day.
constexpr int HOURS_PER_DAY  = 24;
constexpr int DAYS_PER_YEAR  = 365;
constexpr int HOURS_PER_YEAR = HOURS_PER_DAY * DAYS_PER_YEAR;  // 8760

// Position of one simulated hour inside the year.
struct HourContext {
    int hour_index  = 0;   // 0..8759
    int hour_of_day = 0;   // 0..23
    int day         = 0;   // 0..364

    static HourContext at(int hour_index) {
        return HourContext{ hour_index,
                            hour_index % HOURS_PER_DAY,
                            hour_index / HOURS_PER_DAY };
    }

    bool isEndOfDay() const { return hour_of_day == HOURS_PER_DAY - 1; }
};
