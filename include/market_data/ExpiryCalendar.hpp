#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace optgate {

    struct ExpiryDate {
        std::string date;      // "21-Oct-2026", the broker's expiry_date format
        std::string label;     // "21 Oct 26"
        int days_away = 0;
        std::string weekday;   // "Tuesday"
        std::string iso;       // "2026-10-21"
    };

    // Function: weekly_expiries
    // Description: Next weekly option expiries for an index. SENSEX/BSESEN contracts
    //              expire on Thursday, everything else on Tuesday. Today's expiry is
    //              skipped once utc_hour reaches 10 (after the Indian market close).
    // Inputs: symbol - index name; count - how many dates; today - calendar date;
    //         utc_hour - current UTC hour.
    // Outputs: Up to count dates, nearest first, searching 60 days ahead.
    std::vector<ExpiryDate> weekly_expiries(std::string_view symbol, size_t count,
                                            std::chrono::sys_days today, int utc_hour);

    // Same, for the current UTC date and hour.
    std::vector<ExpiryDate> weekly_expiries(std::string_view symbol, size_t count = 5);

}
