#include "market_data/ExpiryCalendar.hpp"
#include "common/Utils.hpp"
#include <cstdio>

namespace optgate {

    namespace {

        constexpr const char* MONTHS[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                          "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
        constexpr const char* WEEKDAYS[] = {"Sunday", "Monday", "Tuesday", "Wednesday",
                                            "Thursday", "Friday", "Saturday"};

        constexpr int SEARCH_DAYS = 60;
        constexpr int CUTOFF_UTC_HOUR = 10;

        ExpiryDate make_entry(std::chrono::sys_days day, int days_away) {
            std::chrono::year_month_day ymd{day};
            int year = static_cast<int>(ymd.year());
            unsigned month = static_cast<unsigned>(ymd.month());
            unsigned mday = static_cast<unsigned>(ymd.day());
            const char* mon = MONTHS[month - 1];

            char buf[32];
            ExpiryDate entry;
            snprintf(buf, sizeof(buf), "%02u-%s-%04d", mday, mon, year);
            entry.date = buf;
            snprintf(buf, sizeof(buf), "%02u %s %02d", mday, mon, year % 100);
            entry.label = buf;
            snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year, month, mday);
            entry.iso = buf;
            entry.days_away = days_away;
            entry.weekday = WEEKDAYS[std::chrono::weekday{day}.c_encoding()];
            return entry;
        }

    }

    std::vector<ExpiryDate> weekly_expiries(std::string_view symbol, size_t count,
                                            std::chrono::sys_days today, int utc_hour) {
        std::string upper = utils::to_upper(symbol);
        bool bse = upper.find("SENSEX") != std::string::npos || upper.find("BSESEN") != std::string::npos;
        std::chrono::weekday target = bse ? std::chrono::Thursday : std::chrono::Tuesday;

        std::vector<ExpiryDate> out;
        for (int i = 0; i < SEARCH_DAYS && out.size() < count; ++i) {
            std::chrono::sys_days day = today + std::chrono::days{i};
            if (std::chrono::weekday{day} != target) continue;
            if (i == 0 && utc_hour >= CUTOFF_UTC_HOUR) continue;
            out.push_back(make_entry(day, i));
        }
        return out;
    }

    std::vector<ExpiryDate> weekly_expiries(std::string_view symbol, size_t count) {
        auto now = std::chrono::system_clock::now();
        auto today = std::chrono::floor<std::chrono::days>(now);
        int hour = static_cast<int>(std::chrono::duration_cast<std::chrono::hours>(now - today).count());
        return weekly_expiries(symbol, count, today, hour);
    }

}
