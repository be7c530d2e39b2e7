#include "market_data/ExpiryCalendar.hpp"
#include <chrono>
#include <iostream>
#include <string>

using namespace std::chrono;

static int failures = 0;

static void check(bool condition, const std::string& name) {
    if (condition) {
        std::cout << "[PASS] " << name << std::endl;
    } else {
        std::cout << "[FAIL] " << name << std::endl;
        ++failures;
    }
}

int main() {
    std::cout << "Running ExpiryCalendar Unit Test..." << std::endl;

    // 2026-10-20 is a Tuesday.
    sys_days tuesday = sys_days{year{2026} / October / 20};

    auto morning = optgate::weekly_expiries("NIFTY", 5, tuesday, 5);
    check(morning.size() == 5, "five expiries returned");
    check(!morning.empty() && morning[0].date == "20-Oct-2026" && morning[0].days_away == 0,
          "expiry day itself included before the cutoff");
    check(!morning.empty() && morning[0].weekday == "Tuesday" && morning[0].label == "20 Oct 26" &&
          morning[0].iso == "2026-10-20", "entry formats");
    bool weekly = true;
    for (size_t i = 1; i < morning.size(); ++i) {
        if (morning[i].days_away != morning[i - 1].days_away + 7) weekly = false;
    }
    check(weekly, "expiries one week apart");

    auto evening = optgate::weekly_expiries("NIFTY", 2, tuesday, 10);
    check(evening.size() == 2 && evening[0].date == "27-Oct-2026" && evening[0].days_away == 7,
          "expiry day skipped from 10:00 UTC");

    auto sensex = optgate::weekly_expiries("sensex", 1, tuesday, 5);
    check(sensex.size() == 1 && sensex[0].date == "22-Oct-2026" && sensex[0].weekday == "Thursday",
          "SENSEX expires on Thursday");
    auto bsesen = optgate::weekly_expiries("BSESEN", 1, tuesday, 5);
    check(bsesen.size() == 1 && bsesen[0].weekday == "Thursday", "BSESEN expires on Thursday");

    // Year rollover from Monday 2026-12-28.
    auto rollover = optgate::weekly_expiries("BANKNIFTY", 2, sys_days{year{2026} / December / 28}, 0);
    check(rollover.size() == 2 && rollover[0].date == "29-Dec-2026" && rollover[1].date == "05-Jan-2027" &&
          rollover[1].label == "05 Jan 27", "dates roll into the next year");

    // The search window is 60 days.
    auto many = optgate::weekly_expiries("NIFTY", 20, tuesday, 5);
    check(many.size() == 9, "no more than the 60-day window holds");

    check(optgate::weekly_expiries("NIFTY").size() == 5, "current-date overload returns the default count");

    if (failures > 0) {
        std::cout << failures << " check(s) failed." << std::endl;
        return 1;
    }
    return 0;
}
