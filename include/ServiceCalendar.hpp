#pragma once
#include <string>
#include <unordered_set>
#include <vector>
#include "Types.hpp"

class ServiceCalendar
{
public:
    // Services running on date (YYYYMMDD, weekday 0 = Monday). Rules first,
    // then exceptions for that date in row order; a later exception for the
    // same service overrides an earlier one.
    static std::unordered_set<std::string> activeServices(std::vector<CalendarRule> const& rules,
                                                          std::vector<CalendarException> const& exceptions,
                                                          std::string const& date,
                                                          int weekday);
};
