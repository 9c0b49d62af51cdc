#include "ServiceCalendar.hpp"
#include <stdexcept>

std::unordered_set<std::string> ServiceCalendar::activeServices(std::vector<CalendarRule> const& rules,
                                                                std::vector<CalendarException> const& exceptions,
                                                                std::string const& date,
                                                                int weekday)
{
    if (weekday < 0 || weekday > 6)
        throw std::invalid_argument("weekday out of range: " + std::to_string(weekday));

    std::unordered_set<std::string> today;

    for (auto const& r : rules)
    {
        if (r.startDate > date || r.endDate < date)
            continue;
        if (r.weekdays[static_cast<std::size_t>(weekday)])
            today.insert(r.serviceId);
    }

    for (auto const& e : exceptions)
    {
        if (e.date != date)
            continue;

        if (e.type == CalendarException::Type::Add)
            today.insert(e.serviceId);
        else
            today.erase(e.serviceId);
    }

    return today;
}
