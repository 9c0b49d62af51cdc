#include "Clock.hpp"
#include <cstdio>
#include <date/tz.h>

using namespace std::chrono;

ZonedClock::ZonedClock(std::string const& zoneName)
    : zone(date::locate_zone(zoneName))
{
}

system_clock::time_point ZonedClock::instant() const
{
    if (pinned.load(std::memory_order_relaxed))
        return system_clock::from_time_t(pinnedAt.load(std::memory_order_relaxed));
    return system_clock::now();
}

LocalNow ZonedClock::localNow() const
{
    return toLocal(zone, instant());
}

void ZonedClock::pin(std::time_t t)
{
    pinnedAt.store(t, std::memory_order_relaxed);
    pinned.store(true, std::memory_order_relaxed);
}

LocalNow ZonedClock::toLocal(date::time_zone const* zone, system_clock::time_point tp)
{
    date::zoned_time zt{zone, date::floor<seconds>(tp)};

    auto local = zt.get_local_time();
    auto day = date::floor<date::days>(local);
    date::year_month_day ymd{day};
    date::hh_mm_ss tod{local - day};

    LocalNow now;

    char dateBuf[16];
    std::snprintf(dateBuf, sizeof(dateBuf), "%04d%02u%02u",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()));
    now.date = dateBuf;

    // iso_encoding: Monday = 1 ... Sunday = 7
    now.weekday = static_cast<int>(date::weekday{day}.iso_encoding()) - 1;

    now.secondsOfDay = static_cast<int>(tod.hours().count() * 3600
                                      + tod.minutes().count() * 60
                                      + tod.seconds().count());

    char hhmmBuf[8];
    std::snprintf(hhmmBuf, sizeof(hhmmBuf), "%02d:%02d",
                  static_cast<int>(tod.hours().count()),
                  static_cast<int>(tod.minutes().count()));
    now.hhmm = hhmmBuf;

    return now;
}
