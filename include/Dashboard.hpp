#pragma once
#include <string>
#include <vector>
#include "Types.hpp"

// JSON body of the departure board.
class Dashboard
{
public:
    static std::string generate(std::string const& title, LocalNow const& now,
                                std::vector<Departure> const& departures);

    // Same shape with "updated": null, no departures and an "error" field.
    static std::string generateError(std::string const& title, std::string const& error);
};
