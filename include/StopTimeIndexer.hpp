#pragma once
#include <string>
#include <string_view>
#include <unordered_map>
#include "Types.hpp"

// Single pass over stop_times.txt keeping only rows of the two target stops.
class StopTimeIndexer
{
public:
    using Index = std::unordered_map<std::string, StopTimeEntry>;

    static Index build(std::string_view stopTimesText, StationPair const& stations);
};
