#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "ksuid/generator.hpp"
#include "ksuid/ksuid.hpp"

namespace ksuid::bench {

struct Measurement {
    std::string label;
    std::size_t iterations = 0;
    double seconds = 0.0;
    std::size_t unique = 0;   // generation only
    bool sorted_ok = true;    // sorting only

    double Rate() const noexcept;
};

struct GenerationRun {
    Measurement measurement;
    std::vector<Ksuid> ids;
};

GenerationRun RunGeneration(std::size_t count, Generator& generator);
Measurement RunStringParsing(const std::vector<Ksuid>& ids);
Measurement RunBytesParsing(const std::vector<Ksuid>& ids);
Measurement RunComparison(const std::vector<Ksuid>& ids, std::size_t iterations);
Measurement RunSorting(const std::vector<Ksuid>& ids);

// Integer with thousands separators, e.g. "1,234,567".
std::string FormatCount(std::size_t value);

// Throughput as "2,500/second", or "2,500 KSUIDs/second" when a unit is given.
std::string FormatRate(const Measurement& measurement, std::string_view unit = {});

}  // namespace ksuid::bench
