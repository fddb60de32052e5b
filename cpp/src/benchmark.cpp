#include "ksuid/benchmark.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <unordered_set>

namespace ksuid::bench {

namespace {

using SteadyClock = std::chrono::steady_clock;

double SecondsSince(SteadyClock::time_point start) {
    return std::chrono::duration<double>(SteadyClock::now() - start).count();
}

// Keeps the optimiser from discarding benchmarked work.
volatile std::size_t g_sink = 0;

}  // namespace

double Measurement::Rate() const noexcept {
    if (seconds <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(iterations) / seconds;
}

GenerationRun RunGeneration(std::size_t count, Generator& generator) {
    GenerationRun run;
    run.ids.reserve(count);
    const auto start = SteadyClock::now();
    for (std::size_t i = 0; i < count; ++i) {
        run.ids.push_back(generator.Next());
    }
    run.measurement.seconds = SecondsSince(start);
    run.measurement.label = "generation";
    run.measurement.iterations = count;
    run.measurement.unique = std::unordered_set<Ksuid>(run.ids.begin(), run.ids.end()).size();
    return run;
}

Measurement RunStringParsing(const std::vector<Ksuid>& ids) {
    std::vector<std::string> texts;
    texts.reserve(ids.size());
    for (const auto& id : ids) {
        texts.push_back(id.ToBase62());
    }
    Measurement m;
    m.label = "string parsing";
    m.iterations = texts.size();
    const auto start = SteadyClock::now();
    for (const auto& text : texts) {
        g_sink = g_sink + Ksuid::FromString(text).RawTimestamp();
    }
    m.seconds = SecondsSince(start);
    return m;
}

Measurement RunBytesParsing(const std::vector<Ksuid>& ids) {
    std::vector<crypto::Bytes> buffers;
    buffers.reserve(ids.size());
    for (const auto& id : ids) {
        buffers.emplace_back(id.Bytes().begin(), id.Bytes().end());
    }
    Measurement m;
    m.label = "bytes parsing";
    m.iterations = buffers.size();
    const auto start = SteadyClock::now();
    for (const auto& buffer : buffers) {
        g_sink = g_sink + Ksuid::FromBytes(buffer).RawTimestamp();
    }
    m.seconds = SecondsSince(start);
    return m;
}

Measurement RunComparison(const std::vector<Ksuid>& ids, std::size_t iterations) {
    Measurement m;
    m.label = "comparison";
    if (ids.size() < 2) {
        return m;
    }
    m.iterations = iterations;
    std::size_t less = 0;
    const auto start = SteadyClock::now();
    for (std::size_t i = 0; i < iterations; ++i) {
        const Ksuid& a = ids[i % ids.size()];
        const Ksuid& b = ids[(i + 1) % ids.size()];
        if (a < b) {
            ++less;
        }
    }
    m.seconds = SecondsSince(start);
    g_sink = g_sink + less;
    return m;
}

Measurement RunSorting(const std::vector<Ksuid>& ids) {
    std::vector<Ksuid> shuffled(ids.rbegin(), ids.rend());
    Measurement m;
    m.label = "sorting";
    m.iterations = shuffled.size();
    const auto start = SteadyClock::now();
    std::sort(shuffled.begin(), shuffled.end());
    m.seconds = SecondsSince(start);
    m.sorted_ok = std::is_sorted(shuffled.begin(), shuffled.end());
    return m;
}

std::string FormatCount(std::size_t value) {
    std::string digits = std::to_string(value);
    std::string out;
    out.reserve(digits.size() + digits.size() / 3);
    const std::size_t lead = digits.size() % 3;
    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (i != 0 && i >= lead && (i - lead) % 3 == 0) {
            out.push_back(',');
        }
        out.push_back(digits[i]);
    }
    return out;
}

std::string FormatRate(const Measurement& measurement, std::string_view unit) {
    std::string out = FormatCount(static_cast<std::size_t>(measurement.Rate()));
    if (!unit.empty()) {
        out.push_back(' ');
        out.append(unit);
    }
    out.append("/second");
    return out;
}

}  // namespace ksuid::bench
