#include "ksuid/benchmark.hpp"
#include "ksuid/cli_colors.hpp"
#include "ksuid/clock.hpp"
#include "ksuid/constants.hpp"
#include "ksuid/errors.hpp"
#include "ksuid/format.hpp"
#include "ksuid/generator.hpp"
#include "ksuid/ksuid.hpp"
#include "ksuid/prefixed.hpp"
#include "ksuid/token.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

using Args = std::vector<std::string>;

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  ksuid_cli generate [-c <n>] [-v] [-p <prefix>] [--lower]\n";
    std::cout << "  ksuid_cli token [-c <n>] [--lower]\n";
    std::cout << "  ksuid_cli inspect <ksuid>\n";
    std::cout << "  ksuid_cli compare <ksuid1> <ksuid2>\n";
    std::cout << "  ksuid_cli benchmark [-c <n>]\n";
    std::cout << "  ksuid_cli --version\n";
    std::cout << "Global flags: --no-color\n";
    std::cout << "Environment: KSUID_LOWERCASE, KSUID_BENCH_ITERATIONS, KSUID_NO_COLOR, NO_COLOR\n";
}

struct GenerateArgs {
    std::size_t count = 1;
    bool verbose = false;
    bool lowercase = ksuid::constants::LowercaseByDefault();
    std::string prefix;
};

struct TokenArgs {
    std::size_t count = 1;
    bool lowercase = ksuid::constants::LowercaseByDefault();
};

struct BenchmarkArgs {
    std::size_t count = ksuid::constants::BenchIterations();
};

std::size_t ParseCount(const std::string& raw) {
    std::size_t used = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(raw, &used);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid count: " + raw);
    }
    if (used != raw.size() || parsed == 0 || raw.front() == '-') {
        throw std::runtime_error("Invalid count: " + raw);
    }
    return static_cast<std::size_t>(parsed);
}

const std::string& RequireValue(const Args& args, std::size_t idx, const char* what) {
    if (idx + 1 >= args.size()) {
        throw std::runtime_error(std::string("Missing ") + what);
    }
    return args[idx + 1];
}

GenerateArgs ParseGenerateArgs(const Args& args, std::size_t start_index) {
    GenerateArgs opts;
    std::size_t idx = start_index;
    while (idx < args.size()) {
        const std::string& flag = args[idx];
        if (flag == "-c" || flag == "--count") {
            opts.count = ParseCount(RequireValue(args, idx, "count value"));
            idx += 2;
        } else if (flag == "-v" || flag == "--verbose") {
            opts.verbose = true;
            idx += 1;
        } else if (flag == "-p" || flag == "--prefix") {
            opts.prefix = RequireValue(args, idx, "prefix value");
            idx += 2;
        } else if (flag == "--lower") {
            opts.lowercase = true;
            idx += 1;
        } else {
            throw std::runtime_error("Unknown flag: " + flag);
        }
    }
    return opts;
}

TokenArgs ParseTokenArgs(const Args& args, std::size_t start_index) {
    TokenArgs opts;
    std::size_t idx = start_index;
    while (idx < args.size()) {
        const std::string& flag = args[idx];
        if (flag == "-c" || flag == "--count") {
            opts.count = ParseCount(RequireValue(args, idx, "count value"));
            idx += 2;
        } else if (flag == "--lower") {
            opts.lowercase = true;
            idx += 1;
        } else {
            throw std::runtime_error("Unknown flag: " + flag);
        }
    }
    return opts;
}

BenchmarkArgs ParseBenchmarkArgs(const Args& args, std::size_t start_index) {
    BenchmarkArgs opts;
    std::size_t idx = start_index;
    while (idx < args.size()) {
        const std::string& flag = args[idx];
        if (flag == "-c" || flag == "--count") {
            opts.count = ParseCount(RequireValue(args, idx, "count value"));
            idx += 2;
        } else {
            throw std::runtime_error("Unknown flag: " + flag);
        }
    }
    return opts;
}

// Accepts either the 27-character base62 form or the 31-character base36 form.
ksuid::Ksuid ParseAnyForm(const std::string& text) {
    if (text.size() == ksuid::constants::kBase36Length) {
        return ksuid::Ksuid::FromBase36(text);
    }
    return ksuid::Ksuid::FromString(text);
}

void RunGenerate(const GenerateArgs& opts) {
    ksuid::SystemClock clock;
    ksuid::crypto::OpenSslRandomSource random;
    ksuid::Generator generator(clock, random);
    if (!opts.prefix.empty() && !ksuid::prefixed::IsValidPrefix(opts.prefix)) {
        throw ksuid::ValidationError(
            "Prefix must start with a letter and contain only alphanumeric characters and underscores");
    }
    for (std::size_t i = 0; i < opts.count; ++i) {
        ksuid::Ksuid id = generator.Next();
        std::string text;
        if (opts.prefix.empty()) {
            text = opts.lowercase ? id.ToBase36() : id.ToBase62();
        } else if (opts.lowercase) {
            text = ksuid::prefixed::CreateLowercase(opts.prefix, id);
        } else {
            text = ksuid::prefixed::Create(opts.prefix, id);
        }
        if (opts.verbose) {
            std::cout << text << " -> " << ksuid::cli::Cyan(ksuid::format::FormatUtc(id.Timestamp()))
                      << " (timestamp: " << id.Timestamp() << ")\n";
        } else {
            std::cout << text << "\n";
        }
    }
}

void RunToken(const TokenArgs& opts) {
    ksuid::crypto::OpenSslRandomSource random;
    for (std::size_t i = 0; i < opts.count; ++i) {
        ksuid::Token token = ksuid::Token::Generate(random);
        std::cout << (opts.lowercase ? token.ToBase36() : token.ToBase62()) << "\n";
    }
}

void RunInspect(const std::string& text) {
    ksuid::Ksuid id = ParseAnyForm(text);
    const auto& raw = id.Bytes();
    const auto payload = id.Payload();
    ksuid::SystemClock clock;

    std::cout << ksuid::cli::BoldBlue("KSUID:") << " " << id.ToBase62() << "\n";
    std::cout << ksuid::cli::BoldBlue("Base36:") << " " << id.ToBase36() << "\n";
    std::cout << ksuid::cli::BoldBlue("Timestamp:") << " " << id.Timestamp() << "\n";
    std::cout << ksuid::cli::BoldBlue("Datetime:") << " " << ksuid::format::FormatUtc(id.Timestamp()) << "\n";
    std::cout << ksuid::cli::BoldBlue("Payload:") << " " << ksuid::format::HexEncode(payload.data(), payload.size())
              << "\n";
    std::cout << ksuid::cli::BoldBlue("Raw bytes:") << " " << ksuid::format::HexEncode(raw.data(), raw.size())
              << "\n";
    std::cout << ksuid::cli::BoldBlue("Age:") << " "
              << ksuid::format::FormatDuration(clock.NowUnixSeconds() - id.Timestamp()) << "\n";
}

void RunCompare(const std::string& first, const std::string& second) {
    ksuid::Ksuid a = ParseAnyForm(first);
    ksuid::Ksuid b = ParseAnyForm(second);

    std::cout << "KSUID 1: " << a << "\n";
    std::cout << "  Timestamp: " << ksuid::format::FormatUtc(a.Timestamp()) << "\n\n";
    std::cout << "KSUID 2: " << b << "\n";
    std::cout << "  Timestamp: " << ksuid::format::FormatUtc(b.Timestamp()) << "\n\n";

    if (a == b) {
        std::cout << ksuid::cli::Green("Result: KSUIDs are identical") << "\n";
    } else if (a < b) {
        std::cout << ksuid::cli::Yellow("Result: KSUID 1 is older than KSUID 2") << "\n";
        std::cout << "Time difference: " << ksuid::format::FormatDuration(b.Timestamp() - a.Timestamp()) << "\n";
    } else {
        std::cout << ksuid::cli::Yellow("Result: KSUID 1 is newer than KSUID 2") << "\n";
        std::cout << "Time difference: " << ksuid::format::FormatDuration(a.Timestamp() - b.Timestamp()) << "\n";
    }
}

void PrintMeasurement(const ksuid::bench::Measurement& m, const char* unit) {
    std::cout << "  " << ksuid::cli::BoldBlue(m.label) << ": " << ksuid::bench::FormatCount(m.iterations) << " in "
              << m.seconds << " s (" << ksuid::bench::FormatRate(m, unit) << ")\n";
}

void RunBenchmark(const BenchmarkArgs& opts) {
    ksuid::SystemClock clock;
    ksuid::crypto::OpenSslRandomSource random;
    ksuid::Generator generator(clock, random);

    std::cout << "Benchmarking KSUID operations (" << ksuid::bench::FormatCount(opts.count) << " iterations)...\n";
    ksuid::bench::GenerationRun run = ksuid::bench::RunGeneration(opts.count, generator);
    PrintMeasurement(run.measurement, "KSUIDs");
    const std::size_t collisions = run.measurement.iterations - run.measurement.unique;
    std::cout << "  uniqueness: " << ksuid::bench::FormatCount(run.measurement.unique) << " / "
              << ksuid::bench::FormatCount(run.measurement.iterations) << " ("
              << (collisions == 0 ? ksuid::cli::Green("no collisions") : ksuid::cli::Red("collisions detected"))
              << ")\n";

    PrintMeasurement(ksuid::bench::RunStringParsing(run.ids), "parses");
    PrintMeasurement(ksuid::bench::RunBytesParsing(run.ids), "parses");
    PrintMeasurement(ksuid::bench::RunComparison(run.ids, opts.count * 5), "comparisons");
    ksuid::bench::Measurement sorting = ksuid::bench::RunSorting(run.ids);
    PrintMeasurement(sorting, "items");
    std::cout << "  correctly sorted: " << (sorting.sorted_ok ? ksuid::cli::Green("yes") : ksuid::cli::Red("no"))
              << "\n";
}

}  // namespace

int main(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--no-color") {
            ksuid::cli::SetColorsEnabled(false);
            continue;
        }
        args.push_back(std::move(arg));
    }
    if (args.empty()) {
        PrintUsage();
        return 2;
    }
    const std::string& command = args[0];
    try {
        if (command == "--version") {
            std::cout << "ksuid " << ksuid::constants::kLibraryVersion << "\n";
            return 0;
        }
        if (command == "-h" || command == "--help" || command == "help") {
            PrintUsage();
            return 0;
        }
        if (command == "generate") {
            RunGenerate(ParseGenerateArgs(args, 1));
            return 0;
        }
        if (command == "token") {
            RunToken(ParseTokenArgs(args, 1));
            return 0;
        }
        if (command == "inspect") {
            if (args.size() != 2) {
                PrintUsage();
                return 2;
            }
            RunInspect(args[1]);
            return 0;
        }
        if (command == "compare") {
            if (args.size() != 3) {
                PrintUsage();
                return 2;
            }
            RunCompare(args[1], args[2]);
            return 0;
        }
        if (command == "benchmark") {
            RunBenchmark(ParseBenchmarkArgs(args, 1));
            return 0;
        }
        PrintUsage();
        return 2;
    } catch (const std::exception& exc) {
        std::cerr << ksuid::cli::ErrorLabel() << " " << exc.what() << "\n";
        return 1;
    }
}
