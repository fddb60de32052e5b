#include "ksuid/cli_colors.hpp"

#include "ksuid/constants.hpp"

#include <cstdio>
#include <iostream>

#if defined(_WIN32) || defined(_WIN64)
    #include <io.h>
    #include <windows.h>
    #define isatty _isatty
    #define fileno _fileno

    #ifndef ENABLE_VIRTUAL_TERMINAL_PROCESSING
        #define ENABLE_VIRTUAL_TERMINAL_PROCESSING 0x0004
    #endif
#else
    #include <unistd.h>
#endif

namespace ksuid::cli {

namespace {
    bool g_forced = false;
    bool g_forced_value = false;

#if defined(_WIN32) || defined(_WIN64)
    bool EnableWindowsAnsiColors() {
        HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
        if (hOut == INVALID_HANDLE_VALUE) {
            return false;
        }

        DWORD mode = 0;
        if (!GetConsoleMode(hOut, &mode)) {
            return false;
        }

        mode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
        return SetConsoleMode(hOut, mode) != 0;
    }
#endif

    bool DetectTty(std::FILE* stream) {
        bool is_tty = isatty(fileno(stream)) != 0;
#if defined(_WIN32) || defined(_WIN64)
        if (is_tty) {
            is_tty = EnableWindowsAnsiColors();
        }
#endif
        return is_tty;
    }
}

bool ColorsEnabled(std::ostream& os) {
    if (g_forced) {
        return g_forced_value;
    }
    if (constants::ColorsDisabledByEnv()) {
        return false;
    }
    // Probed once per stream; the answer cannot change during a run.
    static const bool stdout_tty = DetectTty(stdout);
    static const bool stderr_tty = DetectTty(stderr);
    if (&os == &std::cout) {
        return stdout_tty;
    }
    if (&os == &std::cerr) {
        return stderr_tty;
    }
    return false;
}

void SetColorsEnabled(bool enabled) {
    g_forced = true;
    g_forced_value = enabled;
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

}  // namespace ksuid::cli
