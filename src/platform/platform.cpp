// ==============================================================================
// platform.cpp - MOD-0004: Платформенные абстракции
// ==============================================================================

#include "unifilter/platform.hpp"

#include <cstdio>
#include <thread>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace unifilter::platform {

namespace {

inline bool stream_is_tty(std::FILE* stream) {
#ifdef _WIN32
    return _isatty(_fileno(stream)) != 0;
#else
    return isatty(fileno(stream)) != 0;
#endif
}

}  // namespace

// Списки и каталоги паттернов приходят из argv и YAML в UTF-8;
// u8path/u8string делают перекодировку там, где native-кодировка другая.

std::filesystem::path path_from_utf8(std::string_view u8str) {
    if (u8str.empty()) {
        return {};
    }
    return std::filesystem::u8path(u8str.begin(), u8str.end());
}

std::string path_to_utf8(const std::filesystem::path& p) {
    return p.u8string();
}

bool is_tty_stdout() {
    return stream_is_tty(stdout);
}

bool is_tty_stderr() {
    return stream_is_tty(stderr);
}

std::size_t hardware_threads() {
    // 0 = ОС не сообщает значение
    const unsigned int n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : static_cast<std::size_t>(n);
}

std::string os_name() {
#if defined(_WIN32)
    return "Windows";
#elif defined(__APPLE__)
    return "macOS";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

}  // namespace unifilter::platform
