// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================

#include "factguard/platform.hpp"

#include <ctime>
#include <stdexcept>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace factguard::platform {

// ----------------------------------------------------------------------------
// Пути
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
    // u8path: на Windows UTF-8 -> UTF-16, на Unix без изменений
    return std::filesystem::u8path(u8str.begin(), u8str.end());
}

std::string path_to_utf8(const std::filesystem::path& p) {
    return p.u8string();
}

// ----------------------------------------------------------------------------
// Терминал
// ----------------------------------------------------------------------------

bool is_terminal(std::FILE* stream) {
#ifdef _WIN32
    return _isatty(_fileno(stream)) != 0;
#else
    return isatty(fileno(stream)) != 0;
#endif
}

// ----------------------------------------------------------------------------
// Локальное время
// ----------------------------------------------------------------------------

int local_hour() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
#ifdef _WIN32
    bool ok = localtime_s(&local, &now) == 0;
#else
    bool ok = localtime_r(&now, &local) != nullptr;
#endif
    if (!ok) {
        throw std::runtime_error("Failed to read local time");
    }
    return local.tm_hour;
}

}  // namespace factguard::platform
