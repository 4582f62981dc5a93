// ==============================================================================
// factguard/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Пути в UTF-8 (аргументы CLI, сообщения), терминал для цветного вывода,
// локальный час для time.* в контексте.
//
// ==============================================================================

#ifndef FACTGUARD_PLATFORM_HPP
#define FACTGUARD_PLATFORM_HPP

#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>

namespace factguard::platform {

/// UTF-8 строка (аргумент командной строки) -> path
std::filesystem::path path_from_utf8(std::string_view u8str);

/// path -> UTF-8 строка для сообщений и JSON
std::string path_to_utf8(const std::filesystem::path& p);

/// Поток подключён к терминалу
bool is_terminal(std::FILE* stream);

/// Текущий час по локальному времени (0..23).
/// @throw std::runtime_error если системное время недоступно
int local_hour();

}  // namespace factguard::platform

#endif  // FACTGUARD_PLATFORM_HPP
