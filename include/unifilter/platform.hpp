// ==============================================================================
// unifilter/platform.hpp - MOD-0004: Платформенные абстракции
// ==============================================================================
//
// MOD-0004 platform
//
// Назначение:
// - Преобразования path <-> UTF-8
// - Определение TTY для цветного вывода
// - Число аппаратных потоков для пула обработки
// - Информация о платформе
//
// Вся платформенная специфика изолирована в этом модуле.
//
// ==============================================================================

#ifndef UNIFILTER_PLATFORM_HPP
#define UNIFILTER_PLATFORM_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace unifilter::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// UTF-8 строка -> native path
std::filesystem::path path_from_utf8(std::string_view u8str);

/// native path -> UTF-8 строка (для вывода и сообщений об ошибках)
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Ресурсы хоста
// ----------------------------------------------------------------------------

/// Число аппаратных потоков (минимум 1, даже если ОС не сообщает значение)
std::size_t hardware_threads();

/// Имя ОС: "Windows", "macOS", "Linux" или "Unknown"
std::string os_name();

}  // namespace unifilter::platform

#endif  // UNIFILTER_PLATFORM_HPP
