// ==============================================================================
// duet/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Явные преобразования path <-> UTF-8
// - TTY detection для цветного вывода
// - Файловый ввод-вывод с атомарной заменой файла
// - Временные файлы и UTC время
//
// Вся платформенная специфика (#ifdef _WIN32) изолирована в platform.cpp.
//
// ==============================================================================

#ifndef DUET_PLATFORM_HPP
#define DUET_PLATFORM_HPP

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace duet::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// Создать path из UTF-8 строки
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Получить UTF-8 представление path
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Файлы
// ----------------------------------------------------------------------------

/// Прочитать файл целиком (nullopt если файл не открывается)
std::optional<std::string> read_file(const std::filesystem::path& path);

/// Записать файл через временный файл + rename.
/// Читатель никогда не видит частично записанный файл.
/// @return false при ошибке ввода-вывода
bool write_file_atomic(const std::filesystem::path& path, std::string_view bytes);

/// Создать временный файл с префиксом, вернуть его путь
/// @throw std::runtime_error при ошибке
std::filesystem::path make_temp_file(std::string_view prefix);

// ----------------------------------------------------------------------------
// Время
// ----------------------------------------------------------------------------

/// Разложить time_t в календарное UTC время (gmtime_r / gmtime_s)
std::tm utc_time(std::time_t t);

}  // namespace duet::platform

#endif  // DUET_PLATFORM_HPP
