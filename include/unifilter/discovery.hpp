// ==============================================================================
// unifilter/discovery.hpp - MOD-0005: Поиск файлов описаний и списков
// ==============================================================================
//
// MOD-0005 io::discovery
//
// Используется в двух местах: rule::load ищет *.yml/*.yaml/*.json в каталоге
// базы (без рекурсии), команда process раскрывает позиционные пути списков.
//
// ==============================================================================

#ifndef UNIFILTER_DISCOVERY_HPP
#define UNIFILTER_DISCOVERY_HPP

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace unifilter::io {

struct DiscoveryOptions {
    /// Расширения без точки, в нижнем регистре; nullopt - любые файлы
    std::optional<std::unordered_set<std::string>> extensions;

    bool recursive = true;

    /// Ошибки файловой системы уходят в on_warning вместо исключения
    bool skip_errors = false;
    std::function<void(std::string_view)> on_warning;
};

/// yml, yaml, json
std::unordered_set<std::string> descriptor_extensions();

/// txt, list
std::unordered_set<std::string> list_extensions();

/// Раскрыть пути в отсортированный список файлов без повторов.
///
/// Файл, переданный явно, принимается при любом расширении; внутри
/// директорий фильтр extensions применяется к каждому файлу.
///
/// @throws std::runtime_error при ошибке файловой системы (если skip_errors=false)
std::vector<std::filesystem::path> discover_files(const std::vector<std::filesystem::path>& inputs,
                                                  const DiscoveryOptions& opt);

}  // namespace unifilter::io

#endif  // UNIFILTER_DISCOVERY_HPP
