/**
 * @file file_utils.hpp
 * @brief Вспомогательные функции для работы с файлами
 */

#pragma once

#include <filesystem>
#include <string>

namespace surfcast::io {

/**
 * @brief Чтение файла целиком
 * @throws std::runtime_error Если файл не открывается
 */
[[nodiscard]] std::string readTextFile(const std::filesystem::path& path);

/**
 * @brief Атомарная запись строковых данных в файл (через временный файл + rename).
 *
 * Каталог создаётся при необходимости.
 */
void atomicWrite(const std::filesystem::path& path, const std::string& content);

} // namespace surfcast::io
