#ifndef BUDDY_SYSTEM_SIMULATOR_SIMULATOR_CONFIG_H
#define BUDDY_SYSTEM_SIMULATOR_SIMULATOR_CONFIG_H

#include <logger.h>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

/**
 * @struct simulator_config
 * @brief Настройки симулятора из JSON-файла
 *
 * {
 *   "memory": {"capacity": 128, "min_block_size": 1},
 *   "logger": {"type": "client", "format": "...", "streams": [...]}
 * }
 *
 * Отсутствующие ключи получают значения по умолчанию.
 */
struct simulator_config
{
    size_t capacity = 128;

    size_t min_block_size = 1;

    // Секция "logger" как есть, её разбирает строитель выбранного логгера
    nlohmann::json logger_section;

    simulator_config();

    // @throws std::runtime_error если файл не читается или значения неверного типа
    static simulator_config load(std::string const &configuration_file_path);

    static simulator_config from_json(nlohmann::json const &config);

    static nlohmann::json default_logger_section();

};

/**
 * @brief Строит логгер по секции конфигурации
 * @throws std::runtime_error при неизвестном типе логгера
 */
std::unique_ptr<logger> make_logger(nlohmann::json const &logger_section);

#endif //BUDDY_SYSTEM_SIMULATOR_SIMULATOR_CONFIG_H
