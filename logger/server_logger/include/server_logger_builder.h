#ifndef BUDDY_SYSTEM_SIMULATOR_SERVER_LOGGER_BUILDER_H
#define BUDDY_SYSTEM_SIMULATOR_SERVER_LOGGER_BUILDER_H

#include <logger_builder.h>
#include <nlohmann/json.hpp>
#include <unordered_map>
#include "server_logger.h"

/**
 * @class server_logger_builder
 * @brief Поэтапная настройка server_logger
 */
class server_logger_builder final:
    public logger_builder
{
private:

    // Адрес коллектора логов
    std::string _destination;

    std::string _format;

    // Для каждого уровня: путь к файлу (может быть пустым) и флаг консоли
    std::unordered_map<logger::severity, std::pair<std::string, bool>> _output_streams;

public:

    server_logger_builder();

public:

    logger_builder& add_file_stream(
        std::string const &stream_file_path,
        logger::severity severity) & override;

    logger_builder& add_console_stream(
        logger::severity severity) & override;

    /**
     * @brief Настраивает логгер по секции JSON-файла
     * @param configuration_file_path Путь к файлу конфигурации
     * @param configuration_path JSON pointer на секцию, пустая строка означает весь файл
     */
    logger_builder& transform_with_configuration(
        std::string const &configuration_file_path,
        std::string const &configuration_path) & override;

    logger_builder& transform_with_configuration(
        nlohmann::json const &section) &;

    logger_builder& set_destination(
        std::string const &destination) & override;

    logger_builder& set_format(
        std::string const &format) & override;

    logger_builder& clear() & override;

    /**
     * @throws std::logic_error если не задан адрес или нет ни одного потока
     */
    [[nodiscard]] logger *build() const override;
};

#endif //BUDDY_SYSTEM_SIMULATOR_SERVER_LOGGER_BUILDER_H
