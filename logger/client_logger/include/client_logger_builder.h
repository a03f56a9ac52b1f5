#ifndef BUDDY_SYSTEM_SIMULATOR_CLIENT_LOGGER_BUILDER_H
#define BUDDY_SYSTEM_SIMULATOR_CLIENT_LOGGER_BUILDER_H

#include <logger_builder.h>
#include <nlohmann/json.hpp>
#include "client_logger.h"

/**
 * @class client_logger_builder
 * @brief Строитель client_logger: консоль и файлы, формат строки через %d %t %s %m
 */
class client_logger_builder final:
    public logger_builder
{
private:

    client_logger::streams_map _output_streams;

    std::string _format;

public:

    client_logger_builder();

    explicit client_logger_builder(std::string format);

public:

    logger_builder& add_file_stream(
        std::string const &stream_file_path,
        logger::severity severity) & override;

    logger_builder& add_console_stream(
        logger::severity severity) & override;

    /**
     * @brief Читает секцию вида {"format": ..., "streams": [...]}
     * @throws std::runtime_error если файл или секция не найдены либо поток описан неверно
     */
    logger_builder& transform_with_configuration(
        std::string const &configuration_file_path,
        std::string const &configuration_path) & override;

    // Применяет уже разобранную секцию конфигурации
    logger_builder& transform_with_configuration(
        nlohmann::json const &section) &;

    logger_builder& set_format(
        std::string const &format) & override;

    // Локальному логгеру адрес не нужен, бросает not_implemented
    logger_builder& set_destination(
        std::string const &destination) & override;

    logger_builder& clear() & override;

    [[nodiscard]] logger *build() const override;

};

#endif //BUDDY_SYSTEM_SIMULATOR_CLIENT_LOGGER_BUILDER_H
