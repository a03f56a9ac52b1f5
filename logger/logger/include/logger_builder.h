#ifndef BUDDY_SYSTEM_SIMULATOR_LOGGER_BUILDER_H
#define BUDDY_SYSTEM_SIMULATOR_LOGGER_BUILDER_H

#include <string>
#include "logger.h"

class logger_builder
{
public:

    virtual ~logger_builder() noexcept = default;

public:

    virtual logger_builder& add_file_stream(
        std::string const &stream_file_path,
        logger::severity severity) & = 0;

    virtual logger_builder& add_console_stream(
        logger::severity severity) & = 0;

    /**
     * @brief Дополняет настройки строителя секцией JSON-файла
     * @param configuration_file_path Путь к файлу конфигурации
     * @param configuration_path Ключ (или JSON pointer) секции внутри файла
     */
    virtual logger_builder& transform_with_configuration(
        std::string const &configuration_file_path,
        std::string const &configuration_path) & = 0;

    virtual logger_builder& set_format(
        std::string const &format) & = 0;

    virtual logger_builder& set_destination(
        std::string const &destination) & = 0;

    virtual logger_builder& clear() & = 0;

    [[nodiscard]] virtual logger *build() const = 0;

public:

    // Принимает как "information", так и "INFO"
    static logger::severity string_to_severity(std::string const &severity_str);

};

#endif //BUDDY_SYSTEM_SIMULATOR_LOGGER_BUILDER_H
