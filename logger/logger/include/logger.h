#ifndef BUDDY_SYSTEM_SIMULATOR_LOGGER_H
#define BUDDY_SYSTEM_SIMULATOR_LOGGER_H

#include <iostream>
#include <string>

class logger
{
public:

    /**
     * @brief Уровни важности сообщений, от самого подробного к самому критичному
     */
    enum class severity
    {
        trace,
        debug,
        information,
        warning,
        error,
        critical
    };

public:

    virtual ~logger() noexcept = default;

public:

    [[nodiscard]] virtual logger& log(
        const std::string &message,
        logger::severity severity) & = 0;

public:

    logger& trace(std::string const &message) &;

    logger& debug(std::string const &message) &;

    logger& information(std::string const &message) &;

    logger& warning(std::string const &message) &;

    logger& error(std::string const &message) &;

    logger& critical(std::string const &message) &;

protected:

    // Имена уровней в верхнем регистре, в таком виде они уходят в формат и на сервер
    static std::string severity_to_string(logger::severity severity);

    // Дата и время в UTC
    static std::string current_date_to_string();

    static std::string current_time_to_string();

    /**
     * @brief Подставляет в формат дату (%d), время (%t), уровень (%s) и сообщение (%m)
     *
     * Прочие последовательности вида %x переносятся в результат без изменений.
     */
    static std::string format_message(
        std::string const &format,
        std::string const &message,
        logger::severity severity);

private:

    enum class flag
    {
        DATE,
        TIME,
        SEVERITY,
        MESSAGE,
        NO_FLAG
    };

    static flag char_to_flag(char c) noexcept;

};

#endif //BUDDY_SYSTEM_SIMULATOR_LOGGER_H
