#ifndef BUDDY_SYSTEM_SIMULATOR_LOGGER_GUARDANT_H
#define BUDDY_SYSTEM_SIMULATOR_LOGGER_GUARDANT_H

#include "logger.h"

/**
 * @class logger_guardant
 * @brief Примесь для классов, которые пишут в лог только если логгер им передали
 *
 * Наследник возвращает логгер из get_logger(), все *_with_guard методы
 * молча пропускают сообщение, когда логгера нет.
 */
class logger_guardant
{
public:

    virtual ~logger_guardant() noexcept = default;

public:

    logger_guardant const *log_with_guard(
        std::string const &message,
        logger::severity severity) const;

    logger_guardant const *debug_with_guard(
        std::string const &message) const;

    logger_guardant const *information_with_guard(
        std::string const &message) const;

    logger_guardant const *error_with_guard(
        std::string const &message) const;

protected:

    [[nodiscard]] virtual logger *get_logger() const = 0;

};

#endif //BUDDY_SYSTEM_SIMULATOR_LOGGER_GUARDANT_H
