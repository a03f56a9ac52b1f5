#include "../include/logger_guardant.h"

logger_guardant const *logger_guardant::log_with_guard(
    std::string const &message,
    logger::severity severity) const
{
    logger *got_logger = get_logger();
    if (got_logger != nullptr)
    {
        [[maybe_unused]] auto &chained = got_logger->log(message, severity);
    }

    return this;
}

logger_guardant const *logger_guardant::debug_with_guard(
    std::string const &message) const
{
    return log_with_guard(message, logger::severity::debug);
}

logger_guardant const *logger_guardant::information_with_guard(
    std::string const &message) const
{
    return log_with_guard(message, logger::severity::information);
}

logger_guardant const *logger_guardant::error_with_guard(
    std::string const &message) const
{
    return log_with_guard(message, logger::severity::error);
}
