#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include "../include/logger.h"

namespace {

std::tm current_utc_time()
{
    auto now = std::chrono::system_clock::now();
    auto in_time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &in_time);
#else
    gmtime_r(&in_time, &tm_buf);
#endif
    return tm_buf;
}

std::string format_current_time(char const *pattern)
{
    auto tm_buf = current_utc_time();
    std::stringstream ss;
    ss << std::put_time(&tm_buf, pattern);
    return ss.str();
}

}

logger& logger::trace(std::string const &message) &
{
    return log(message, severity::trace);
}

logger& logger::debug(std::string const &message) &
{
    return log(message, severity::debug);
}

logger& logger::information(std::string const &message) &
{
    return log(message, severity::information);
}

logger& logger::warning(std::string const &message) &
{
    return log(message, severity::warning);
}

logger& logger::error(std::string const &message) &
{
    return log(message, severity::error);
}

logger& logger::critical(std::string const &message) &
{
    return log(message, severity::critical);
}

std::string logger::severity_to_string(logger::severity severity)
{
    switch (severity)
    {
        case severity::trace:
            return "TRACE";
        case severity::debug:
            return "DEBUG";
        case severity::information:
            return "INFO";
        case severity::warning:
            return "WARNING";
        case severity::error:
            return "ERROR";
        case severity::critical:
            return "CRITICAL";
    }

    throw std::out_of_range("Invalid severity value");
}

std::string logger::current_date_to_string()
{
    return format_current_time("%Y-%m-%d");
}

std::string logger::current_time_to_string()
{
    return format_current_time("%H:%M:%S");
}

logger::flag logger::char_to_flag(char c) noexcept
{
    switch (c)
    {
        case 'd':
            return flag::DATE;
        case 't':
            return flag::TIME;
        case 's':
            return flag::SEVERITY;
        case 'm':
            return flag::MESSAGE;
        default:
            return flag::NO_FLAG;
    }
}

std::string logger::format_message(
    std::string const &format,
    std::string const &message,
    logger::severity severity)
{
    std::string result;
    result.reserve(format.size() + message.size());

    for (size_t i = 0; i < format.size(); ++i)
    {
        if (format[i] != '%' || i + 1 >= format.size())
        {
            result += format[i];
            continue;
        }

        switch (char_to_flag(format[++i]))
        {
            case flag::DATE:
                result += current_date_to_string();
                break;
            case flag::TIME:
                result += current_time_to_string();
                break;
            case flag::SEVERITY:
                result += severity_to_string(severity);
                break;
            case flag::MESSAGE:
                result += message;
                break;
            case flag::NO_FLAG:
                result += '%';
                result += format[i];
                break;
        }
    }

    return result;
}
