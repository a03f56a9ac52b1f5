#include <fstream>
#include <nlohmann/json.hpp>
#include "../include/server_logger.h"

#ifdef _WIN32
#include <process.h>
#else
#include <unistd.h>
#endif

namespace {

constexpr time_t connection_timeout_seconds = 2;
constexpr time_t read_timeout_seconds = 5;

}

server_logger::server_logger(
    std::string const &dest,
    std::string const &format,
    std::unordered_map<logger::severity, std::pair<std::string, bool>> const &streams)
    : _client(dest),
      _destination(dest),
      _format(format),
      _streams(streams)
{
    configure_client();
}

server_logger::~server_logger() noexcept = default;

void server_logger::configure_client()
{
    _client.set_connection_timeout(connection_timeout_seconds);
    _client.set_read_timeout(read_timeout_seconds);
}

int server_logger::inner_getpid()
{
#ifdef _WIN32
    return ::_getpid();
#else
    return ::getpid();
#endif
}

logger& server_logger::log(
    const std::string &text,
    logger::severity severity) &
{
    std::string const formatted = format_message(_format, text, severity);

    nlohmann::json payload = {
        {"pid", inner_getpid()},
        {"severity", severity_to_string(severity)},
        {"message", formatted},
        {"streams", nlohmann::json::array()}
    };

    if (auto it = _streams.find(severity); it != _streams.end())
    {
        auto const &[path, is_console] = it->second;

        if (is_console)
        {
            payload["streams"].push_back({{"type", "console"}});
            std::cout << formatted << std::endl;
        }

        if (!path.empty())
        {
            payload["streams"].push_back({{"type", "file"}, {"path", path}});

            std::ofstream file(path, std::ios::app);
            if (file.is_open())
            {
                file << formatted << std::endl;
            }
            else
            {
                std::cerr << "Failed to open log file: " << path << std::endl;
            }
        }
    }

    if (auto res = _client.Post("/log", payload.dump(), "application/json"); !res)
    {
        std::cerr << "Log collector " << _destination << " is unreachable: "
                  << httplib::to_string(res.error()) << std::endl;
    }

    return *this;
}

std::string const &server_logger::destination() const noexcept
{
    return _destination;
}

server_logger::server_logger(server_logger const &other)
    : _client(other._destination),
      _destination(other._destination),
      _format(other._format),
      _streams(other._streams)
{
    configure_client();
}

server_logger &server_logger::operator=(server_logger const &other)
{
    if (this != &other)
    {
        _destination = other._destination;
        _client = httplib::Client(_destination);
        configure_client();
        _format = other._format;
        _streams = other._streams;
    }
    return *this;
}

server_logger::server_logger(server_logger &&other) noexcept
    : _client(std::move(other._client)),
      _destination(std::move(other._destination)),
      _format(std::move(other._format)),
      _streams(std::move(other._streams))
{

}

server_logger &server_logger::operator=(server_logger &&other) noexcept
{
    if (this != &other)
    {
        _client = std::move(other._client);
        _destination = std::move(other._destination);
        _format = std::move(other._format);
        _streams = std::move(other._streams);
    }
    return *this;
}
