#include <filesystem>
#include <fstream>
#include "../include/server_logger_builder.h"

namespace {

constexpr char const *default_destination = "http://127.0.0.1:9200";
constexpr char const *default_format = "%d %t %s %m";

}

server_logger_builder::server_logger_builder()
    : _destination(default_destination), _format(default_format)
{

}

logger_builder& server_logger_builder::add_file_stream(
    std::string const &stream_file_path,
    logger::severity severity) &
{
    if (stream_file_path.empty())
    {
        throw std::invalid_argument("File path cannot be empty");
    }

    _output_streams[severity].first = stream_file_path;
    return *this;
}

logger_builder& server_logger_builder::add_console_stream(
    logger::severity severity) &
{
    _output_streams[severity].second = true;
    return *this;
}

logger_builder& server_logger_builder::transform_with_configuration(
    std::string const &configuration_file_path,
    std::string const &configuration_path) &
{
    if (!std::filesystem::exists(configuration_file_path))
    {
        throw std::runtime_error("Configuration file not found: " + configuration_file_path);
    }

    nlohmann::json config;
    try
    {
        std::ifstream file(configuration_file_path);
        file >> config;
    }
    catch (nlohmann::json::parse_error const &ex)
    {
        throw std::runtime_error("Failed to read config file: " + std::string(ex.what()));
    }

    if (configuration_path.empty())
    {
        return transform_with_configuration(config);
    }

    nlohmann::json::json_pointer const pointer(configuration_path);
    if (!config.contains(pointer))
    {
        throw std::runtime_error("Configuration path not found: " + configuration_path);
    }

    return transform_with_configuration(config.at(pointer));
}

logger_builder& server_logger_builder::transform_with_configuration(
    nlohmann::json const &section) &
{
    if (section.contains("destination"))
    {
        set_destination(section.at("destination").get<std::string>());
    }

    if (section.contains("format"))
    {
        set_format(section.at("format").get<std::string>());
    }

    if (!section.contains("streams"))
    {
        return *this;
    }

    auto const &streams = section.at("streams");
    if (!streams.is_array())
    {
        throw std::runtime_error("Streams must be an array");
    }

    for (auto const &stream : streams)
    {
        for (auto const *field : {"type", "severities"})
        {
            if (!stream.contains(field))
            {
                throw std::runtime_error("Missing field in stream: " + std::string(field));
            }
        }

        std::string const type = stream.at("type").get<std::string>();
        if (type != "file" && type != "console")
        {
            throw std::runtime_error("Invalid stream type: " + type);
        }

        if (type == "file" && !stream.contains("path"))
        {
            throw std::runtime_error("File stream missing 'path'");
        }

        for (auto const &sev_str : stream.at("severities"))
        {
            logger::severity sev;
            try
            {
                sev = string_to_severity(sev_str.get<std::string>());
            }
            catch (std::out_of_range const &e)
            {
                throw std::runtime_error(e.what());
            }

            if (type == "file")
            {
                add_file_stream(stream.at("path").get<std::string>(), sev);
            }
            else
            {
                add_console_stream(sev);
            }
        }
    }

    return *this;
}

logger_builder& server_logger_builder::set_destination(
    std::string const &destination) &
{
    _destination = destination;
    return *this;
}

logger_builder& server_logger_builder::set_format(
    std::string const &format) &
{
    _format = format;
    return *this;
}

logger_builder& server_logger_builder::clear() &
{
    _destination = default_destination;
    _format = default_format;
    _output_streams.clear();
    return *this;
}

logger *server_logger_builder::build() const
{
    if (_destination.empty())
    {
        throw std::logic_error("Destination address is not set");
    }

    if (_output_streams.empty())
    {
        throw std::logic_error("No output streams configured");
    }

    return new server_logger(_destination, _format, _output_streams);
}
