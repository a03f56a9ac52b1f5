#include <filesystem>
#include <fstream>
#include <not_implemented.h>
#include "../include/client_logger_builder.h"

namespace {

constexpr char const *default_format = "%m";

}

client_logger_builder::client_logger_builder()
    : _format(default_format)
{

}

client_logger_builder::client_logger_builder(std::string format)
    : _format(std::move(format))
{

}

logger_builder& client_logger_builder::add_file_stream(
    std::string const &stream_file_path,
    logger::severity severity) &
{
    if (stream_file_path.empty())
    {
        throw std::invalid_argument("File path cannot be empty");
    }

    std::filesystem::path path(stream_file_path);
    if (path.has_parent_path() && !std::filesystem::exists(path.parent_path()))
    {
        std::filesystem::create_directories(path.parent_path());
    }

    auto &streams = _output_streams[severity].first;
    for (auto const &stream : streams)
    {
        if (stream.path() == stream_file_path)
        {
            return *this;
        }
    }

    streams.emplace_front(stream_file_path);
    return *this;
}

logger_builder& client_logger_builder::add_console_stream(
    logger::severity severity) &
{
    _output_streams[severity].second = true;
    return *this;
}

logger_builder& client_logger_builder::transform_with_configuration(
    std::string const &configuration_file_path,
    std::string const &configuration_path) &
{
    std::ifstream file(configuration_file_path);
    if (!file.is_open())
    {
        throw std::runtime_error("Cannot open configuration file: " + configuration_file_path);
    }

    nlohmann::json config;
    try
    {
        file >> config;
    }
    catch (nlohmann::json::parse_error const &e)
    {
        throw std::runtime_error("JSON parse error: " + std::string(e.what()));
    }

    if (configuration_path.empty())
    {
        return transform_with_configuration(config);
    }

    if (!config.contains(configuration_path))
    {
        throw std::runtime_error("Configuration path not found: " + configuration_path);
    }

    return transform_with_configuration(config.at(configuration_path));
}

logger_builder& client_logger_builder::transform_with_configuration(
    nlohmann::json const &section) &
{
    if (!section.is_object())
    {
        throw std::runtime_error("Logger configuration must be an object");
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
        if (!stream.contains("type") || !stream.contains("severities"))
        {
            throw std::runtime_error("Stream must have 'type' and 'severities'");
        }

        std::string const type = stream.at("type").get<std::string>();
        if (type != "console" && type != "file")
        {
            throw std::runtime_error("Unknown stream type: " + type);
        }

        if (type == "file" && !stream.contains("path"))
        {
            throw std::runtime_error("File stream missing 'path'");
        }

        for (auto const &severity_str : stream.at("severities"))
        {
            logger::severity sev;
            try
            {
                sev = string_to_severity(severity_str.get<std::string>());
            }
            catch (std::out_of_range const &e)
            {
                throw std::runtime_error(e.what());
            }

            if (type == "console")
            {
                add_console_stream(sev);
            }
            else
            {
                add_file_stream(stream.at("path").get<std::string>(), sev);
            }
        }
    }

    return *this;
}

logger_builder& client_logger_builder::set_format(
    std::string const &format) &
{
    _format = format;
    return *this;
}

logger_builder& client_logger_builder::set_destination(
    std::string const &destination) &
{
    throw not_implemented("logger_builder& client_logger_builder::set_destination(std::string const &)",
                          "client logger writes only to local streams, got " + destination);
}

logger_builder& client_logger_builder::clear() &
{
    _output_streams.clear();
    _format = default_format;
    return *this;
}

logger *client_logger_builder::build() const
{
    if (_output_streams.empty())
    {
        throw std::logic_error("No output streams configured");
    }

    return new client_logger(_output_streams, _format);
}
