#include <client_logger_builder.h>
#include <fstream>
#include <server_logger_builder.h>
#include "../include/simulator_config.h"

simulator_config::simulator_config()
    : logger_section(default_logger_section())
{

}

nlohmann::json simulator_config::default_logger_section()
{
    return {
        {"type", "client"},
        {"format", "%d %t - %s - %m"},
        {"streams", nlohmann::json::array({
            {
                {"type", "console"},
                {"severities", {"information", "warning", "error", "critical"}}
            }
        })}
    };
}

simulator_config simulator_config::load(std::string const &configuration_file_path)
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
        throw std::runtime_error("JSON parse error in " + configuration_file_path + ": " + e.what());
    }

    return from_json(config);
}

simulator_config simulator_config::from_json(nlohmann::json const &config)
{
    simulator_config result;

    if (!config.is_object())
    {
        throw std::runtime_error("Configuration root must be an object");
    }

    try
    {
        if (config.contains("memory"))
        {
            auto const &memory = config.at("memory");
            result.capacity = memory.value("capacity", result.capacity);
            result.min_block_size = memory.value("min_block_size", result.min_block_size);
        }
    }
    catch (nlohmann::json::type_error const &e)
    {
        throw std::runtime_error(std::string("Invalid memory section: ") + e.what());
    }

    if (config.contains("logger"))
    {
        result.logger_section = config.at("logger");
    }

    return result;
}

std::unique_ptr<logger> make_logger(nlohmann::json const &logger_section)
{
    std::string const type = logger_section.value("type", std::string("client"));

    if (type == "client")
    {
        client_logger_builder builder;
        builder.transform_with_configuration(logger_section);
        return std::unique_ptr<logger>(builder.build());
    }

    if (type == "server")
    {
        server_logger_builder builder;
        builder.transform_with_configuration(logger_section);
        return std::unique_ptr<logger>(builder.build());
    }

    throw std::runtime_error("Unknown logger type: " + type);
}
