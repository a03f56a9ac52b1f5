#include <stdexcept>
#include <utility>
#include "../include/client_logger.h"

std::unordered_map<std::string, std::pair<size_t, std::ofstream>> client_logger::refcounted_stream::_global_streams;


client_logger::refcounted_stream::refcounted_stream(std::string const &path)
    : _path(path), _stream(nullptr)
{
    if (_path.empty())
    {
        return;
    }

    if (auto it = _global_streams.find(_path); it == _global_streams.end())
    {
        _global_streams.emplace(_path, std::make_pair(size_t{1}, std::ofstream()));
    }
    else
    {
        ++it->second.first;
    }
}


client_logger::refcounted_stream::refcounted_stream(refcounted_stream const &oth)
    : _path(oth._path), _stream(oth._stream)
{
    if (!_path.empty())
    {
        ++_global_streams[_path].first;
    }
}


client_logger::refcounted_stream &client_logger::refcounted_stream::operator=(refcounted_stream const &oth)
{
    if (this != &oth)
    {
        release();
        _path = oth._path;
        _stream = oth._stream;
        if (!_path.empty())
        {
            ++_global_streams[_path].first;
        }
    }
    return *this;
}


client_logger::refcounted_stream::refcounted_stream(refcounted_stream &&oth) noexcept
    : _path(std::move(oth._path)), _stream(oth._stream)
{
    oth._path.clear();
    oth._stream = nullptr;
}


client_logger::refcounted_stream &client_logger::refcounted_stream::operator=(refcounted_stream &&oth) noexcept
{
    if (this != &oth)
    {
        release();
        _path = std::move(oth._path);
        _stream = oth._stream;
        oth._path.clear();
        oth._stream = nullptr;
    }
    return *this;
}


client_logger::refcounted_stream::~refcounted_stream()
{
    release();
}


void client_logger::refcounted_stream::release() noexcept
{
    if (_path.empty())
    {
        return;
    }

    if (auto it = _global_streams.find(_path); it != _global_streams.end())
    {
        if (--it->second.first == 0)
        {
            if (it->second.second.is_open())
            {
                it->second.second.close();
            }
            _global_streams.erase(it);
        }
    }

    _path.clear();
    _stream = nullptr;
}


void client_logger::refcounted_stream::open()
{
    if (_path.empty() || _stream != nullptr)
    {
        return;
    }

    auto it = _global_streams.find(_path);
    if (it == _global_streams.end())
    {
        it = _global_streams.emplace(_path, std::make_pair(size_t{1}, std::ofstream())).first;
    }

    if (!it->second.second.is_open())
    {
        it->second.second.open(_path, std::ios::out | std::ios::app);
        if (!it->second.second.is_open())
        {
            throw std::runtime_error("Failed to open file stream: " + _path);
        }
    }

    _stream = &it->second.second;
}


void client_logger::refcounted_stream::write(std::string const &line) const
{
    if (_stream != nullptr)
    {
        (*_stream) << line << std::endl;
    }
}


std::string const &client_logger::refcounted_stream::path() const noexcept
{
    return _path;
}


client_logger::client_logger(
    streams_map const &streams,
    std::string format)
    : _output_streams(streams), _format(std::move(format))
{
    for (auto &[sev, entry] : _output_streams)
    {
        for (auto &stream : entry.first)
        {
            stream.open();
        }
    }
}


logger &client_logger::log(
    const std::string &text,
    logger::severity severity) &
{
    auto it = _output_streams.find(severity);
    if (it == _output_streams.end())
    {
        return *this;
    }

    std::string const formatted = format_message(_format, text, severity);
    for (auto const &stream : it->second.first)
    {
        stream.write(formatted);
    }

    if (it->second.second)
    {
        std::cout << formatted << std::endl;
    }

    return *this;
}


client_logger::client_logger(client_logger const &other)
    : _output_streams(other._output_streams), _format(other._format)
{

}


client_logger &client_logger::operator=(client_logger const &other)
{
    if (this != &other)
    {
        _output_streams = other._output_streams;
        _format = other._format;
    }
    return *this;
}


client_logger::client_logger(client_logger &&other) noexcept
    : _output_streams(std::move(other._output_streams)), _format(std::move(other._format))
{
    other._output_streams.clear();
    other._format = "%m";
}


client_logger &client_logger::operator=(client_logger &&other) noexcept
{
    if (this != &other)
    {
        _output_streams = std::move(other._output_streams);
        _format = std::move(other._format);
        other._output_streams.clear();
        other._format = "%m";
    }
    return *this;
}


client_logger::~client_logger() noexcept = default;
