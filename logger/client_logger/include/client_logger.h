#ifndef BUDDY_SYSTEM_SIMULATOR_CLIENT_LOGGER_H
#define BUDDY_SYSTEM_SIMULATOR_CLIENT_LOGGER_H

#include <logger.h>
#include <forward_list>
#include <fstream>
#include <string>
#include <unordered_map>
#include <utility>

class client_logger_builder;

class client_logger final:
    public logger
{
private:

    /**
     * @brief Файловый поток, разделяемый всеми логгерами процесса по пути к файлу
     *
     * Пустой путь означает консоль. Файл закрывается, когда исчезает
     * последний refcounted_stream с этим путём.
     */
    class refcounted_stream final
    {
    private:

        static std::unordered_map<std::string, std::pair<size_t, std::ofstream>> _global_streams;

        std::string _path;
        std::ofstream *_stream;

    public:

        explicit refcounted_stream(std::string const &path);

        refcounted_stream(refcounted_stream const &oth);

        refcounted_stream &operator=(refcounted_stream const &oth);

        refcounted_stream(refcounted_stream &&oth) noexcept;

        refcounted_stream &operator=(refcounted_stream &&oth) noexcept;

        ~refcounted_stream();

    public:

        // Бросает std::runtime_error, если файл не удалось открыть
        void open();

        void write(std::string const &line) const;

        [[nodiscard]] std::string const &path() const noexcept;

    private:

        void release() noexcept;

    };

    using streams_map = std::unordered_map<logger::severity, std::pair<std::forward_list<refcounted_stream>, bool>>;

    friend client_logger_builder;

    streams_map _output_streams;

    std::string _format;

    client_logger(
        streams_map const &streams,
        std::string format);

public:

    client_logger(client_logger const &other);

    client_logger &operator=(client_logger const &other);

    client_logger(client_logger &&other) noexcept;

    client_logger &operator=(client_logger &&other) noexcept;

    ~client_logger() noexcept final;

public:

    [[nodiscard]] logger &log(
        const std::string &message,
        logger::severity severity) & override;

};

#endif //BUDDY_SYSTEM_SIMULATOR_CLIENT_LOGGER_H
