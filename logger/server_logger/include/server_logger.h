#ifndef BUDDY_SYSTEM_SIMULATOR_SERVER_LOGGER_H
#define BUDDY_SYSTEM_SIMULATOR_SERVER_LOGGER_H

#define CPPHTTPLIB_NO_COMPRESSION
#include <logger.h>
#include <httplib.h>
#include <string>
#include <unordered_map>
#include <utility>

class server_logger_builder;

/**
 * @class server_logger
 * @brief Логгер, отправляющий каждую запись JSON-ом на коллектор по HTTP
 *
 * Запись дублируется в локальные потоки (консоль и файл), если они заданы
 * для её уровня. Недоступный коллектор не считается ошибкой логирования.
 */
class server_logger final:
    public logger
{
private:

    httplib::Client _client;
    std::string _destination;
    std::string _format;
    std::unordered_map<logger::severity, std::pair<std::string, bool>> _streams;

    server_logger(std::string const &dest, std::string const &format,
                  std::unordered_map<logger::severity, std::pair<std::string, bool>> const &streams);

    friend server_logger_builder;

    static int inner_getpid();


    void configure_client();

public:

    ~server_logger() noexcept final;

    server_logger(server_logger const &other);

    server_logger &operator=(server_logger const &other);

    server_logger(server_logger &&other) noexcept;

    server_logger &operator=(server_logger &&other) noexcept;

    [[nodiscard]] logger& log(
        const std::string &message,
        logger::severity severity) & override;

    [[nodiscard]] std::string const &destination() const noexcept;
};

#endif //BUDDY_SYSTEM_SIMULATOR_SERVER_LOGGER_H
