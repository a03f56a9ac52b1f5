#ifndef BUDDY_SYSTEM_SIMULATOR_PROCESS_MANAGER_H
#define BUDDY_SYSTEM_SIMULATOR_PROCESS_MANAGER_H

#include <allocator_buddies_system.h>
#include <logger.h>
#include <logger_guardant.h>
#include <string>
#include <vector>

/**
 * @class process_manager
 * @brief Связывает процессы пользователя с блоками системы двойников
 *
 * Хранит записи о процессах (имя и запрошенный размер), передаёт команды
 * аллокатору и по возвращённым снимкам разбиения пишет журнал действий:
 * попытки выделения, разбиения, слияния, изменение объёма памяти.
 * Логгер не принадлежит менеджеру и может отсутствовать.
 */
class process_manager final:
    private logger_guardant
{
public:

    struct process_record
    {
        std::string name;
        size_t requested_size;
        allocator_buddies_system::block_handle handle;
    };

    struct statistics
    {
        size_t allocated;
        size_t free;
        size_t internal_fragmentation;
        size_t capacity;
    };

private:

    allocator_buddies_system _memory;

    // В порядке добавления, как в списке активных процессов
    std::vector<process_record> _processes;

    logger *_logger;

public:

    explicit process_manager(
        size_t capacity,
        size_t min_block_size = 1,
        logger *logger = nullptr);

public:

    /**
     * @brief Выделяет процессу блок и запоминает его
     * @throws buddy_system_error (после записи в журнал) если выделить не удалось
     */
    process_record const &add_process(
        std::string const &name,
        size_t size);

    // @throws unknown_allocation если процесса с таким именем нет
    void remove_process(
        std::string const &name);

    /**
     * @brief Меняет общий объём памяти
     * @return Фактический объём после округления до степени двойки
     */
    size_t resize_memory(
        size_t capacity);

    // Удаляет все процессы, объём памяти сохраняется
    void reset_memory();

public:

    [[nodiscard]] std::vector<process_record> const &processes() const noexcept;

    [[nodiscard]] statistics get_statistics() const noexcept;

    [[nodiscard]] allocator_buddies_system const &memory() const noexcept;

private:

    [[nodiscard]] logger *get_logger() const override;

    // Ошибку ядра пишет в журнал и пробрасывает дальше
    allocator_buddies_system::allocation_result allocate_or_log(
        std::string const &name,
        size_t size);

    void log_splits(allocator_buddies_system::partition_diff const &diff) const;

    void log_merges(allocator_buddies_system::partition_diff const &diff) const;

};

#endif //BUDDY_SYSTEM_SIMULATOR_PROCESS_MANAGER_H
