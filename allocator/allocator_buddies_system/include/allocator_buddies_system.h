#ifndef BUDDY_SYSTEM_SIMULATOR_ALLOCATOR_BUDDIES_SYSTEM_H
#define BUDDY_SYSTEM_SIMULATOR_ALLOCATOR_BUDDIES_SYSTEM_H

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "buddy_system_error.h"

namespace allocator_test_utils
{

    struct block_info
    {
        size_t start;
        size_t block_size;
        bool is_block_occupied;
        std::string owner;
        size_t requested_size;

        bool operator==(block_info const &other) const noexcept;
        bool operator!=(block_info const &other) const noexcept;
    };

}

/**
 * @class allocator_buddies_system
 * @brief Учёт блоков системы двойников на адресном пространстве [0, capacity)
 *
 * Реальной памяти здесь нет: аллокатор хранит только разбиение пространства
 * на блоки размером в степень двойки. Блоки лежат в плоской таблице по
 * начальному смещению, двойник и родитель вычисляются арифметикой
 * (двойник блока размера s по адресу a находится по адресу a ^ s).
 *
 * Любая операция либо полностью выполняется, либо бросает исключение из
 * семейства buddy_system_error и оставляет разбиение нетронутым.
 * Внутренней синхронизации нет, вызывающий сериализует обращения сам.
 */
class allocator_buddies_system final
{
public:

    using owner_id = std::string;

    struct block_handle
    {
        size_t start;
        size_t size;

        bool operator==(block_handle const &other) const noexcept;
        bool operator!=(block_handle const &other) const noexcept;
    };

    /**
     * @brief Снимок разбиения до и после изменяющей операции
     *
     * По нему внешний слой рисует разницу и пишет строку в журнал.
     */
    struct partition_diff
    {
        size_t old_capacity;
        size_t new_capacity;
        std::vector<allocator_test_utils::block_info> before;
        std::vector<allocator_test_utils::block_info> after;

        // Блоки, исчезнувшие из разбиения (разделённые, слитые или отброшенные)
        [[nodiscard]] std::vector<allocator_test_utils::block_info> removed() const;

        // Блоки, появившиеся в разбиении
        [[nodiscard]] std::vector<allocator_test_utils::block_info> added() const;

        [[nodiscard]] bool changed() const noexcept;
    };

    struct allocation_result
    {
        block_handle handle;
        partition_diff diff;
    };

private:

    struct block
    {
        size_t size;
        bool occupied;
        owner_id owner;
        size_t requested_size;
    };

    size_t _capacity;
    size_t _min_block_size;

    // Ключ - начальное смещение блока, обход идёт по возрастанию адресов
    std::map<size_t, block> _blocks;

public:

    /**
     * @param capacity Размер пространства, округляется вверх до степени двойки
     * @param min_block_size Минимальный размер блока, степень двойки
     * @throws invalid_request если capacity == 0 или min_block_size не степень двойки
     */
    explicit allocator_buddies_system(
        size_t capacity,
        size_t min_block_size = 1);

public:

    /**
     * @brief Меняет размер управляемого пространства
     *
     * Значение округляется вверх до степени двойки, но не меньше min_block_size.
     * Без занятых блоков разбиение заменяется одним свободным блоком.
     * При занятых блоках рост сохраняет их и достраивает свободные блоки
     * справа, а уменьшение отклоняется.
     *
     * @throws invalid_request при нулевом или слишком большом значении
     * @throws capacity_change_denied при уменьшении с занятыми блоками
     */
    partition_diff set_capacity(size_t new_capacity);

    /**
     * @brief Выделяет наименьший подходящий блок, при равенстве размеров - с младшим адресом
     *
     * @throws invalid_request при нулевом размере, пустом или уже занятом владельце
     * @throws out_of_memory если ни один свободный блок не вмещает запрос
     */
    allocation_result allocate(
        owner_id const &owner,
        size_t requested_size);

    /**
     * @brief Освобождает блок и сливает его с двойниками, пока это возможно
     * @throws unknown_allocation если по handle нет занятого блока того же размера
     */
    partition_diff deallocate(block_handle const &handle);

    // @throws unknown_allocation если владелец не занимает ни одного блока
    partition_diff deallocate(owner_id const &owner);

    // Освобождает все блоки разом, размер пространства не меняется
    partition_diff reset();

public:

    [[nodiscard]] std::vector<allocator_test_utils::block_info> get_blocks_info() const;

    [[nodiscard]] std::optional<allocator_test_utils::block_info> find_by_owner(owner_id const &owner) const;

    // Сумма запрошенных размеров по занятым блокам
    [[nodiscard]] size_t total_allocated() const noexcept;

    [[nodiscard]] size_t total_free() const noexcept;

    [[nodiscard]] size_t internal_fragmentation() const noexcept;

    [[nodiscard]] size_t largest_free_block() const noexcept;

    [[nodiscard]] size_t free_block_count() const noexcept;

    [[nodiscard]] size_t allocated_block_count() const noexcept;

    [[nodiscard]] size_t capacity() const noexcept;

    [[nodiscard]] size_t min_block_size() const noexcept;

    // log2(capacity / block_size)
    [[nodiscard]] size_t depth_of(size_t block_size) const;

public:

    [[nodiscard]] static bool is_power_of_two(size_t value) noexcept;

    // Наименьшая степень двойки >= value, std::nullopt при переполнении
    [[nodiscard]] static std::optional<size_t> next_power_of_two(size_t value) noexcept;

private:

    [[nodiscard]] size_t normalize_capacity(size_t requested_capacity) const;

    [[nodiscard]] std::map<size_t, block>::const_iterator find_owner_block(owner_id const &owner) const;

    [[nodiscard]] std::map<size_t, block>::iterator find_best_fit(size_t needed_size);

    partition_diff release(std::map<size_t, block>::iterator target);

    void coalesce(std::map<size_t, block>::iterator freed);

    static allocator_test_utils::block_info to_block_info(size_t start, block const &b);

};

#endif //BUDDY_SYSTEM_SIMULATOR_ALLOCATOR_BUDDIES_SYSTEM_H
