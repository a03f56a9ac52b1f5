#ifndef BUDDY_SYSTEM_SIMULATOR_BUDDY_SYSTEM_ERROR_H
#define BUDDY_SYSTEM_SIMULATOR_BUDDY_SYSTEM_ERROR_H

#include <stdexcept>
#include <string>

/**
 * @class buddy_system_error
 * @brief Базовое исключение системы двойников
 *
 * Все ошибки восстановимы: после исключения разбиение остаётся таким же,
 * каким было до вызова.
 */
class buddy_system_error:
    public std::runtime_error
{
public:

    enum class error_kind
    {
        invalid_request,
        out_of_memory,
        unknown_allocation,
        capacity_change_denied
    };

private:

    error_kind _kind;

protected:

    buddy_system_error(
        error_kind kind,
        std::string const &message);

public:

    [[nodiscard]] error_kind kind() const noexcept;

    static std::string kind_to_string(error_kind kind);

};

// Нулевой или некорректный размер, пустой или повторный владелец
class invalid_request final:
    public buddy_system_error
{
public:

    explicit invalid_request(std::string const &message);
};

// Нет свободного блока подходящего размера
class out_of_memory final:
    public buddy_system_error
{
public:

    explicit out_of_memory(std::string const &message);
};

// Освобождение или поиск блока, который сейчас не занят
class unknown_allocation final:
    public buddy_system_error
{
public:

    explicit unknown_allocation(std::string const &message);
};

// Уменьшение пространства, пока в нём есть занятые блоки
class capacity_change_denied final:
    public buddy_system_error
{
public:

    explicit capacity_change_denied(std::string const &message);
};

#endif //BUDDY_SYSTEM_SIMULATOR_BUDDY_SYSTEM_ERROR_H
