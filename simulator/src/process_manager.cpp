#include <algorithm>
#include <optional>
#include "../include/process_manager.h"

process_manager::process_manager(
    size_t capacity,
    size_t min_block_size,
    logger *logger)
    : _memory(capacity, min_block_size), _logger(logger)
{
    information_with_guard("Initialized Buddy System with " + std::to_string(_memory.capacity()) + " MB of memory.");
}

process_manager::process_record const &process_manager::add_process(
    std::string const &name,
    size_t size)
{
    // Для нулевого или слишком большого запроса блок не определён, пишется сам запрос
    auto const block_size = size == 0
        ? std::optional<size_t>()
        : allocator_buddies_system::next_power_of_two(std::max(size, _memory.min_block_size()));
    information_with_guard("Attempting to allocate " + std::to_string(size) + " MB (" +
                           std::to_string(block_size.value_or(size)) + " MB block) for process '" + name + "'.");

    auto result = allocate_or_log(name, size);

    // Список процессов и аллокатор меняются вместе, до любых записей в журнал
    _processes.push_back({name, size, result.handle});

    log_splits(result.diff);
    information_with_guard("Allocated " + std::to_string(size) + " MB to process '" + name +
                           "' at address " + std::to_string(result.handle.start) + ".");

    return _processes.back();
}

void process_manager::remove_process(
    std::string const &name)
{
    auto it = std::find_if(_processes.begin(), _processes.end(),
                           [&name](process_record const &record) { return record.name == name; });
    if (it == _processes.end())
    {
        error_with_guard("Deallocate failed: No process named '" + name + "' found.");
        throw unknown_allocation("No process named '" + name + "'");
    }

    auto const handle = it->handle;
    auto diff = _memory.deallocate(handle);
    _processes.erase(it);

    information_with_guard("Deallocated memory of process '" + name + "' at address " +
                           std::to_string(handle.start) + ".");
    log_merges(diff);
}

size_t process_manager::resize_memory(
    size_t capacity)
{
    try
    {
        auto diff = _memory.set_capacity(capacity);
        if (diff.changed())
        {
            information_with_guard("Total memory updated to " + std::to_string(diff.new_capacity) + " MB.");
        }
        else
        {
            debug_with_guard("Total memory is already " + std::to_string(diff.new_capacity) + " MB.");
        }
        return diff.new_capacity;
    }
    catch (buddy_system_error const &e)
    {
        error_with_guard(std::string("Memory update failed: ") + e.what());
        throw;
    }
}

void process_manager::reset_memory()
{
    _memory.reset();
    _processes.clear();
    information_with_guard("All processes removed, " + std::to_string(_memory.capacity()) + " MB of memory is free.");
}

std::vector<process_manager::process_record> const &process_manager::processes() const noexcept
{
    return _processes;
}

process_manager::statistics process_manager::get_statistics() const noexcept
{
    return {_memory.total_allocated(), _memory.total_free(), _memory.internal_fragmentation(), _memory.capacity()};
}

allocator_buddies_system const &process_manager::memory() const noexcept
{
    return _memory;
}

allocator_buddies_system::allocation_result process_manager::allocate_or_log(
    std::string const &name,
    size_t size)
{
    try
    {
        return _memory.allocate(name, size);
    }
    catch (buddy_system_error const &e)
    {
        error_with_guard("Allocation failed for process '" + name + "' with size " + std::to_string(size) +
                         " MB: " + e.what());
        throw;
    }
}

logger *process_manager::get_logger() const
{
    return _logger;
}

void process_manager::log_splits(allocator_buddies_system::partition_diff const &diff) const
{
    if (_logger == nullptr)
    {
        return;
    }

    // Каждое разбиение добавляет свободный правый блок вдвое меньше разбитого
    auto added = diff.added();
    std::sort(added.begin(), added.end(),
              [](auto const &l, auto const &r) { return l.block_size > r.block_size; });

    for (auto const &block : added)
    {
        if (!block.is_block_occupied)
        {
            debug_with_guard("Split block of size " + std::to_string(block.block_size << 1) +
                             " MB into two blocks of size " + std::to_string(block.block_size) + " MB.");
        }
    }
}

void process_manager::log_merges(allocator_buddies_system::partition_diff const &diff) const
{
    if (_logger == nullptr)
    {
        return;
    }

    auto const removed = diff.removed();
    auto const released = std::find_if(removed.begin(), removed.end(),
                                       [](auto const &b) { return b.is_block_occupied; });
    auto const added = diff.added();
    if (released == removed.end() || added.empty())
    {
        return;
    }

    // Слияния идут снизу вверх, от освобождённого блока до итогового
    for (size_t size = released->block_size << 1; size <= added.front().block_size; size <<= 1)
    {
        debug_with_guard("Merged block at address " + std::to_string(released->start & ~(size - 1)) +
                         " into size " + std::to_string(size) + " MB.");
    }
}
