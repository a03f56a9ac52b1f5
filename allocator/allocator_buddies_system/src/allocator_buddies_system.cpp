#include <algorithm>
#include <iterator>
#include <limits>
#include <string>
#include "../include/allocator_buddies_system.h"

namespace {

constexpr size_t largest_power_of_two = size_t{1} << (std::numeric_limits<size_t>::digits - 1);

}


bool allocator_test_utils::block_info::operator==(block_info const &other) const noexcept
{
    return start == other.start
        && block_size == other.block_size
        && is_block_occupied == other.is_block_occupied
        && owner == other.owner
        && requested_size == other.requested_size;
}

bool allocator_test_utils::block_info::operator!=(block_info const &other) const noexcept
{
    return !(*this == other);
}

bool allocator_buddies_system::block_handle::operator==(block_handle const &other) const noexcept
{
    return start == other.start && size == other.size;
}

bool allocator_buddies_system::block_handle::operator!=(block_handle const &other) const noexcept
{
    return !(*this == other);
}


std::vector<allocator_test_utils::block_info> allocator_buddies_system::partition_diff::removed() const
{
    std::vector<allocator_test_utils::block_info> result;
    std::copy_if(before.begin(), before.end(), std::back_inserter(result),
                 [this](auto const &b) { return std::find(after.begin(), after.end(), b) == after.end(); });
    return result;
}

std::vector<allocator_test_utils::block_info> allocator_buddies_system::partition_diff::added() const
{
    std::vector<allocator_test_utils::block_info> result;
    std::copy_if(after.begin(), after.end(), std::back_inserter(result),
                 [this](auto const &b) { return std::find(before.begin(), before.end(), b) == before.end(); });
    return result;
}

bool allocator_buddies_system::partition_diff::changed() const noexcept
{
    return old_capacity != new_capacity || before != after;
}


allocator_buddies_system::allocator_buddies_system(
    size_t capacity,
    size_t min_block_size)
    : _capacity(0), _min_block_size(min_block_size)
{
    if (!is_power_of_two(min_block_size))
    {
        throw invalid_request("Minimal block size must be a power of two, got " + std::to_string(min_block_size));
    }

    _capacity = normalize_capacity(capacity);
    _blocks.emplace(0, block{_capacity, false, {}, 0});
}


allocator_buddies_system::partition_diff allocator_buddies_system::set_capacity(size_t new_capacity)
{
    size_t const target = normalize_capacity(new_capacity);

    partition_diff diff{_capacity, target, get_blocks_info(), {}};
    if (target == _capacity)
    {
        diff.after = diff.before;
        return diff;
    }

    if (allocated_block_count() == 0)
    {
        _blocks.clear();
        _blocks.emplace(0, block{target, false, {}, 0});
    }
    else if (target < _capacity)
    {
        throw capacity_change_denied("Cannot shrink memory from " + std::to_string(_capacity) + " to " +
                                     std::to_string(target) + " while " +
                                     std::to_string(allocated_block_count()) + " block(s) are allocated");
    }
    else
    {
        // Старый корень становится левым потомком, справа достраиваются свободные двойники
        for (size_t size = _capacity; size < target; size <<= 1)
        {
            _blocks.emplace(size, block{size, false, {}, 0});
        }
    }

    _capacity = target;
    diff.after = get_blocks_info();
    return diff;
}


allocator_buddies_system::allocation_result allocator_buddies_system::allocate(
    owner_id const &owner,
    size_t requested_size)
{
    if (requested_size == 0)
    {
        throw invalid_request("Requested size must be positive");
    }

    if (owner.empty())
    {
        throw invalid_request("Owner identifier must not be empty");
    }

    if (find_owner_block(owner) != _blocks.cend())
    {
        throw invalid_request("Owner '" + owner + "' already holds a block");
    }

    if (requested_size > _capacity)
    {
        throw out_of_memory("Requested size " + std::to_string(requested_size) +
                            " exceeds capacity " + std::to_string(_capacity));
    }

    // requested_size <= _capacity, поэтому округление не переполняется
    size_t const needed_size = next_power_of_two(std::max(requested_size, _min_block_size)).value();

    auto target = find_best_fit(needed_size);
    if (target == _blocks.end())
    {
        throw out_of_memory("No free block of size " + std::to_string(needed_size) +
                            " for request of " + std::to_string(requested_size));
    }

    partition_diff diff{_capacity, _capacity, get_blocks_info(), {}};

    while (target->second.size > needed_size)
    {
        size_t const half = target->second.size >> 1;
        target->second.size = half;
        _blocks.emplace(target->first + half, block{half, false, {}, 0});
    }

    target->second.occupied = true;
    target->second.owner = owner;
    target->second.requested_size = requested_size;

    diff.after = get_blocks_info();
    return {{target->first, needed_size}, std::move(diff)};
}


allocator_buddies_system::partition_diff allocator_buddies_system::deallocate(block_handle const &handle)
{
    auto target = _blocks.find(handle.start);
    if (target == _blocks.end() || !target->second.occupied || target->second.size != handle.size)
    {
        throw unknown_allocation("No allocated block of size " + std::to_string(handle.size) +
                                 " at address " + std::to_string(handle.start));
    }

    return release(target);
}


allocator_buddies_system::partition_diff allocator_buddies_system::deallocate(owner_id const &owner)
{
    auto found = find_owner_block(owner);
    if (found == _blocks.cend())
    {
        throw unknown_allocation("No block is allocated for owner '" + owner + "'");
    }

    return release(_blocks.find(found->first));
}


allocator_buddies_system::partition_diff allocator_buddies_system::reset()
{
    partition_diff diff{_capacity, _capacity, get_blocks_info(), {}};

    _blocks.clear();
    _blocks.emplace(0, block{_capacity, false, {}, 0});

    diff.after = get_blocks_info();
    return diff;
}


std::vector<allocator_test_utils::block_info> allocator_buddies_system::get_blocks_info() const
{
    std::vector<allocator_test_utils::block_info> blocks;
    blocks.reserve(_blocks.size());

    for (auto const &[start, b] : _blocks)
    {
        blocks.push_back(to_block_info(start, b));
    }

    return blocks;
}


std::optional<allocator_test_utils::block_info> allocator_buddies_system::find_by_owner(owner_id const &owner) const
{
    auto found = find_owner_block(owner);
    if (found == _blocks.cend())
    {
        return std::nullopt;
    }

    return to_block_info(found->first, found->second);
}


size_t allocator_buddies_system::total_allocated() const noexcept
{
    size_t total = 0;
    for (auto const &[start, b] : _blocks)
    {
        if (b.occupied)
        {
            total += b.requested_size;
        }
    }
    return total;
}


size_t allocator_buddies_system::total_free() const noexcept
{
    size_t total = 0;
    for (auto const &[start, b] : _blocks)
    {
        if (!b.occupied)
        {
            total += b.size;
        }
    }
    return total;
}


size_t allocator_buddies_system::internal_fragmentation() const noexcept
{
    size_t total = 0;
    for (auto const &[start, b] : _blocks)
    {
        if (b.occupied)
        {
            total += b.size - b.requested_size;
        }
    }
    return total;
}


size_t allocator_buddies_system::largest_free_block() const noexcept
{
    size_t largest = 0;
    for (auto const &[start, b] : _blocks)
    {
        if (!b.occupied)
        {
            largest = std::max(largest, b.size);
        }
    }
    return largest;
}


size_t allocator_buddies_system::free_block_count() const noexcept
{
    return static_cast<size_t>(std::count_if(_blocks.begin(), _blocks.end(),
                                             [](auto const &entry) { return !entry.second.occupied; }));
}


size_t allocator_buddies_system::allocated_block_count() const noexcept
{
    return _blocks.size() - free_block_count();
}


size_t allocator_buddies_system::capacity() const noexcept
{
    return _capacity;
}


size_t allocator_buddies_system::min_block_size() const noexcept
{
    return _min_block_size;
}


size_t allocator_buddies_system::depth_of(size_t block_size) const
{
    if (!is_power_of_two(block_size) || block_size > _capacity)
    {
        throw invalid_request("Block size " + std::to_string(block_size) +
                              " is not a power of two within capacity " + std::to_string(_capacity));
    }

    size_t depth = 0;
    for (size_t size = _capacity; size > block_size; size >>= 1)
    {
        ++depth;
    }
    return depth;
}


bool allocator_buddies_system::is_power_of_two(size_t value) noexcept
{
    return value != 0 && (value & (value - 1)) == 0;
}


std::optional<size_t> allocator_buddies_system::next_power_of_two(size_t value) noexcept
{
    if (value > largest_power_of_two)
    {
        return std::nullopt;
    }

    size_t result = 1;
    while (result < value)
    {
        result <<= 1;
    }
    return result;
}


size_t allocator_buddies_system::normalize_capacity(size_t requested_capacity) const
{
    if (requested_capacity == 0)
    {
        throw invalid_request("Capacity must be positive");
    }

    auto const rounded = next_power_of_two(std::max(requested_capacity, _min_block_size));
    if (!rounded.has_value())
    {
        throw invalid_request("Capacity " + std::to_string(requested_capacity) +
                              " cannot be rounded up to a power of two");
    }

    return *rounded;
}


std::map<size_t, allocator_buddies_system::block>::const_iterator allocator_buddies_system::find_owner_block(
    owner_id const &owner) const
{
    return std::find_if(_blocks.cbegin(), _blocks.cend(),
                        [&owner](auto const &entry) { return entry.second.occupied && entry.second.owner == owner; });
}


std::map<size_t, allocator_buddies_system::block>::iterator allocator_buddies_system::find_best_fit(size_t needed_size)
{
    auto best = _blocks.end();

    for (auto it = _blocks.begin(); it != _blocks.end(); ++it)
    {
        if (it->second.occupied || it->second.size < needed_size)
        {
            continue;
        }

        // Строгое сравнение оставляет блок с младшим адресом среди равных по размеру
        if (best == _blocks.end() || it->second.size < best->second.size)
        {
            best = it;
        }
    }

    return best;
}


allocator_buddies_system::partition_diff allocator_buddies_system::release(std::map<size_t, block>::iterator target)
{
    partition_diff diff{_capacity, _capacity, get_blocks_info(), {}};

    target->second.occupied = false;
    target->second.owner.clear();
    target->second.requested_size = 0;

    coalesce(target);

    diff.after = get_blocks_info();
    return diff;
}


void allocator_buddies_system::coalesce(std::map<size_t, block>::iterator freed)
{
    while (freed->second.size < _capacity)
    {
        size_t const size = freed->second.size;
        auto buddy = _blocks.find(freed->first ^ size);

        if (buddy == _blocks.end() || buddy->second.occupied || buddy->second.size != size)
        {
            break;
        }

        auto lower = freed->first < buddy->first ? freed : buddy;
        auto upper = freed->first < buddy->first ? buddy : freed;

        lower->second.size = size << 1;
        _blocks.erase(upper);
        freed = lower;
    }
}


allocator_test_utils::block_info allocator_buddies_system::to_block_info(size_t start, block const &b)
{
    return {start, b.size, b.occupied, b.owner, b.requested_size};
}
