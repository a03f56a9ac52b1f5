#include "../include/buddy_system_error.h"

buddy_system_error::buddy_system_error(
    error_kind kind,
    std::string const &message)
    : std::runtime_error(message), _kind(kind)
{

}

buddy_system_error::error_kind buddy_system_error::kind() const noexcept
{
    return _kind;
}

std::string buddy_system_error::kind_to_string(error_kind kind)
{
    switch (kind)
    {
        case error_kind::invalid_request:
            return "InvalidRequest";
        case error_kind::out_of_memory:
            return "OutOfMemory";
        case error_kind::unknown_allocation:
            return "UnknownAllocation";
        case error_kind::capacity_change_denied:
            return "CapacityChangeDenied";
    }

    throw std::out_of_range("Invalid error kind");
}

invalid_request::invalid_request(std::string const &message)
    : buddy_system_error(error_kind::invalid_request, message)
{

}

out_of_memory::out_of_memory(std::string const &message)
    : buddy_system_error(error_kind::out_of_memory, message)
{

}

unknown_allocation::unknown_allocation(std::string const &message)
    : buddy_system_error(error_kind::unknown_allocation, message)
{

}

capacity_change_denied::capacity_change_denied(std::string const &message)
    : buddy_system_error(error_kind::capacity_change_denied, message)
{

}
