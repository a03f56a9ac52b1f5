#ifndef BUDDY_SYSTEM_SIMULATOR_NOT_IMPLEMENTED_H
#define BUDDY_SYSTEM_SIMULATOR_NOT_IMPLEMENTED_H

#include <stdexcept>
#include <string>

/**
 * @class not_implemented
 * @brief Бросается операциями, которые конкретная реализация не поддерживает
 */
class not_implemented final:
    public std::logic_error
{
public:
    not_implemented(
        std::string const &method_name,
        std::string const &additional_info);
};

#endif //BUDDY_SYSTEM_SIMULATOR_NOT_IMPLEMENTED_H
