#include "../include/not_implemented.h"

not_implemented::not_implemented(
    std::string const &method_name,
    std::string const &additional_info)
    : std::logic_error("Method " + method_name + " is not implemented: " + additional_info)
{

}
