#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include "../include/process_manager.h"
#include "../include/simulator_config.h"

namespace {

void print_help(std::ostream &out)
{
    out << "Commands:\n"
        << "  capacity <size>     set total memory (rounded up to a power of two)\n"
        << "  add <name> <size>   allocate memory for a process\n"
        << "  remove <name>       free the memory of a process\n"
        << "  blocks              show the memory map\n"
        << "  processes           list active processes\n"
        << "  stats               show allocated, free and fragmented memory\n"
        << "  reset               remove every process\n"
        << "  help                show this text\n"
        << "  quit                exit" << std::endl;
}

void print_blocks(std::ostream &out, allocator_buddies_system const &memory)
{
    out << std::left << std::setw(10) << "address" << std::setw(8) << "size"
        << std::setw(8) << "state" << "process" << std::endl;

    for (auto const &block : memory.get_blocks_info())
    {
        out << std::setw(10) << block.start << std::setw(8) << block.block_size
            << std::setw(8) << (block.is_block_occupied ? "occup" : "avail");
        if (block.is_block_occupied)
        {
            out << block.owner << " (" << block.requested_size << " requested)";
        }
        out << std::endl;
    }
}

void print_processes(std::ostream &out, process_manager const &manager)
{
    if (manager.processes().empty())
    {
        out << "No active processes" << std::endl;
        return;
    }

    for (auto const &process : manager.processes())
    {
        out << process.name << ": " << process.requested_size << " MB at address "
            << process.handle.start << " (" << process.handle.size << " MB block)" << std::endl;
    }
}

void print_statistics(std::ostream &out, process_manager const &manager)
{
    auto const stats = manager.get_statistics();
    out << "Total memory: " << stats.capacity << " MB" << std::endl
        << "Allocated: " << stats.allocated << " MB" << std::endl
        << "Free: " << stats.free << " MB" << std::endl
        << "Internal Fragmentation: " << stats.internal_fragmentation << " MB" << std::endl;
}

bool read_size(std::istringstream &args, size_t &size)
{
    long long value = 0;
    if (!(args >> value) || value < 0)
    {
        return false;
    }

    size = static_cast<size_t>(value);
    return true;
}

}

int main(
    int argc,
    char **argv)
{
    if (argc > 2)
    {
        std::cerr << "Usage: " << argv[0] << " [config.json]" << std::endl;
        return 1;
    }

    simulator_config config;
    std::unique_ptr<logger> log;
    try
    {
        if (argc == 2)
        {
            config = simulator_config::load(argv[1]);
        }
        log = make_logger(config.logger_section);
    }
    catch (std::exception const &e)
    {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    std::unique_ptr<process_manager> manager;
    try
    {
        manager = std::make_unique<process_manager>(config.capacity, config.min_block_size, log.get());
    }
    catch (std::exception const &e)
    {
        std::cerr << "Invalid memory configuration: " << e.what() << std::endl;
        return 1;
    }

    print_help(std::cout);

    std::string line;
    while (std::cout << "> " << std::flush, std::getline(std::cin, line))
    {
        std::istringstream args(line);
        std::string command;
        if (!(args >> command))
        {
            continue;
        }

        try
        {
            if (command == "quit" || command == "exit")
            {
                break;
            }
            else if (command == "help")
            {
                print_help(std::cout);
            }
            else if (command == "capacity")
            {
                size_t size = 0;
                if (!read_size(args, size) || size == 0)
                {
                    std::cout << "Total memory must be a positive integer." << std::endl;
                    continue;
                }
                std::cout << "Total Memory: " << manager->resize_memory(size) << " MB" << std::endl;
            }
            else if (command == "add")
            {
                std::string name;
                size_t size = 0;
                if (!(args >> name) || !read_size(args, size) || size == 0)
                {
                    std::cout << "Invalid process name or memory size." << std::endl;
                    continue;
                }
                manager->add_process(name, size);
            }
            else if (command == "remove")
            {
                std::string name;
                if (!(args >> name))
                {
                    std::cout << "No process selected." << std::endl;
                    continue;
                }
                manager->remove_process(name);
            }
            else if (command == "blocks")
            {
                print_blocks(std::cout, manager->memory());
            }
            else if (command == "processes")
            {
                print_processes(std::cout, *manager);
            }
            else if (command == "stats")
            {
                print_statistics(std::cout, *manager);
            }
            else if (command == "reset")
            {
                manager->reset_memory();
            }
            else
            {
                std::cout << "Unknown command '" << command << "', type 'help'" << std::endl;
            }
        }
        catch (buddy_system_error const &e)
        {
            std::cout << "Error (" << buddy_system_error::kind_to_string(e.kind()) << "): " << e.what() << std::endl;
        }
        catch (std::exception const &e)
        {
            std::cout << "Error: " << e.what() << std::endl;
        }
    }

    return 0;
}
