#include <algorithm>
#include <cctype>
#include <stdexcept>
#include "../include/logger_builder.h"

logger::severity logger_builder::string_to_severity(std::string const &severity_str)
{
    std::string lowered(severity_str);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return logger::severity::trace;
    if (lowered == "debug") return logger::severity::debug;
    if (lowered == "information" || lowered == "info") return logger::severity::information;
    if (lowered == "warning") return logger::severity::warning;
    if (lowered == "error") return logger::severity::error;
    if (lowered == "critical") return logger::severity::critical;

    throw std::out_of_range("Unknown severity level: " + severity_str);
}
