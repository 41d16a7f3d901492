#include "tectogen/core/log.hpp"

#include <iostream>

namespace tectogen {

Logger::Logger(std::string_view channel, bool verbose)
    : channel_(channel)
    , verbose_(verbose)
{
}

void Logger::log(std::string_view message) const {
    if (!verbose_) return;
    std::cout << "[" << channel_ << "] " << message << "\n";
}

void Logger::warn(std::string_view message) const {
    std::cerr << "[" << channel_ << "] WARNING: " << message << "\n";
}

void Logger::error(std::string_view message) const {
    std::cerr << "[" << channel_ << "] ERROR: " << message << "\n";
}

}  // namespace tectogen
