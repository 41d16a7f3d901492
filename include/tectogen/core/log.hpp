#pragma once

/**
 * @file log.hpp
 * @brief Console logging with a channel prefix
 *
 * Output format:
 *   [worldgen] message
 *   [worldgen] WARNING: message
 *   [worldgen] ERROR: message
 *
 * Informational messages are only printed when the logger is verbose.
 * Warnings and errors always go to stderr.
 */

#include <string>
#include <string_view>

namespace tectogen {

class Logger {
public:
    explicit Logger(std::string_view channel, bool verbose = false);

    void log(std::string_view message) const;
    void warn(std::string_view message) const;
    void error(std::string_view message) const;

    [[nodiscard]] bool verbose() const { return verbose_; }
    void setVerbose(bool verbose) { verbose_ = verbose; }

    [[nodiscard]] std::string_view channel() const { return channel_; }

private:
    std::string channel_;
    bool verbose_;
};

}  // namespace tectogen
