#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vmedia::console {

class IConsoleTransport;

struct ConsoleCommandSpec {
    std::string name;
    std::string summary;
    std::string usage;
};

// Command handler returns:
// - true  => continue console loop
// - false => exit console loop
using ConsoleCommandFn = std::function<bool(const std::vector<std::string_view>& argv)>;

class ConsoleCommandRegistry {
public:
    bool register_command(ConsoleCommandSpec spec, ConsoleCommandFn fn);

    // Returns:
    // - nullopt if no command matched
    // - true/false based on handler result
    std::optional<bool> dispatch(const std::vector<std::string_view>& argv) const;

    const ConsoleCommandSpec* find(std::string_view name) const;

    // One line per command, sorted by name, summaries aligned.
    void print_help(IConsoleTransport& io) const;

private:
    struct Entry {
        ConsoleCommandSpec spec;
        ConsoleCommandFn fn;
    };

    std::map<std::string, Entry, std::less<>> _cmds;
};

} // namespace vmedia::console
