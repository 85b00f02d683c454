#include "vmedia/console/console_commands.h"

#include "vmedia/console/console_engine.h" // IConsoleTransport

#include <cstddef>

namespace vmedia::console {

bool ConsoleCommandRegistry::register_command(ConsoleCommandSpec spec, ConsoleCommandFn fn)
{
    if (spec.name.empty() || !fn) {
        return false;
    }
    std::string key = spec.name;
    return _cmds.try_emplace(std::move(key), Entry{std::move(spec), std::move(fn)}).second;
}

std::optional<bool> ConsoleCommandRegistry::dispatch(const std::vector<std::string_view>& argv) const
{
    if (argv.empty()) return std::nullopt;
    auto it = _cmds.find(argv[0]);
    if (it == _cmds.end()) return std::nullopt;
    return (it->second.fn)(argv);
}

const ConsoleCommandSpec* ConsoleCommandRegistry::find(std::string_view name) const
{
    auto it = _cmds.find(name);
    return it == _cmds.end() ? nullptr : &it->second.spec;
}

void ConsoleCommandRegistry::print_help(IConsoleTransport& io) const
{
    static constexpr std::size_t SUMMARY_COLUMN = 40;

    io.write_line("commands:");
    for (const auto& [name, entry] : _cmds) {
        const ConsoleCommandSpec& c = entry.spec;
        std::string line = "  " + (c.usage.empty() ? name : c.usage);
        if (!c.summary.empty()) {
            line.append(line.size() < SUMMARY_COLUMN ? SUMMARY_COLUMN - line.size() : 2, ' ');
            line += c.summary;
        }
        io.write_line(line);
    }
}

} // namespace vmedia::console
