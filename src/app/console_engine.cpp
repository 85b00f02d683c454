#include "vmedia/console/console_engine.h"

#include "vmedia/console/console_parse.h"

namespace vmedia::console {

ConsoleEngine::ConsoleEngine(ConsoleCommandRegistry& commands, IConsoleTransport& io)
    : _commands(commands)
    , _io(io)
{}

void ConsoleEngine::run_loop()
{
    while (_io.is_connected() && step(-1)) {
        // loop
    }
}

bool ConsoleEngine::step(int timeout_ms)
{
    if (!_prompted) {
        _io.write(_prompt);
        _prompted = true;
    }

    std::string line;
    if (!read_line(line, timeout_ms)) {
        return true; // no input / timeout
    }
    _prompted = false;
    return handle_line(line);
}

bool ConsoleEngine::read_line(std::string& out_line, int timeout_ms)
{
    std::uint8_t ch = 0;
    while (_io.read_byte(ch, timeout_ms)) {
        // After the first byte, don't block for more.
        timeout_ms = 0;

        const char c = static_cast<char>(ch);
        if (c == '\r' || c == '\n') {
            if (_pending_eol != 0 && c != _pending_eol) {
                _pending_eol = 0;
                continue; // second half of CRLF / LFCR
            }
            _pending_eol = c;
            out_line.swap(_line);
            _line.clear();
            return true;
        }
        _pending_eol = 0;

        if (c == '\b' || ch == 0x7f) {
            if (!_line.empty()) {
                _line.pop_back();
            }
            continue;
        }
        _line.push_back(c);
    }

    // Input closed mid-line: hand over what we have.
    if (!_io.is_connected() && !_line.empty()) {
        out_line.swap(_line);
        _line.clear();
        return true;
    }
    return false;
}

bool ConsoleEngine::handle_line(std::string_view line)
{
    line = trim_ws(line);
    if (line.empty()) {
        return true;
    }

    // Ignore lines that contain ANSI escape (often init strings / terminal noise).
    if (line.find('\x1b') != std::string_view::npos) {
        return true;
    }

    const auto argv = split_ws(line);
    const std::string_view cmd0 = argv[0];

    if (cmd0 == "exit" || cmd0 == "quit") {
        _io.write_line("bye");
        return false;
    }

    if (cmd0 == "help") {
        if (argv.size() > 1) {
            if (const auto* spec = _commands.find(argv[1])) {
                _io.write_line(spec->usage.empty() ? spec->name : spec->usage);
                if (!spec->summary.empty()) {
                    _io.write_line(spec->summary);
                }
                return true;
            }
        }
        _commands.print_help(_io);
        _io.write_line("  help [command]");
        _io.write_line("  exit | quit");
        return true;
    }

    if (auto r = _commands.dispatch(argv)) {
        return *r;
    }

    _io.write_line("error: unknown command (try: help)");
    return true;
}

} // namespace vmedia::console
