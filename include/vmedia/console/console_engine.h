#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "vmedia/console/console_commands.h"

namespace vmedia::console {

class IConsoleTransport {
public:
    virtual ~IConsoleTransport() = default;

    // False once the input side has closed (EOF, hangup).
    virtual bool is_connected() const = 0;

    // Reads a single input byte.
    // Returns false on timeout or when input is unavailable.
    // A negative timeout blocks until a byte arrives.
    virtual bool read_byte(std::uint8_t& out, int timeout_ms) = 0;

    virtual void write(std::string_view s) = 0;

    virtual void write_line(std::string_view s) = 0;
};

// POSIX: process stdin/stdout.
std::unique_ptr<IConsoleTransport> create_default_console_transport();

// Line-oriented command loop over a transport. "help", "exit" and "quit"
// are built in; everything else goes to the command registry.
class ConsoleEngine {
public:
    ConsoleEngine(ConsoleCommandRegistry& commands, IConsoleTransport& io);

    // Blocking loop; returns on quit or when the transport disconnects.
    void run_loop();

    // One cooperative iteration. Returns false to stop the console.
    // `timeout_ms` is passed to the transport.
    bool step(int timeout_ms);

    void set_prompt(std::string prompt) { _prompt = std::move(prompt); }

private:
    // Returns true and sets out_line when a full line is committed.
    bool read_line(std::string& out_line, int timeout_ms);

    bool handle_line(std::string_view line);

    ConsoleCommandRegistry& _commands;
    IConsoleTransport& _io;

    std::string _prompt{"vmedia> "};
    bool _prompted{false};

    std::string _line;
    char _pending_eol{0}; // swallow CRLF/LFCR as a single line commit
};

} // namespace vmedia::console
