#include "vmedia/console/console_engine.h"

#include <iostream>
#include <string>

#include <poll.h>
#include <unistd.h>

namespace vmedia::console {

namespace {

// Reads stdin in the terminal's canonical mode; the tty does echo and editing.
class StdioConsoleTransport final : public IConsoleTransport {
public:
    bool is_connected() const override { return !_eof; }

    bool read_byte(std::uint8_t& out, int timeout_ms) override
    {
        if (_eof) {
            return false;
        }

        struct pollfd pfd;
        pfd.fd = STDIN_FILENO;
        pfd.events = POLLIN;
        pfd.revents = 0;

        const int ret = ::poll(&pfd, 1, timeout_ms);
        if (ret <= 0) {
            return false; // timeout or EINTR
        }

        if ((pfd.revents & POLLIN) == 0) {
            if ((pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) != 0) {
                _eof = true;
            }
            return false;
        }

        unsigned char ch = 0;
        const ssize_t n = ::read(STDIN_FILENO, &ch, 1);
        if (n != 1) {
            if (n == 0) {
                _eof = true;
            }
            return false;
        }
        out = static_cast<std::uint8_t>(ch);
        return true;
    }

    void write(std::string_view s) override
    {
        std::cout.write(s.data(), static_cast<std::streamsize>(s.size()));
        std::cout.flush();
    }

    void write_line(std::string_view s) override
    {
        std::cout.write(s.data(), static_cast<std::streamsize>(s.size()));
        std::cout.put('\n');
        std::cout.flush();
    }

private:
    bool _eof{false};
};

} // namespace

std::unique_ptr<IConsoleTransport> create_default_console_transport()
{
    return std::make_unique<StdioConsoleTransport>();
}

} // namespace vmedia::console
