#include "vmedia/console/media_commands.h"

#include "vmedia/console/console_engine.h"
#include "vmedia/console/console_parse.h"

#include <string>

namespace vmedia::console {

namespace {

std::string join(const std::vector<std::string>& items, const char* sep)
{
    std::string out;
    for (const auto& s : items) {
        if (!out.empty()) out += sep;
        out += s;
    }
    return out;
}

const char* yes_no(bool b) { return b ? "yes" : "no"; }

void write_error(IConsoleTransport& io, const media::MediaResult& r)
{
    io.write_line("error: " + r.message + " (" + std::to_string(r.code) + ")");
}

bool usage(IConsoleTransport& io, const char* text)
{
    io.write("usage: ");
    io.write_line(text);
    return true;
}

} // namespace

void register_media_commands(ConsoleCommandRegistry& commands,
                             media::VirtualMediaRegistry& registry,
                             IConsoleTransport& io)
{
    commands.register_command(
        {"devices", "list virtual media device types", "devices"},
        [&registry, &io](const std::vector<std::string_view>&) {
            io.write("driver: ");
            io.write_line(registry.driver());
            for (const auto& e : registry.catalog().entries()) {
                io.write_line("  " + e.device + "  \"" + e.name + "\"  [" + join(e.mediaTypes, ", ") + "]");
            }
            return true;
        });

    static constexpr const char* INFO_USAGE = "info <identity> <device>";
    commands.register_command(
        {"info", "show a device and its inserted image", INFO_USAGE},
        [&registry, &io](const std::vector<std::string_view>& argv) {
            if (argv.size() != 3) return usage(io, INFO_USAGE);

            const std::string identity(argv[1]);
            const std::string device(argv[2]);

            std::string name;
            media::MediaResult r = registry.device_name(identity, device, name);
            if (!r.ok()) {
                write_error(io, r);
                return true;
            }

            media::DeviceInfo info{};
            r = registry.device_info(identity, device, info);
            if (!r.ok()) {
                write_error(io, r);
                return true;
            }

            io.write_line("name:            " + name);
            io.write_line("media types:     " + join(info.mediaTypes, ", "));
            io.write_line("image:           " + info.image);
            io.write_line("image name:      " + info.imageName);
            io.write_line(std::string("inserted:        ") + yes_no(info.inserted));
            io.write_line(std::string("write protected: ") + yes_no(info.writeProtected));
            if (!info.localFilePath.empty()) {
                io.write_line("local file:      " + info.localFilePath);
            }
            return true;
        });

    static constexpr const char* INSERT_USAGE = "insert <identity> <device> <url> [--rw] [--not-inserted]";
    commands.register_command(
        {"insert", "download an image and insert it", INSERT_USAGE},
        [&registry, &io](const std::vector<std::string_view>& argv) {
            std::vector<std::string_view> args = argv;

            media::InsertOptions opts{};
            opts.writeProtected = !take_flag(args, "--rw");
            opts.inserted = !take_flag(args, "--not-inserted");

            if (args.size() != 4) return usage(io, INSERT_USAGE);

            std::string localPath;
            const media::MediaResult r = registry.insert_image(
                std::string(args[1]), std::string(args[2]), std::string(args[3]), opts, localPath);
            if (!r.ok()) {
                write_error(io, r);
                return true;
            }
            io.write_line("ok: " + localPath);
            return true;
        });

    static constexpr const char* EJECT_USAGE = "eject <identity> <device>";
    commands.register_command(
        {"eject", "eject media and remove the local copy", EJECT_USAGE},
        [&registry, &io](const std::vector<std::string_view>& argv) {
            if (argv.size() != 3) return usage(io, EJECT_USAGE);

            const media::MediaResult r = registry.eject_image(std::string(argv[1]), std::string(argv[2]));
            if (!r.ok()) {
                write_error(io, r);
                return true;
            }
            io.write_line("ok");
            return true;
        });
}

} // namespace vmedia::console
