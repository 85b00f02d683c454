#pragma once

#include "vmedia/console/console_commands.h"
#include "vmedia/media/virtual_media_registry.h"

namespace vmedia::console {

class IConsoleTransport;

// Registers "devices", "info", "insert" and "eject" on `commands`.
// Both the registry and the transport must outlive the command registry.
void register_media_commands(ConsoleCommandRegistry& commands,
                             media::VirtualMediaRegistry& registry,
                             IConsoleTransport& io);

} // namespace vmedia::console
