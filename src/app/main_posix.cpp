#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>

#include "vmedia/config/media_setup.h"
#include "vmedia/config/vmedia_config_yaml_store_fs.h"
#include "vmedia/console/console_commands.h"
#include "vmedia/console/console_engine.h"
#include "vmedia/console/media_commands.h"
#include "vmedia/core/logging.h"
#include "vmedia/core/version.h"
#include "vmedia/fs/storage_manager.h"
#include "vmedia/media/device_store.h"
#include "vmedia/media/image_fetcher.h"
#include "vmedia/media/virtual_media_registry.h"
#include "vmedia/platform/http_registry.h"
#include "vmedia/platform/posix/fs_factory.h"

using namespace vmedia;

static const char* TAG = "main";

static const char* STATE_FS = "state";
static const char* CACHE_FS = "cache";

static config::VmediaConfig load_config()
{
    const char* env = std::getenv("VM_CONFIG");
    const std::filesystem::path cfgPath = (env && *env) ? env : "./vmedia.yaml";

    std::string dir = cfgPath.parent_path().string();
    if (dir.empty()) {
        dir = ".";
    }

    auto cfgFs = platform::posix::create_host_filesystem(dir, "config");
    config::YamlVmediaConfigStoreFs store(cfgFs.get(), cfgPath.filename().string());
    return store.load();
}

static bool register_host_fs(fs::StorageManager& storage, const std::string& root, const char* name)
{
    auto hostFs = platform::posix::create_host_filesystem(root, name);
    if (!hostFs) {
        VM_LOGE(TAG, "Failed to create '%s' filesystem at '%s'", name, root.c_str());
        return false;
    }
    if (!storage.registerFileSystem(std::move(hostFs))) {
        VM_LOGE(TAG, "StorageManager refused to register '%s' filesystem", name);
        return false;
    }
    VM_LOGI(TAG, "Filesystem '%s' rooted at '%s'", name, root.c_str());
    return true;
}

int main()
{
    const config::VmediaConfig cfg = load_config();
    log::set_level(log::parse_level(cfg.log.level));

    VM_LOGI(TAG, "vmedia-emu %.*s starting",
            static_cast<int>(version().size()), version().data());

    fs::StorageManager storage;
    if (!register_host_fs(storage, cfg.general.stateDir, STATE_FS) ||
        !register_host_fs(storage, cfg.general.cacheDir, CACHE_FS)) {
        return 1;
    }

    media::DeviceStore store;
    if (cfg.general.persistent) {
        if (!store.make_permanent(storage.get(STATE_FS), cfg.general.nameSpace)) {
            VM_LOGE(TAG, "Cannot open device state '%s' in '%s'",
                    cfg.general.nameSpace.c_str(), cfg.general.stateDir.c_str());
            return 1;
        }
    } else {
        VM_LOGW(TAG, "Device state is not persistent");
    }

    media::ImageFetcher fetcher(*storage.get(CACHE_FS),
                                "/",
                                platform::make_default_http_registry(),
                                config::make_fetch_policy(cfg.fetch));

    media::VirtualMediaRegistry registry(config::make_device_catalog(cfg), store, fetcher);
    VM_LOGI(TAG, "Driver %s with %zu device types", registry.driver(), registry.catalog().size());

    auto io = console::create_default_console_transport();

    console::ConsoleCommandRegistry commands;
    console::register_media_commands(commands, registry, *io);

    console::ConsoleEngine engine(commands, *io);
    engine.run_loop();

    VM_LOGI(TAG, "vmedia-emu exiting");
    return 0;
}
