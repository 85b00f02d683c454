#include "vmedia/config/vmedia_config_yaml_store_fs.h"
#include "vmedia/core/logging.h"
#include "vmedia/fs/file_io.h"

#include <stdexcept>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace vmedia::config {

static constexpr const char* TAG = "config";

std::vector<DeviceConfig> default_devices()
{
    return {
        DeviceConfig{"Cd", "Virtual CD", {"CD", "DVD"}},
        DeviceConfig{"Floppy", "Virtual Removable Media", {"Floppy", "USBStick"}},
    };
}

// ---------- tiny helpers ----------

template<typename T>
static T get_or(const YAML::Node& obj, const char* key, T def)
{
    auto n = obj[key];
    return n ? n.as<T>() : def;
}

// ---------- from_yaml helpers ----------

static void from_yaml(const YAML::Node& node, GeneralConfig& out)
{
    out.stateDir  = get_or<std::string>(node, "state_dir", out.stateDir);
    out.cacheDir  = get_or<std::string>(node, "cache_dir", out.cacheDir);
    out.nameSpace = get_or<std::string>(node, "namespace", out.nameSpace);
    out.persistent = get_or<bool>(node, "persistent", out.persistent);
}

static void from_yaml(const YAML::Node& node, FetchConfig& out)
{
    out.maxAttempts       = get_or<int>(node, "max_attempts", out.maxAttempts);
    out.initialBackoffMs  = get_or<int>(node, "initial_backoff_ms", out.initialBackoffMs);
    out.backoffMultiplier = get_or<int>(node, "backoff_multiplier", out.backoffMultiplier);
    out.timeoutSeconds    = get_or<int>(node, "timeout_s", out.timeoutSeconds);
    out.chunkSize         = get_or<int>(node, "chunk_size", out.chunkSize);
    out.verifyTls         = get_or<bool>(node, "verify_tls", out.verifyTls);
    out.defaultFileName   = get_or<std::string>(node, "default_file_name", out.defaultFileName);
}

static void from_yaml(const std::string& device, const YAML::Node& node, DeviceConfig& out)
{
    out.device = device;
    out.name   = get_or<std::string>(node, "name", "");

    out.mediaTypes.clear();
    if (auto types = node["media_types"]; types && types.IsSequence()) {
        for (const auto& t : types) {
            out.mediaTypes.push_back(t.as<std::string>());
        }
    }
}

static void from_yaml(const YAML::Node& node, LogConfig& out)
{
    out.level = get_or<std::string>(node, "level", out.level);
}

// Top-level VmediaConfig mapper.
static void from_yaml(const YAML::Node& root, VmediaConfig& cfg)
{
    if (auto n = root["vmedia"]) {
        from_yaml(n, cfg.general);
    }

    if (auto n = root["fetch"]) {
        from_yaml(n, cfg.fetch);
    }

    // Map order is catalog order.
    if (auto devs = root["devices"]; devs && devs.IsMap()) {
        cfg.devices.clear();
        for (const auto& kv : devs) {
            DeviceConfig dc{};
            from_yaml(kv.first.as<std::string>(), kv.second, dc);
            cfg.devices.push_back(std::move(dc));
        }
    }

    if (auto n = root["log"]) {
        from_yaml(n, cfg.log);
    }
}

// ---------- to_yaml ----------

static void to_yaml(YAML::Emitter& out, const VmediaConfig& cfg)
{
    out << YAML::BeginMap;

    // vmedia:
    out << YAML::Key << "vmedia" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "state_dir" << YAML::Value << cfg.general.stateDir;
    out << YAML::Key << "cache_dir" << YAML::Value << cfg.general.cacheDir;
    out << YAML::Key << "namespace" << YAML::Value << cfg.general.nameSpace;
    out << YAML::Key << "persistent" << YAML::Value << cfg.general.persistent;
    out << YAML::EndMap;

    // fetch:
    out << YAML::Key << "fetch" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "max_attempts"       << YAML::Value << cfg.fetch.maxAttempts;
    out << YAML::Key << "initial_backoff_ms" << YAML::Value << cfg.fetch.initialBackoffMs;
    out << YAML::Key << "backoff_multiplier" << YAML::Value << cfg.fetch.backoffMultiplier;
    out << YAML::Key << "timeout_s"          << YAML::Value << cfg.fetch.timeoutSeconds;
    out << YAML::Key << "chunk_size"         << YAML::Value << cfg.fetch.chunkSize;
    out << YAML::Key << "verify_tls"         << YAML::Value << cfg.fetch.verifyTls;
    out << YAML::Key << "default_file_name"  << YAML::Value << cfg.fetch.defaultFileName;
    out << YAML::EndMap;

    // devices:
    out << YAML::Key << "devices" << YAML::Value << YAML::BeginMap;
    for (const auto& d : cfg.devices) {
        out << YAML::Key << d.device << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "name"        << YAML::Value << d.name;
        out << YAML::Key << "media_types" << YAML::Value << YAML::Flow << d.mediaTypes;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    // log:
    out << YAML::Key << "log" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "level" << YAML::Value << cfg.log.level;
    out << YAML::EndMap;

    out << YAML::EndMap; // root
}

// ---------- YamlVmediaConfigStoreFs methods ----------

YamlVmediaConfigStoreFs::YamlVmediaConfigStoreFs(fs::IFileSystem* fs, std::string relativePath)
    : _fs(fs)
    , _relPath(std::move(relativePath))
{
}

VmediaConfig YamlVmediaConfigStoreFs::load()
{
    VmediaConfig cfg{}; // defaults

    if (!_fs) {
        VM_LOGW(TAG, "No filesystem for config '%s'; using defaults", _relPath.c_str());
        return cfg;
    }

    if (_fs->exists(_relPath)) {
        try {
            return loadFromFs(*_fs);
        } catch (const std::exception& ex) {
            VM_LOGE(TAG,
                    "Failed to load config '%s' on '%s': %s; using defaults",
                    _relPath.c_str(),
                    _fs->name().c_str(),
                    ex.what());
            return cfg;
        }
    }

    // Not found: write defaults so the file exists for the next start.
    VM_LOGW(TAG, "Config '%s' not found; writing defaults", _relPath.c_str());
    save(cfg);
    return cfg;
}

void YamlVmediaConfigStoreFs::save(const VmediaConfig& cfg)
{
    if (!_fs) {
        return;
    }

    try {
        saveToFs(*_fs, cfg);
    } catch (const std::exception& ex) {
        VM_LOGE(TAG,
                "Failed to save config '%s' on '%s': %s",
                _relPath.c_str(),
                _fs->name().c_str(),
                ex.what());
    }
}

VmediaConfig YamlVmediaConfigStoreFs::loadFromFs(fs::IFileSystem& vol)
{
    auto file = vol.open(_relPath, "rb");
    if (!file) {
        throw std::runtime_error("open for read failed");
    }

    std::string yamlText = fs::read_all(*file);
    if (yamlText.empty()) {
        VM_LOGW(TAG,
                "Config '%s' on '%s' is empty; using defaults",
                _relPath.c_str(), vol.name().c_str());
        return VmediaConfig{};
    }

    YAML::Node root = YAML::Load(yamlText);

    VmediaConfig cfg{};
    from_yaml(root, cfg);

    VM_LOGI(TAG,
            "Loaded config from '%s' on '%s'",
            _relPath.c_str(), vol.name().c_str());
    return cfg;
}

void YamlVmediaConfigStoreFs::saveToFs(fs::IFileSystem& vol, const VmediaConfig& cfg)
{
    YAML::Emitter out;
    to_yaml(out, cfg);
    if (!out.good()) {
        throw std::runtime_error(out.GetLastError());
    }

    if (!fs::write_file_atomic(vol, _relPath, out.c_str())) {
        throw std::runtime_error("write failed");
    }

    VM_LOGI(TAG,
            "Saved config to '%s' on '%s'",
            _relPath.c_str(), vol.name().c_str());
}

} // namespace vmedia::config
