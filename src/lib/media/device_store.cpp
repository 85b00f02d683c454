#include "vmedia/media/device_store.h"

#include "vmedia/core/logging.h"
#include "vmedia/fs/file_io.h"

#include <algorithm>
#include <exception>

#include <yaml-cpp/yaml.h>

namespace vmedia::media {

static constexpr const char* TAG = "store";

// ---------- yaml mapping ----------

template<typename T>
static T get_or(const YAML::Node& obj, const char* key, T def)
{
    auto n = obj[key];
    return n ? n.as<T>() : def;
}

static void from_yaml(const YAML::Node& node, DeviceKey& key, DeviceInfo& info)
{
    key.identity        = get_or<std::string>(node, "identity", "");
    key.device          = get_or<std::string>(node, "device", "");

    info.name           = get_or<std::string>(node, "name", "");
    info.image          = get_or<std::string>(node, "image", "");
    info.imageName      = get_or<std::string>(node, "image_name", "");
    info.inserted       = get_or<bool>(node, "inserted", false);
    info.writeProtected = get_or<bool>(node, "write_protected", false);
    info.localFilePath  = get_or<std::string>(node, "local_file_path", "");

    info.mediaTypes.clear();
    if (auto types = node["media_types"]; types && types.IsSequence()) {
        for (const auto& t : types) {
            info.mediaTypes.push_back(t.as<std::string>());
        }
    }
}

static void to_yaml(YAML::Emitter& out, const DeviceKey& key, const DeviceInfo& info)
{
    out << YAML::BeginMap;
    out << YAML::Key << "identity"        << YAML::Value << key.identity;
    out << YAML::Key << "device"          << YAML::Value << key.device;
    out << YAML::Key << "name"            << YAML::Value << info.name;
    out << YAML::Key << "media_types"     << YAML::Value << YAML::Flow << info.mediaTypes;
    out << YAML::Key << "image"           << YAML::Value << info.image;
    out << YAML::Key << "image_name"      << YAML::Value << info.imageName;
    out << YAML::Key << "inserted"        << YAML::Value << info.inserted;
    out << YAML::Key << "write_protected" << YAML::Value << info.writeProtected;
    out << YAML::Key << "local_file_path" << YAML::Value << info.localFilePath;
    out << YAML::EndMap;
}

// ---------- DeviceStore ----------

bool DeviceStore::make_permanent(fs::IFileSystem* fs, std::string nameSpace)
{
    if (!fs || nameSpace.empty()) {
        VM_LOGE(TAG, "Cannot make store permanent without a filesystem and namespace");
        return false;
    }

    const std::string relPath = nameSpace + ".yaml";

    std::lock_guard<std::mutex> lock(_mutex);

    if (fs->exists(relPath) && !load_locked(*fs, relPath)) {
        // The unreadable file is left in place.
        return false;
    }

    _fs = fs;
    _relPath = relPath;

    VM_LOGI(TAG, "Device state persisted to '%s' on '%s' (%zu records)",
            _relPath.c_str(), _fs->name().c_str(), _devices.size());

    return save_locked();
}

bool DeviceStore::permanent() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _fs != nullptr;
}

bool DeviceStore::get(const DeviceKey& key, DeviceInfo& out) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _devices.find(key);
    if (it == _devices.end()) {
        return false;
    }
    out = it->second;
    return true;
}

bool DeviceStore::contains(const DeviceKey& key) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _devices.find(key) != _devices.end();
}

bool DeviceStore::set(const DeviceKey& key, const DeviceInfo& info)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _devices[key] = info;
    return save_locked();
}

bool DeviceStore::update(const std::vector<Entry>& entries)
{
    std::lock_guard<std::mutex> lock(_mutex);
    for (const auto& [key, info] : entries) {
        _devices[key] = info;
    }
    return save_locked();
}

std::size_t DeviceStore::seed_missing(const std::vector<Entry>& entries)
{
    std::lock_guard<std::mutex> lock(_mutex);

    std::size_t added = 0;
    for (const auto& [key, info] : entries) {
        if (_devices.emplace(key, info).second) {
            ++added;
        }
    }

    if (added > 0 && !save_locked()) {
        VM_LOGW(TAG, "Seeded %zu records in memory only", added);
    }
    return added;
}

void DeviceStore::for_each(const std::function<void(const DeviceKey&, const DeviceInfo&)>& fn) const
{
    std::vector<Entry> snapshot;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        snapshot.assign(_devices.begin(), _devices.end());
    }

    std::sort(snapshot.begin(), snapshot.end(), [](const Entry& a, const Entry& b) {
        if (a.first.identity != b.first.identity) return a.first.identity < b.first.identity;
        return a.first.device < b.first.device;
    });

    for (const auto& [key, info] : snapshot) {
        fn(key, info);
    }
}

std::size_t DeviceStore::size() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _devices.size();
}

bool DeviceStore::load_locked(fs::IFileSystem& vol, const std::string& relPath)
{
    auto file = vol.open(relPath, "rb");
    if (!file) {
        VM_LOGE(TAG, "Cannot open '%s' on '%s'", relPath.c_str(), vol.name().c_str());
        return false;
    }

    const std::string text = fs::read_all(*file);
    if (text.empty()) {
        return true;
    }

    std::vector<Entry> loaded;
    try {
        YAML::Node root = YAML::Load(text);
        if (auto devices = root["devices"]; devices && devices.IsSequence()) {
            for (const auto& n : devices) {
                DeviceKey key{};
                DeviceInfo info{};
                from_yaml(n, key, info);
                if (key.identity.empty() || key.device.empty()) {
                    VM_LOGW(TAG, "Skipping record without identity/device in '%s'", relPath.c_str());
                    continue;
                }
                loaded.emplace_back(std::move(key), std::move(info));
            }
        }
    } catch (const std::exception& ex) {
        VM_LOGE(TAG, "Failed to parse '%s' on '%s': %s",
                relPath.c_str(), vol.name().c_str(), ex.what());
        return false;
    }

    for (auto& [key, info] : loaded) {
        _devices[key] = std::move(info);
    }
    return true;
}

bool DeviceStore::save_locked()
{
    if (!_fs) {
        return true;
    }

    std::vector<const std::pair<const DeviceKey, DeviceInfo>*> ordered;
    ordered.reserve(_devices.size());
    for (const auto& kv : _devices) {
        ordered.push_back(&kv);
    }
    std::sort(ordered.begin(), ordered.end(), [](const auto* a, const auto* b) {
        if (a->first.identity != b->first.identity) return a->first.identity < b->first.identity;
        return a->first.device < b->first.device;
    });

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "devices" << YAML::Value << YAML::BeginSeq;
    for (const auto* kv : ordered) {
        to_yaml(out, kv->first, kv->second);
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    if (!out.good()) {
        VM_LOGE(TAG, "YAML emitter error: %s", out.GetLastError().c_str());
        return false;
    }

    if (!fs::write_file_atomic(*_fs, _relPath, out.c_str())) {
        VM_LOGE(TAG, "Failed to save '%s' on '%s'", _relPath.c_str(), _fs->name().c_str());
        return false;
    }
    return true;
}

} // namespace vmedia::media
