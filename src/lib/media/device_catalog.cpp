#include "vmedia/media/device_catalog.h"

#include "vmedia/core/logging.h"

namespace vmedia::media {

static constexpr const char* TAG = "catalog";

DeviceCatalog::DeviceCatalog(std::vector<CatalogEntry> entries)
{
    for (auto& e : entries) {
        add(std::move(e));
    }
}

bool DeviceCatalog::add(CatalogEntry entry)
{
    if (entry.device.empty()) {
        VM_LOGW(TAG, "Ignoring catalog entry without a device name");
        return false;
    }
    if (find(entry.device)) {
        VM_LOGW(TAG, "Duplicate catalog entry '%s' ignored", entry.device.c_str());
        return false;
    }
    _entries.push_back(std::move(entry));
    return true;
}

const CatalogEntry* DeviceCatalog::find(std::string_view device) const
{
    for (const auto& e : _entries) {
        if (e.device == device) {
            return &e;
        }
    }
    return nullptr;
}

std::vector<std::string> DeviceCatalog::device_names() const
{
    std::vector<std::string> out;
    out.reserve(_entries.size());
    for (const auto& e : _entries) {
        out.push_back(e.device);
    }
    return out;
}

DeviceInfo DeviceCatalog::make_device_info(const CatalogEntry& entry)
{
    DeviceInfo info{};
    info.name = entry.name;
    info.mediaTypes = entry.mediaTypes;
    return info;
}

DeviceCatalog make_default_device_catalog()
{
    DeviceCatalog c;
    c.add(CatalogEntry{"Cd", "Virtual CD", {"CD", "DVD"}});
    c.add(CatalogEntry{"Floppy", "Virtual Removable Media", {"Floppy", "USBStick"}});
    return c;
}

} // namespace vmedia::media
