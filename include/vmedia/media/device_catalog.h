#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "vmedia/media/media_types.h"

namespace vmedia::media {

// Ordered set of device templates. Read-only once handed to the registry;
// entries are copied into each newly seen identity.
class DeviceCatalog {
public:
    DeviceCatalog() = default;
    explicit DeviceCatalog(std::vector<CatalogEntry> entries);

    // Returns false if the device name is empty or already present.
    bool add(CatalogEntry entry);

    const CatalogEntry* find(std::string_view device) const;

    // Device names in catalog order.
    std::vector<std::string> device_names() const;

    const std::vector<CatalogEntry>& entries() const noexcept { return _entries; }
    bool empty() const noexcept { return _entries.empty(); }
    std::size_t size() const noexcept { return _entries.size(); }

    // Fresh DeviceInfo seeded from the template.
    static DeviceInfo make_device_info(const CatalogEntry& entry);

private:
    std::vector<CatalogEntry> _entries;
};

// "Cd" (Virtual CD: CD, DVD) and "Floppy" (Virtual Removable Media: Floppy, USBStick).
DeviceCatalog make_default_device_catalog();

} // namespace vmedia::media
