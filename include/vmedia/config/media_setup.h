#pragma once

#include "vmedia/config/vmedia_config.h"
#include "vmedia/media/device_catalog.h"
#include "vmedia/media/image_fetcher.h"

namespace vmedia::config {

// Fetch policy from config; out-of-range values fall back to the defaults.
media::FetchPolicy make_fetch_policy(const FetchConfig& cfg);

// Catalog in config order. Duplicate or unnamed devices are skipped.
media::DeviceCatalog make_device_catalog(const VmediaConfig& cfg);

} // namespace vmedia::config
