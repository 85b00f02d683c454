#include "vmedia/config/media_setup.h"

#include "vmedia/core/logging.h"

namespace vmedia::config {

static constexpr const char* TAG = "config";

media::FetchPolicy make_fetch_policy(const FetchConfig& cfg)
{
    media::FetchPolicy p{};

    if (cfg.maxAttempts >= 1) {
        p.maxAttempts = cfg.maxAttempts;
    } else {
        VM_LOGW(TAG, "fetch.max_attempts=%d ignored", cfg.maxAttempts);
    }

    if (cfg.initialBackoffMs >= 0) {
        p.initialBackoff = std::chrono::milliseconds(cfg.initialBackoffMs);
    } else {
        VM_LOGW(TAG, "fetch.initial_backoff_ms=%d ignored", cfg.initialBackoffMs);
    }

    if (cfg.backoffMultiplier >= 1) {
        p.backoffMultiplier = cfg.backoffMultiplier;
    } else {
        VM_LOGW(TAG, "fetch.backoff_multiplier=%d ignored", cfg.backoffMultiplier);
    }

    if (cfg.timeoutSeconds > 0) {
        p.timeout = std::chrono::seconds(cfg.timeoutSeconds);
    } else {
        VM_LOGW(TAG, "fetch.timeout_s=%d ignored", cfg.timeoutSeconds);
    }

    if (cfg.chunkSize > 0) {
        p.chunkSize = static_cast<std::size_t>(cfg.chunkSize);
    } else {
        VM_LOGW(TAG, "fetch.chunk_size=%d ignored", cfg.chunkSize);
    }

    p.verifyTls = cfg.verifyTls;

    if (!cfg.defaultFileName.empty()) {
        p.defaultFileName = cfg.defaultFileName;
    }

    return p;
}

media::DeviceCatalog make_device_catalog(const VmediaConfig& cfg)
{
    media::DeviceCatalog catalog;
    for (const auto& d : cfg.devices) {
        (void)catalog.add(media::CatalogEntry{d.device, d.name, d.mediaTypes});
    }
    return catalog;
}

} // namespace vmedia::config
