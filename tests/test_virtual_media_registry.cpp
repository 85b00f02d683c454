#include <doctest/doctest.h>

#include "fake_fs.h"
#include "fake_http.h"

#include "vmedia/fs/path_utils.h"
#include "vmedia/media/device_catalog.h"
#include "vmedia/media/device_store.h"
#include "vmedia/media/image_fetcher.h"
#include "vmedia/media/virtual_media_registry.h"

#include <atomic>
#include <cstdint>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace vmedia::tests {
namespace {

using media::DeviceInfo;
using media::DeviceKey;
using media::DeviceStore;
using media::ImageFetcher;
using media::ImageInfo;
using media::InsertOptions;
using media::MediaError;
using media::MediaResult;
using media::VirtualMediaRegistry;

struct RegistryHarness {
    MemoryFileSystem cache{"cache"};
    std::shared_ptr<HttpScript> script;
    DeviceStore store;
    ImageFetcher fetcher;
    VirtualMediaRegistry registry;

    explicit RegistryHarness(std::vector<ScriptedResponse> responses = {ok_response("IMAGE")})
        : script(std::make_shared<HttpScript>(std::move(responses)))
        , fetcher(cache, "/", make_scripted_registry(script), media::FetchPolicy{},
                  [](std::chrono::milliseconds) {})
        , registry(media::make_default_device_catalog(), store, fetcher)
    {}
};

} // namespace

TEST_CASE("VirtualMediaRegistry: driver and device list")
{
    RegistryHarness h;
    CHECK(std::string(h.registry.driver()) == "<static-vmedia>");
    const std::vector<std::string> expected{"Cd", "Floppy"};
    CHECK(h.registry.devices() == expected);
}

TEST_CASE("VirtualMediaRegistry: first access seeds every catalog device once")
{
    RegistryHarness h;
    CHECK(h.store.size() == 0);

    std::string name;
    REQUIRE(h.registry.device_name("srv-1", "Floppy", name).ok());
    CHECK(name == "Virtual Removable Media");
    CHECK(h.store.size() == 2);
    CHECK(h.store.contains(DeviceKey{"srv-1", "Cd"}));
    CHECK(h.store.contains(DeviceKey{"srv-1", "Floppy"}));

    std::vector<std::string> types;
    REQUIRE(h.registry.media_types("srv-1", "Cd", types).ok());
    const std::vector<std::string> expectedTypes{"CD", "DVD"};
    CHECK(types == expectedTypes);
    CHECK(h.store.size() == 2);

    REQUIRE(h.registry.device_name("srv-2", "Cd", name).ok());
    CHECK(name == "Virtual CD");
    CHECK(h.store.size() == 4);
}

TEST_CASE("VirtualMediaRegistry: seeding never overwrites existing records")
{
    RegistryHarness h;

    DeviceInfo custom{};
    custom.name = "Custom";
    custom.image = "http://example.com/keep.iso";
    custom.inserted = true;
    REQUIRE(h.store.set(DeviceKey{"srv-1", "Cd"}, custom));

    // Floppy is missing, so this lookup seeds; Cd must survive.
    std::string name;
    REQUIRE(h.registry.device_name("srv-1", "Floppy", name).ok());
    REQUIRE(h.registry.device_name("srv-1", "Cd", name).ok());
    CHECK(name == "Custom");

    ImageInfo info{};
    REQUIRE(h.registry.image_info("srv-1", "Cd", info).ok());
    CHECK(info.imagePath == "http://example.com/keep.iso");
    CHECK(info.inserted);
}

TEST_CASE("VirtualMediaRegistry: unknown device names are NotFound")
{
    RegistryHarness h;

    std::string name = "untouched";
    MediaResult r = h.registry.device_name("srv-1", "Tape", name);
    CHECK(r.error == MediaError::NotFound);
    CHECK(r.code == 404);
    CHECK(name == "untouched");

    // The identity was still seeded with the real devices.
    CHECK(h.store.size() == 2);

    r = h.registry.device_name("srv-1", "Tape", name);
    CHECK(r.error == MediaError::NotFound);

    std::string path;
    r = h.registry.insert_image("srv-1", "Tape", "http://example.com/a.iso", InsertOptions{}, path);
    CHECK(r.error == MediaError::NotFound);
    CHECK(h.script->request_count() == 0);

    CHECK(h.registry.eject_image("srv-9", "Tape").error == MediaError::NotFound);
}

TEST_CASE("VirtualMediaRegistry: unknown device names take no insert/eject lock")
{
    RegistryHarness h;

    for (int i = 0; i < 1000; ++i) {
        const std::string device = "bogus-" + std::to_string(i);
        CHECK(h.registry.eject_image("srv-1", device).error == MediaError::NotFound);
        std::string path;
        CHECK(h.registry.insert_image("srv-1", device, "http://example.com/a.iso", InsertOptions{}, path).error
              == MediaError::NotFound);
    }
    CHECK(h.registry.locked_key_count() == 0);
    CHECK(h.store.size() == 2);

    REQUIRE(h.registry.eject_image("srv-1", "Cd").ok());
    CHECK(h.registry.locked_key_count() == 1);
}

TEST_CASE("VirtualMediaRegistry: stored records outside the catalog are NotFound")
{
    RegistryHarness h;

    DeviceInfo tape{};
    tape.name = "Virtual Tape";
    tape.image = "http://example.com/old.tap";
    tape.inserted = true;
    REQUIRE(h.store.set(DeviceKey{"srv-1", "Tape"}, tape));

    std::string name;
    CHECK(h.registry.device_name("srv-1", "Tape", name).error == MediaError::NotFound);

    ImageInfo info{};
    CHECK(h.registry.image_info("srv-1", "Tape", info).error == MediaError::NotFound);
    CHECK(h.registry.eject_image("srv-1", "Tape").error == MediaError::NotFound);

    // The record itself is left alone.
    DeviceInfo stored{};
    REQUIRE(h.store.get(DeviceKey{"srv-1", "Tape"}, stored));
    CHECK(stored.inserted);
    CHECK(stored.image == "http://example.com/old.tap");
}

TEST_CASE("VirtualMediaRegistry: device name falls back to the identity")
{
    RegistryHarness h;

    DeviceInfo unnamed{};
    REQUIRE(h.store.set(DeviceKey{"srv-1", "Cd"}, unnamed));

    std::string name;
    REQUIRE(h.registry.device_name("srv-1", "Cd", name).ok());
    CHECK(name == "srv-1");
}

TEST_CASE("VirtualMediaRegistry: fresh devices report no media")
{
    RegistryHarness h;

    ImageInfo info{};
    REQUIRE(h.registry.image_info("srv-1", "Cd", info).ok());
    CHECK(info.imageName == "");
    CHECK(info.imagePath == "");
    CHECK_FALSE(info.inserted);
    CHECK_FALSE(info.writeProtected);
}

TEST_CASE("VirtualMediaRegistry: insert then eject")
{
    RegistryHarness h;
    const std::string url = "http://example.com/images/boot.iso";

    std::string localPath;
    REQUIRE(h.registry.insert_image("srv-1", "Cd", url, InsertOptions{true, false}, localPath).ok());
    CHECK(fs::base_name(localPath) == "boot.iso");
    CHECK(h.cache.file_text(localPath) == "IMAGE");

    ImageInfo info{};
    REQUIRE(h.registry.image_info("srv-1", "Cd", info).ok());
    CHECK(info.imagePath == url);
    CHECK(info.inserted);
    CHECK_FALSE(info.writeProtected);

    DeviceInfo rec{};
    REQUIRE(h.store.get(DeviceKey{"srv-1", "Cd"}, rec));
    CHECK(rec.localFilePath == localPath);

    REQUIRE(h.registry.eject_image("srv-1", "Cd").ok());

    REQUIRE(h.registry.image_info("srv-1", "Cd", info).ok());
    CHECK(info.imageName == "");
    CHECK(info.imagePath == "");
    CHECK_FALSE(info.inserted);
    CHECK_FALSE(info.writeProtected);

    CHECK_FALSE(h.cache.exists(localPath));
    CHECK_FALSE(h.cache.exists(fs::parent_path(localPath)));
    REQUIRE(h.store.get(DeviceKey{"srv-1", "Cd"}, rec));
    CHECK(rec.localFilePath == "");
}

TEST_CASE("VirtualMediaRegistry: insert defaults to inserted and write protected")
{
    RegistryHarness h;

    std::string localPath;
    REQUIRE(h.registry.insert_image("srv-1", "Floppy", "http://example.com/f.img", InsertOptions{}, localPath).ok());

    ImageInfo info{};
    REQUIRE(h.registry.image_info("srv-1", "Floppy", info).ok());
    CHECK(info.inserted);
    CHECK(info.writeProtected);
}

TEST_CASE("VirtualMediaRegistry: insert keeps the previous image name")
{
    RegistryHarness h;

    DeviceInfo seeded = media::DeviceCatalog::make_device_info(*media::make_default_device_catalog().find("Cd"));
    seeded.imageName = "Old Disc";
    REQUIRE(h.store.set(DeviceKey{"srv-1", "Cd"}, seeded));

    std::string localPath;
    REQUIRE(h.registry.insert_image("srv-1", "Cd", "http://example.com/new.iso", InsertOptions{}, localPath).ok());

    ImageInfo info{};
    REQUIRE(h.registry.image_info("srv-1", "Cd", info).ok());
    CHECK(info.imageName == "Old Disc");
    CHECK(info.imagePath == "http://example.com/new.iso");
}

TEST_CASE("VirtualMediaRegistry: failed insert leaves state untouched")
{
    RegistryHarness h({error_response(503)});

    std::string localPath = "untouched";
    const MediaResult r = h.registry.insert_image("srv-1", "Cd", "http://example.com/a.iso", InsertOptions{}, localPath);

    CHECK(r.error == MediaError::FetchFailed);
    CHECK(r.code == 502);
    CHECK(localPath == "untouched");

    ImageInfo info{};
    REQUIRE(h.registry.image_info("srv-1", "Cd", info).ok());
    CHECK(info.imagePath == "");
    CHECK_FALSE(info.inserted);
    CHECK(h.cache.file_count() == 0);
}

TEST_CASE("VirtualMediaRegistry: failed re-insert keeps the current media")
{
    std::uint16_t status = 0;
    std::uint16_t expectedCode = 0;
    SUBCASE("client error") {
        status = 404;
        expectedCode = 400;
    }
    SUBCASE("server error") {
        status = 503;
        expectedCode = 502;
    }

    RegistryHarness h({ok_response("FIRST"), error_response(status)});

    InsertOptions opts{};
    opts.writeProtected = false;
    std::string first;
    REQUIRE(h.registry.insert_image("srv-1", "Cd", "http://example.com/one.iso", opts, first).ok());

    std::string second = "untouched";
    const MediaResult r = h.registry.insert_image("srv-1", "Cd", "http://example.com/two.iso", InsertOptions{}, second);
    CHECK(r.error == MediaError::FetchFailed);
    CHECK(r.code == expectedCode);
    CHECK(second == "untouched");
    CHECK(h.script->request_count() == 6);

    DeviceInfo info{};
    REQUIRE(h.registry.device_info("srv-1", "Cd", info).ok());
    CHECK(info.image == "http://example.com/one.iso");
    CHECK(info.inserted);
    CHECK_FALSE(info.writeProtected);
    CHECK(info.localFilePath == first);

    CHECK(h.cache.file_text(first) == "FIRST");
    CHECK(h.cache.file_count() == 1);
}

TEST_CASE("VirtualMediaRegistry: a new insert replaces the previous local copy")
{
    RegistryHarness h({ok_response("FIRST"), ok_response("SECOND")});

    std::string first;
    std::string second;
    REQUIRE(h.registry.insert_image("srv-1", "Cd", "http://example.com/one.iso", InsertOptions{}, first).ok());
    REQUIRE(h.registry.insert_image("srv-1", "Cd", "http://example.com/two.iso", InsertOptions{}, second).ok());

    CHECK(first != second);
    CHECK_FALSE(h.cache.exists(first));
    CHECK(h.cache.file_text(second) == "SECOND");
    CHECK(h.cache.file_count() == 1);
}

TEST_CASE("VirtualMediaRegistry: eject survives a failed file deletion")
{
    RegistryHarness h;

    std::string localPath;
    REQUIRE(h.registry.insert_image("srv-1", "Cd", "http://example.com/a.iso", InsertOptions{}, localPath).ok());

    h.cache.failRemoveFile = true;
    REQUIRE(h.registry.eject_image("srv-1", "Cd").ok());

    ImageInfo info{};
    REQUIRE(h.registry.image_info("srv-1", "Cd", info).ok());
    CHECK(info.imagePath == "");
    CHECK_FALSE(info.inserted);

    DeviceInfo rec{};
    REQUIRE(h.store.get(DeviceKey{"srv-1", "Cd"}, rec));
    CHECK(rec.localFilePath == "");
}

TEST_CASE("VirtualMediaRegistry: eject without media succeeds")
{
    RegistryHarness h;
    CHECK(h.registry.eject_image("srv-1", "Floppy").ok());
}

TEST_CASE("VirtualMediaRegistry: empty URL is rejected")
{
    RegistryHarness h;

    std::string localPath;
    const MediaResult r = h.registry.insert_image("srv-1", "Cd", "", InsertOptions{}, localPath);
    CHECK(r.error == MediaError::InvalidRequest);
    CHECK(r.code == 400);
}

TEST_CASE("VirtualMediaRegistry: concurrent inserts on different keys do not interfere")
{
    RegistryHarness h;

    constexpr int kIdentities = 8;
    std::vector<std::thread> threads;
    std::atomic<int> failures{0};

    for (int i = 0; i < kIdentities; ++i) {
        threads.emplace_back([&h, &failures, i] {
            const std::string identity = "srv-" + std::to_string(i);
            for (const char* device : {"Cd", "Floppy"}) {
                const std::string url = "http://example.com/" + identity + "/" + device + ".iso";
                std::string localPath;
                if (!h.registry.insert_image(identity, device, url, InsertOptions{}, localPath).ok()) {
                    ++failures;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    CHECK(failures.load() == 0);
    CHECK(h.store.size() == kIdentities * 2);

    for (int i = 0; i < kIdentities; ++i) {
        const std::string identity = "srv-" + std::to_string(i);
        for (const char* device : {"Cd", "Floppy"}) {
            ImageInfo info{};
            REQUIRE(h.registry.image_info(identity, device, info).ok());
            CHECK(info.imagePath == "http://example.com/" + identity + "/" + device + ".iso");
            CHECK(info.inserted);
        }
    }
}

TEST_CASE("VirtualMediaRegistry: concurrent inserts on one key leave one complete write")
{
    RegistryHarness h;

    constexpr int kWriters = 6;
    std::vector<std::thread> threads;
    for (int i = 0; i < kWriters; ++i) {
        threads.emplace_back([&h, i] {
            InsertOptions opts{};
            opts.writeProtected = (i % 2) == 0;
            std::string localPath;
            (void)h.registry.insert_image("srv-1", "Cd", "http://example.com/w" + std::to_string(i) + ".iso",
                                          opts, localPath);
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    DeviceInfo rec{};
    REQUIRE(h.store.get(DeviceKey{"srv-1", "Cd"}, rec));

    int matched = -1;
    for (int i = 0; i < kWriters; ++i) {
        if (rec.image == "http://example.com/w" + std::to_string(i) + ".iso") {
            matched = i;
        }
    }
    REQUIRE(matched >= 0);
    CHECK(rec.writeProtected == ((matched % 2) == 0));
    CHECK(fs::base_name(rec.localFilePath) == "w" + std::to_string(matched) + ".iso");
    CHECK(h.cache.exists(rec.localFilePath));
    // Every superseded copy was removed.
    CHECK(h.cache.file_count() == 1);
}

} // namespace vmedia::tests
