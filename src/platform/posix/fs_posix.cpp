#include "vmedia/fs/filesystem.h"
#include "vmedia/fs/path_utils.h"
#include "vmedia/platform/posix/fs_factory.h"
#include "vmedia/core/logging.h"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

namespace vmedia::platform::posix {

namespace {

using vmedia::fs::FileInfo;
using vmedia::fs::FileSystemKind;
using vmedia::fs::IFile;
using vmedia::fs::IFileSystem;

static constexpr const char* TAG = "fs";

// Prefix for names produced by createTempFile / createTempDirectory.
static constexpr const char* TEMP_PREFIX = "vmedia-";

// ----------------------
// PosixFile
// ----------------------

class PosixFile : public IFile {
public:
    explicit PosixFile(std::FILE* fp)
        : _fp(fp)
    {}

    ~PosixFile() override {
        if (_fp) {
            std::fclose(_fp);
        }
    }

    PosixFile(const PosixFile&) = delete;
    PosixFile& operator=(const PosixFile&) = delete;

    std::size_t read(void* dst, std::size_t maxBytes) override
    {
        if (!_fp || maxBytes == 0) {
            return 0;
        }
        return std::fread(dst, 1, maxBytes, _fp);
    }

    std::size_t write(const void* src, std::size_t bytes) override
    {
        if (!_fp || bytes == 0) {
            return 0;
        }
        return std::fwrite(src, 1, bytes, _fp);
    }

    bool seek(std::uint64_t offset) override
    {
        if (!_fp) {
            return false;
        }
        return ::fseeko(_fp, static_cast<off_t>(offset), SEEK_SET) == 0;
    }

    std::uint64_t tell() const override
    {
        if (!_fp) {
            return 0;
        }
        auto pos = ::ftello(_fp);
        if (pos < 0) {
            return 0;
        }
        return static_cast<std::uint64_t>(pos);
    }

    bool flush() override
    {
        if (!_fp) {
            return false;
        }
        return std::fflush(_fp) == 0;
    }

private:
    std::FILE* _fp{nullptr};
};

// ----------------------
// PosixFileSystem
// ----------------------

class PosixFileSystem : public IFileSystem {
public:
    PosixFileSystem(std::string root, std::string name)
        : _root(std::move(root))
        , _name(std::move(name))
    {
        // Normalize root: remove trailing slash if present.
        while (_root.size() > 1 && _root.back() == '/') {
            _root.pop_back();
        }
    }

    FileSystemKind kind() const override {
        return FileSystemKind::HostPosix;
    }

    std::string name() const override {
        return _name;
    }

    bool exists(const std::string& path) override
    {
        struct stat st{};
        return ::stat(toFullPath(path).c_str(), &st) == 0;
    }

    bool isDirectory(const std::string& path) override
    {
        struct stat st{};
        if (::stat(toFullPath(path).c_str(), &st) != 0) {
            return false;
        }
        return S_ISDIR(st.st_mode);
    }

    bool createDirectory(const std::string& path) override
    {
        auto full = toFullPath(path);
        if (::mkdir(full.c_str(), 0777) == 0) {
            return true;
        }
        // Already exists and is dir is considered success.
        if (errno == EEXIST) {
            return isDirectory(path);
        }
        return false;
    }

    bool removeFile(const std::string& path) override
    {
        auto full = toFullPath(path);
        if (::unlink(full.c_str()) != 0) {
            VM_LOGD(TAG, "unlink '%s' failed: %s", full.c_str(), std::strerror(errno));
            return false;
        }
        return true;
    }

    bool removeDirectory(const std::string& path) override
    {
        auto full = toFullPath(path);
        return ::rmdir(full.c_str()) == 0;
    }

    bool rename(const std::string& from, const std::string& to) override
    {
        auto src = toFullPath(from);
        auto dst = toFullPath(to);
        if (::rename(src.c_str(), dst.c_str()) != 0) {
            VM_LOGD(TAG, "rename '%s' -> '%s' failed: %s", src.c_str(), dst.c_str(), std::strerror(errno));
            return false;
        }
        return true;
    }

    std::unique_ptr<IFile> open(const std::string& path, const char* mode) override
    {
        if (!mode) {
            return nullptr;
        }
        auto full = toFullPath(path);
        std::FILE* fp = std::fopen(full.c_str(), mode);
        if (!fp) {
            return nullptr;
        }
        return std::make_unique<PosixFile>(fp);
    }

    std::unique_ptr<IFile> createTempFile(const std::string& dir, std::string& outPath) override
    {
        const std::string rel = vmedia::fs::join_paths(dir, std::string(TEMP_PREFIX) + "XXXXXX");
        std::string full = toFullPath(rel);

        // mkstemp rewrites the trailing XXXXXX in place.
        std::vector<char> tmpl(full.begin(), full.end());
        tmpl.push_back('\0');

        const int fd = ::mkstemp(tmpl.data());
        if (fd < 0) {
            VM_LOGE(TAG, "mkstemp in '%s' failed: %s", full.c_str(), std::strerror(errno));
            return nullptr;
        }

        std::FILE* fp = ::fdopen(fd, "w+b");
        if (!fp) {
            VM_LOGE(TAG, "fdopen failed: %s", std::strerror(errno));
            ::close(fd);
            ::unlink(tmpl.data());
            return nullptr;
        }

        outPath = vmedia::fs::join_paths(dir, vmedia::fs::base_name(tmpl.data()));
        return std::make_unique<PosixFile>(fp);
    }

    bool createTempDirectory(const std::string& dir, std::string& outPath) override
    {
        const std::string rel = vmedia::fs::join_paths(dir, std::string(TEMP_PREFIX) + "XXXXXX");
        std::string full = toFullPath(rel);

        std::vector<char> tmpl(full.begin(), full.end());
        tmpl.push_back('\0');

        if (::mkdtemp(tmpl.data()) == nullptr) {
            VM_LOGE(TAG, "mkdtemp in '%s' failed: %s", full.c_str(), std::strerror(errno));
            return false;
        }

        outPath = vmedia::fs::join_paths(dir, vmedia::fs::base_name(tmpl.data()));
        return true;
    }

    bool stat(const std::string& path, FileInfo& outInfo) override
    {
        struct stat st{};
        if (::stat(toFullPath(path).c_str(), &st) != 0) {
            return false;
        }
        outInfo.path = path;
        outInfo.isDirectory = S_ISDIR(st.st_mode);
        outInfo.sizeBytes = S_ISREG(st.st_mode) ? static_cast<std::uint64_t>(st.st_size) : 0;
        outInfo.modifiedTime = std::chrono::system_clock::from_time_t(st.st_mtime);
        return true;
    }

    bool listDirectory(const std::string& path, std::vector<FileInfo>& outEntries) override
    {
        auto full = toFullPath(path);
        DIR* dir = ::opendir(full.c_str());
        if (!dir) {
            return false;
        }

        outEntries.clear();

        while (auto* ent = ::readdir(dir)) {
            const char* name = ent->d_name;

            // Skip "." and ".."
            if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) {
                continue;
            }

            FileInfo info{};
            std::string relPath = vmedia::fs::join_paths(path, name);
            if (!stat(relPath, info)) {
                info.path = relPath;
            }
            outEntries.push_back(std::move(info));
        }

        ::closedir(dir);
        return true;
    }

private:
    std::string toFullPath(const std::string& path) const
    {
        // Normalize: empty or "." -> root
        if (path.empty() || path == "." || path == "/") {
            return _root;
        }
        if (path.front() == '/') {
            return _root + path;
        }
        return _root + "/" + path;
    }

    std::string _root;  // host directory backing this volume, e.g. "./vmedia-state"
    std::string _name;  // logical name, e.g. "state" or "cache"
};

} // namespace

std::unique_ptr<vmedia::fs::IFileSystem>
create_host_filesystem(const std::string& rootDir, const std::string& name)
{
    if (rootDir.empty()) {
        VM_LOGE(TAG, "Refusing to create host filesystem '%s' with empty root", name.c_str());
        return nullptr;
    }

    std::error_code ec;
    std::filesystem::create_directories(rootDir, ec);
    if (ec) {
        VM_LOGE(TAG, "Cannot create root '%s' for '%s': %s",
                rootDir.c_str(), name.c_str(), ec.message().c_str());
        return nullptr;
    }

    return std::make_unique<PosixFileSystem>(rootDir, name);
}

} // namespace vmedia::platform::posix
