#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "vmedia/fs/filesystem.h"

namespace vmedia::tests {

class MemoryFile final : public vmedia::fs::IFile {
public:
    MemoryFile(std::vector<std::uint8_t>& bytes, bool readOnly, bool failWrites)
        : _bytes(bytes), _readOnly(readOnly), _failWrites(failWrites) {}

    std::size_t read(void* dst, std::size_t maxBytes) override
    {
        if (!dst) return 0;
        if (_pos >= _bytes.size()) return 0;
        const std::size_t n = std::min<std::size_t>(maxBytes, _bytes.size() - _pos);
        std::memcpy(dst, _bytes.data() + _pos, n);
        _pos += n;
        return n;
    }

    std::size_t write(const void* src, std::size_t bytes) override
    {
        if (_readOnly || _failWrites || !src) return 0;
        if (_pos + bytes > _bytes.size()) {
            _bytes.resize(_pos + bytes);
        }
        std::memcpy(_bytes.data() + _pos, src, bytes);
        _pos += bytes;
        return bytes;
    }

    bool seek(std::uint64_t offset) override
    {
        if (offset > _bytes.size()) {
            if (_readOnly) return false;
            _bytes.resize(static_cast<std::size_t>(offset), 0);
        }
        _pos = static_cast<std::size_t>(offset);
        return true;
    }

    std::uint64_t tell() const override { return _pos; }
    bool flush() override { return !_failWrites; }

private:
    std::vector<std::uint8_t>& _bytes;
    bool _readOnly{true};
    bool _failWrites{false};
    std::size_t _pos{0};
};

// In-memory IFileSystem with switches for injecting failures.
// Map operations are serialized; open files are not.
class MemoryFileSystem final : public vmedia::fs::IFileSystem {
public:
    explicit MemoryFileSystem(std::string name)
        : _name(std::move(name))
    {
        _dirs.insert("/");
    }

    // Fault injection.
    bool failWrites{false};
    bool failRename{false};
    bool failCreateTemp{false};
    bool failRemoveFile{false};

    vmedia::fs::FileSystemKind kind() const override { return vmedia::fs::FileSystemKind::Memory; }
    std::string name() const override { return _name; }

    bool exists(const std::string& path) override
    {
        std::lock_guard<std::mutex> lock(_mutex);
        const std::string p = norm(path);
        return is_dir_path(p) || _files.count(p) > 0;
    }

    bool isDirectory(const std::string& path) override
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return is_dir_path(norm(path));
    }

    bool createDirectory(const std::string& path) override
    {
        std::lock_guard<std::mutex> lock(_mutex);
        const std::string p = norm(path);
        if (is_dir_path(p)) return true;
        if (!is_dir_path(parent_path(p))) return false;
        _dirs.insert(p);
        return true;
    }

    bool removeFile(const std::string& path) override
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (failRemoveFile) return false;
        return _files.erase(norm(path)) > 0;
    }

    bool removeDirectory(const std::string& path) override
    {
        std::lock_guard<std::mutex> lock(_mutex);
        const std::string p = norm(path);
        if (p == "/" || !is_dir_path(p)) return false;
        for (const auto& d : _dirs) {
            if (d != p && parent_path(d) == p) return false;
        }
        for (const auto& kv : _files) {
            if (parent_path(kv.first) == p) return false;
        }
        _dirs.erase(p);
        return true;
    }

    bool rename(const std::string& from, const std::string& to) override
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (failRename) return false;
        const std::string f = norm(from);
        const std::string t = norm(to);
        auto it = _files.find(f);
        if (it == _files.end()) return false;
        if (!is_dir_path(parent_path(t))) return false;
        auto bytes = std::move(it->second);
        _files.erase(it);
        _files[t] = std::move(bytes);
        return true;
    }

    std::unique_ptr<vmedia::fs::IFile> open(const std::string& path, const char* mode) override
    {
        std::lock_guard<std::mutex> lock(_mutex);
        const std::string m = mode ? std::string(mode) : std::string();
        const bool wantWrite = m.find_first_of("wa+") != std::string::npos;

        const std::string p = norm(path);
        if (is_dir_path(p)) {
            return nullptr;
        }
        auto it = _files.find(p);
        if (m.find('w') != std::string::npos) {
            if (!is_dir_path(parent_path(p))) return nullptr;
            it = _files.insert_or_assign(p, std::vector<std::uint8_t>{}).first;
        } else if (it == _files.end()) {
            return nullptr;
        }

        return std::make_unique<MemoryFile>(it->second, !wantWrite, failWrites);
    }

    std::unique_ptr<vmedia::fs::IFile> createTempFile(const std::string& dir, std::string& outPath) override
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (failCreateTemp) return nullptr;
        const std::string d = norm(dir);
        if (!is_dir_path(d)) return nullptr;
        outPath = join(d, "tmp" + std::to_string(++_counter));
        auto it = _files.emplace(outPath, std::vector<std::uint8_t>{}).first;
        return std::make_unique<MemoryFile>(it->second, false, failWrites);
    }

    bool createTempDirectory(const std::string& dir, std::string& outPath) override
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (failCreateTemp) return false;
        const std::string d = norm(dir);
        if (!is_dir_path(d)) return false;
        outPath = join(d, "dir" + std::to_string(++_counter));
        _dirs.insert(outPath);
        return true;
    }

    bool stat(const std::string& path, vmedia::fs::FileInfo& outInfo) override
    {
        std::lock_guard<std::mutex> lock(_mutex);
        const std::string p = norm(path);
        if (is_dir_path(p)) {
            outInfo.path = p;
            outInfo.isDirectory = true;
            outInfo.sizeBytes = 0;
            return true;
        }
        auto it = _files.find(p);
        if (it == _files.end()) return false;
        outInfo.path = p;
        outInfo.isDirectory = false;
        outInfo.sizeBytes = it->second.size();
        return true;
    }

    bool listDirectory(const std::string& path, std::vector<vmedia::fs::FileInfo>& out) override
    {
        std::lock_guard<std::mutex> lock(_mutex);
        const std::string p = norm(path);
        if (!is_dir_path(p)) return false;
        out.clear();

        for (const auto& d : _dirs) {
            if (d == "/" || parent_path(d) != p) continue;
            out.push_back(vmedia::fs::FileInfo{d, true, 0, {}});
        }
        for (const auto& kv : _files) {
            if (parent_path(kv.first) != p) continue;
            out.push_back(vmedia::fs::FileInfo{kv.first, false, kv.second.size(), {}});
        }
        return true;
    }

    // ---- test helpers ----

    bool create_file(const std::string& path, const std::string& content)
    {
        std::lock_guard<std::mutex> lock(_mutex);
        const std::string p = norm(path);
        if (is_dir_path(p) || !is_dir_path(parent_path(p))) return false;
        _files[p] = std::vector<std::uint8_t>(content.begin(), content.end());
        return true;
    }

    std::string file_text(const std::string& path) const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _files.find(norm(path));
        if (it == _files.end()) return {};
        return std::string(it->second.begin(), it->second.end());
    }

    std::size_t file_count() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _files.size();
    }

    // Directories other than the root.
    std::size_t dir_count() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _dirs.size() - 1;
    }

private:
    static std::string norm(const std::string& in)
    {
        if (in.empty()) return "/";
        std::string out = in[0] == '/' ? in : "/" + in;
        while (out.size() > 1 && out.back() == '/') out.pop_back();
        return out;
    }

    static std::string parent_path(const std::string& abs)
    {
        const std::size_t slash = abs.find_last_of('/');
        if (slash == std::string::npos || slash == 0) return "/";
        return abs.substr(0, slash);
    }

    static std::string join(const std::string& dir, const std::string& name)
    {
        return dir == "/" ? "/" + name : dir + "/" + name;
    }

    bool is_dir_path(const std::string& abs) const { return _dirs.count(abs) > 0; }

    mutable std::mutex _mutex;
    std::string _name;
    std::map<std::string, std::vector<std::uint8_t>> _files;
    std::set<std::string> _dirs;
    int _counter{0};
};

} // namespace vmedia::tests
