#include "vmedia/fs/file_io.h"

#include <cstdint>
#include <vector>

namespace vmedia::fs {

std::string read_all(IFile& file)
{
    std::string out;
    std::vector<std::uint8_t> buf(1024);

    for (;;) {
        std::size_t n = file.read(buf.data(), buf.size());
        if (n == 0) {
            break;
        }
        out.append(reinterpret_cast<const char*>(buf.data()), n);
    }
    return out;
}

bool write_all(IFile& file, std::string_view data)
{
    std::size_t offset = 0;
    while (offset < data.size()) {
        const std::size_t n = file.write(data.data() + offset, data.size() - offset);
        if (n == 0) {
            return false;
        }
        offset += n;
    }
    return true;
}

bool write_file_atomic(IFileSystem& fs, const std::string& path, std::string_view data)
{
    const std::string tmpPath = path + ".tmp";

    {
        auto file = fs.open(tmpPath, "wb");
        if (!file) {
            return false;
        }
        if (!write_all(*file, data) || !file->flush()) {
            file.reset();
            (void)fs.removeFile(tmpPath);
            return false;
        }
    } // closed before rename

    if (!fs.rename(tmpPath, path)) {
        (void)fs.removeFile(tmpPath);
        return false;
    }
    return true;
}

} // namespace vmedia::fs
