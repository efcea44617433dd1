#include "container.hpp"
#include "bytes.hpp"
#include "errors.hpp"
#include <algorithm>

namespace gcdisc {

void Container::checkRange(uint64_t offset, uint64_t count) const
{
    const uint64_t total = size();
    if (offset > total) {
        throw OutOfRangeError("Container offset " + bytes::hex(offset) + " is past the end (" + bytes::hex(total) + ")");
    }
    if (count > total - offset) {
        throw RangeExceededError("Container range " + bytes::hex(offset) + "+" + bytes::hex(count)
                                 + " crosses the end (" + bytes::hex(total) + ")");
    }
}

FileContainer::FileContainer(const std::string& filename, bool readOnly)
    : path(filename), writable(!readOnly)
{
    auto mode = std::ios::in | std::ios::binary;
    if (writable) mode |= std::ios::out;

    stream.open(filename, mode);
    if (!stream.is_open()) {
        throw IoError("Could not open file: " + filename);
    }

    stream.seekg(0, std::ios::end);
    const auto end = stream.tellg();
    if (end < 0) {
        throw IoError("Could not determine size of file: " + filename);
    }
    length = static_cast<uint64_t>(end);
    stream.seekg(0, std::ios::beg);
}

std::vector<uint8_t> FileContainer::read(uint64_t offset, uint64_t count) const
{
    checkRange(offset, count);
    std::vector<uint8_t> buffer(count);
    if (count == 0) return buffer;

    stream.clear();
    stream.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    stream.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(count));
    if (static_cast<uint64_t>(stream.gcount()) != count) {
        throw IoError("Short read from " + path + " at " + bytes::hex(offset));
    }
    return buffer;
}

void FileContainer::write(uint64_t offset, const std::vector<uint8_t>& data)
{
    if (!writable) {
        throw IoError("File was opened read-only: " + path);
    }
    checkRange(offset, data.size());
    if (data.empty()) return;

    stream.clear();
    stream.seekp(static_cast<std::streamoff>(offset), std::ios::beg);
    stream.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    stream.flush();
    if (!stream) {
        throw IoError("Write to " + path + " at " + bytes::hex(offset) + " failed");
    }
}

std::vector<uint8_t> MemoryContainer::read(uint64_t offset, uint64_t count) const
{
    checkRange(offset, count);
    return std::vector<uint8_t>(buffer.begin() + static_cast<std::ptrdiff_t>(offset),
                                buffer.begin() + static_cast<std::ptrdiff_t>(offset + count));
}

void MemoryContainer::write(uint64_t offset, const std::vector<uint8_t>& data)
{
    checkRange(offset, data.size());
    std::copy(data.begin(), data.end(), buffer.begin() + static_cast<std::ptrdiff_t>(offset));
}

} // namespace gcdisc
