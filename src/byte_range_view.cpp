#include "byte_range_view.hpp"
#include "errors.hpp"
#include <limits>
#include <string>

namespace gcdisc {

ByteRangeView::ByteRangeView(Container& backing, uint64_t baseOffset, uint32_t size)
    : container(&backing), base(baseOffset), extent(size)
{
    if (baseOffset > backing.size() || size > backing.size() - baseOffset) {
        throw RangeExceededError("Region " + std::to_string(baseOffset) + "+" + std::to_string(size)
                                 + " does not fit into the container");
    }
}

int64_t ByteRangeView::resolveCount(int64_t offset, int64_t count) const
{
    if (offset < 0) {
        throw OutOfRangeError("Offset must not be negative: " + std::to_string(offset));
    }
    if (offset >= static_cast<int64_t>(extent)) {
        throw OutOfRangeError("Offset " + std::to_string(offset) + " is out of region bounds (size "
                              + std::to_string(extent) + ")");
    }
    if (count < 0) {
        return static_cast<int64_t>(extent) - offset;
    }
    if (count > static_cast<int64_t>(extent) - offset) {
        throw RangeExceededError("Range " + std::to_string(offset) + "+" + std::to_string(count)
                                 + " exceeds region size " + std::to_string(extent));
    }
    return count;
}

std::vector<uint8_t> ByteRangeView::readAt(int64_t offset, int64_t count) const
{
    const int64_t n = resolveCount(offset, count);
    return container->read(base + static_cast<uint64_t>(offset), static_cast<uint64_t>(n));
}

size_t ByteRangeView::writeAt(int64_t offset, const std::vector<uint8_t>& data)
{
    // Regions are fixed size, so an oversized write is rejected rather than truncated.
    resolveCount(offset, static_cast<int64_t>(data.size()));
    container->write(base + static_cast<uint64_t>(offset), data);
    return data.size();
}

std::vector<uint8_t> ByteRangeView::read(int64_t count)
{
    auto data = readAt(cursor, count);
    cursor += static_cast<int64_t>(data.size());
    return data;
}

size_t ByteRangeView::write(const std::vector<uint8_t>& data)
{
    const size_t written = writeAt(cursor, data);
    cursor += static_cast<int64_t>(written);
    return written;
}

int64_t ByteRangeView::seek(int64_t offset, SeekWhence whence)
{
    int64_t origin = 0;
    switch (whence) {
        case SeekWhence::Start: origin = 0; break;
        case SeekWhence::Current: origin = cursor; break;
        case SeekWhence::End: origin = static_cast<int64_t>(extent); break;
        default:
            throw InvalidArgumentError("Whence must be Start, Current or End, got "
                                       + std::to_string(static_cast<int>(whence)));
    }

    constexpr int64_t highest = std::numeric_limits<int64_t>::max();
    constexpr int64_t lowest = std::numeric_limits<int64_t>::min();
    if ((offset > 0 && origin > highest - offset) || (offset < 0 && origin < lowest - offset)) {
        throw InvalidArgumentError("Seek by " + std::to_string(offset) + " from " + std::to_string(origin)
                                   + " overflows the cursor");
    }
    cursor = origin + offset;
    return cursor;
}

} // namespace gcdisc
