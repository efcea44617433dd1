#pragma once
#include "container.hpp"
#include <cstdint>
#include <vector>

namespace gcdisc {

enum class SeekWhence {
    Start = 0,
    Current = 1,
    End = 2
};

/**
 * @brief Bounds-checked window [baseOffset, baseOffset + extent) into a Container.
 *
 * All offsets taken by this class are local to the window. The extent is fixed:
 * no read or write may reach past it, and a write can never grow the region.
 * The cursor may be seeked anywhere (including before 0 or past the end);
 * reads and writes from such a position fail. A failed read or write does not
 * move the cursor.
 *
 * The view does not own the container and must not outlive it.
 */
class ByteRangeView {
    Container* container;
    uint64_t base;
    uint32_t extent;
    int64_t cursor = 0;

    int64_t resolveCount(int64_t offset, int64_t count) const;

public:
    ByteRangeView(Container& backing, uint64_t baseOffset, uint32_t size);

    /**
     * @brief Read @p count bytes at @p offset. A negative count reads to the end.
     * @throws OutOfRangeError if offset < 0 or offset >= size()
     * @throws RangeExceededError if offset + count > size()
     */
    std::vector<uint8_t> readAt(int64_t offset, int64_t count = -1) const;

    /**
     * @brief Overwrite bytes at @p offset.
     * @return Number of bytes written
     * @throws OutOfRangeError if offset < 0 or offset >= size()
     * @throws RangeExceededError if offset + data.size() > size()
     */
    size_t writeAt(int64_t offset, const std::vector<uint8_t>& data);

    // Cursor-relative forms of readAt/writeAt.
    std::vector<uint8_t> read(int64_t count = -1);
    size_t write(const std::vector<uint8_t>& data);

    /**
     * @brief Move the cursor.
     * @return The new cursor position
     * @throws InvalidArgumentError for an unknown whence value, or if the new
     * position does not fit into int64_t (the cursor is left unchanged)
     */
    int64_t seek(int64_t offset, SeekWhence whence = SeekWhence::Start);
    int64_t tell() const { return cursor; }

    uint32_t size() const { return extent; }
    uint64_t baseOffset() const { return base; }
};

} // namespace gcdisc
