#pragma once
#include "byte_range_view.hpp"
#include "container.hpp"
#include "disc_layout.hpp"
#include "executable_layout.hpp"
#include "file_table.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace gcdisc {

/**
 * @brief An opened disc image: its container, header and file registry.
 *
 * Reads and writes go through ByteRangeView, so an internal file can be
 * patched in place but never resized.
 *
 *     DiscImage image("melee.iso");
 *     auto view = image.open("PlSs.dat");
 *     view.seek(0x1000);
 *     auto data = view.read(0x30);
 */
class DiscImage {
    std::unique_ptr<Container> container;
    DiscLayout discLayout;
    FileTable table;

public:
    explicit DiscImage(const std::string& filename, bool readOnly = false);
    explicit DiscImage(std::unique_ptr<Container> backing);

    const DiscLayout& layout() const { return discLayout; }
    const FileTable& files() const { return table; }
    Container& backing() { return *container; }

    /**
     * @brief Read @p count bytes at @p offset of an internal file. A negative
     * count reads to the end of the file.
     * @throws NotFoundError, OutOfRangeError, RangeExceededError
     */
    std::vector<uint8_t> readFile(std::string_view path, int64_t offset = 0, int64_t count = -1) const;

    /**
     * @brief Overwrite part of an internal file.
     * @return Number of bytes written
     * @throws NotFoundError, OutOfRangeError, RangeExceededError
     */
    size_t writeFile(std::string_view path, int64_t offset, const std::vector<uint8_t>& data);

    ByteRangeView open(std::string_view path);

    uint32_t fileOffset(std::string_view path) const { return table.fileOffset(path); }
    uint32_t fileSize(std::string_view path) const { return table.fileSize(path); }

    // Decode an internal file as a DOL; the main executable by default.
    ExecutableLayout executableLayout(std::string_view path = gcdisc::layout::EXECUTABLE_FILE) const;
};

} // namespace gcdisc
