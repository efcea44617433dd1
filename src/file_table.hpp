#pragma once
#include "byte_range_view.hpp"
#include "container.hpp"
#include "disc_layout.hpp"
#include <cstdint>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace gcdisc {

// Raw FST records. Entry 0 is the root directory.
struct FstDirectory {
    uint32_t nameOffset;
    uint32_t parentIndex;
    uint32_t endIndex;      ///< Index one past the last entry of this subtree
};

struct FstFile {
    uint32_t nameOffset;
    uint32_t offset;
    uint32_t size;
};

using FstEntry = std::variant<FstDirectory, FstFile>;

/**
 * @brief Lazy view of the files below a directory, in registry order.
 *
 * Yields paths relative to the directory, files of nested directories included
 * ("us/1padv.ssm" when listing "audio"). Iterating again starts over. Iterators
 * and the yielded views point into the FileTable and share its lifetime, not
 * the listing's.
 */
class DirectoryListing {
    const std::vector<FileEntry>* entries;
    std::shared_ptr<const std::string> prefix;

public:
    class iterator {
        const std::vector<FileEntry>* entries = nullptr;
        std::shared_ptr<const std::string> prefix;
        size_t position = 0;

        void skipNonMatching();

    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::string_view;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string_view*;
        using reference = std::string_view;

        iterator() = default;
        iterator(const std::vector<FileEntry>* files, std::shared_ptr<const std::string> directoryPrefix,
                 size_t start);

        std::string_view operator*() const;
        iterator& operator++();
        iterator operator++(int);
        bool operator==(const iterator& other) const { return position == other.position; }
        bool operator!=(const iterator& other) const { return !(*this == other); }
    };

    DirectoryListing(const std::vector<FileEntry>& files, std::string directoryPrefix)
        : entries(&files), prefix(std::make_shared<const std::string>(std::move(directoryPrefix))) {}

    iterator begin() const { return iterator(entries, prefix, 0); }
    iterator end() const { return iterator(entries, prefix, entries->size()); }

    // Drains the listing into owned strings.
    std::vector<std::string> toVector() const;
};

/**
 * @brief Ordered registry of every named byte range of the disc.
 *
 * Built once from the disc header and the FST and immutable afterwards.
 * Directories are not stored; a directory exists while any registered path
 * lies below it. Paths are byte strings using '/' as separator, without a
 * leading separator.
 *
 * A path that appears twice in a malformed FST keeps its first position and
 * takes the extent of the later occurrence.
 */
class FileTable {
    std::vector<FileEntry> entries;
    std::map<std::string, size_t, std::less<>> index;
    uint32_t entryCount = 0;
    uint64_t stringTable = 0;

    void add(FileEntry entry, uint64_t containerSize);
    void decodeFst(const Container& container, uint32_t fstOffset, uint32_t fstSize);

public:
    static constexpr uint32_t FST_ENTRY_SIZE = 0xC;

    /**
     * @brief Registry holding the privileged regions of @p layout followed by
     * every file listed in its FST.
     * @throws FormatError on a structurally invalid FST
     */
    static FileTable build(const Container& container, const DiscLayout& layout);

    // FST files only, without the privileged regions.
    static FileTable build(const Container& container, uint32_t fstOffset, uint32_t fstSize);

    /**
     * @brief Decode the raw entry table of an FST image (entry 0 first).
     * @throws FormatError if the table is truncated or its root is not a directory
     */
    static std::vector<FstEntry> decodeEntries(const std::vector<uint8_t>& fst);

    bool isFile(std::string_view path) const;
    bool isDirectory(std::string_view path) const;
    DirectoryListing listDirectory(std::string_view path) const;

    /// @throws NotFoundError if @p path is not registered
    const FileEntry& entry(std::string_view path) const;
    uint32_t fileOffset(std::string_view path) const { return entry(path).offset; }
    uint32_t fileSize(std::string_view path) const { return entry(path).size; }

    ByteRangeView open(Container& container, std::string_view path) const;

    size_t size() const { return entries.size(); }
    std::vector<FileEntry>::const_iterator begin() const { return entries.begin(); }
    std::vector<FileEntry>::const_iterator end() const { return entries.end(); }
    const std::vector<FileEntry>& files() const { return entries; }

    uint32_t numFstEntries() const { return entryCount; }
    uint64_t stringTableOffset() const { return stringTable; }

    // "", "/" -> "" (root); "audio" and "/audio/" -> "audio/"
    static std::string directoryPrefix(std::string_view path);
};

} // namespace gcdisc
