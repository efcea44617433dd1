#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gcdisc {

enum class SectionKind {
    Text,
    Data
};

std::string to_string(SectionKind kind);

/**
 * @brief A contiguous chunk of the DOL that the loader copies to memAddress.
 * Both end values point right after the section.
 */
struct ExecutableSection {
    uint32_t index;         ///< Slot index within its kind (text 0-5, data 0-9)
    SectionKind kind;
    uint32_t fileOffset;
    uint32_t memAddress;
    uint32_t size;

    uint32_t endFileOffset() const { return fileOffset + size; }
    uint32_t endMemAddress() const { return memAddress + size; }

    // True if other starts exactly where this one ends, on disk and in memory.
    bool isImmediatelyBefore(const ExecutableSection& other) const {
        return endFileOffset() == other.fileOffset && endMemAddress() == other.memAddress;
    }

    bool operator==(const ExecutableSection&) const = default;
};

namespace dol {
    constexpr size_t TEXT_SLOTS = 6;
    constexpr size_t DATA_SLOTS = 10;

    constexpr size_t TEXT_OFFSETS = 0x00;
    constexpr size_t DATA_OFFSETS = 0x1C;
    constexpr size_t TEXT_ADDRESSES = 0x48;
    constexpr size_t DATA_ADDRESSES = 0x64;
    constexpr size_t TEXT_SIZES = 0x90;
    constexpr size_t DATA_SIZES = 0xAC;
    constexpr size_t BSS_ADDRESS = 0xD8;
    constexpr size_t BSS_SIZE = 0xDC;
    constexpr size_t ENTRY_POINT = 0xE0;
    constexpr size_t HEADER_END = 0xE4;

    constexpr uint32_t BODY_OFFSET = 0x100;
}

/**
 * @brief Section table of a DOL executable.
 *
 * The loader copies each section from its file offset to its memory address.
 * Sections keep their order on disk but may be permuted and spaced out in
 * memory; the contiguity queries find out whether a file range still forms one
 * gap-free block after loading.
 */
class ExecutableLayout {
    std::vector<ExecutableSection> sectionList;
    std::vector<size_t> byFileOffset;      ///< Permutation of sectionList, stable by fileOffset
    std::vector<size_t> byMemAddress;      ///< Permutation of sectionList, stable by memAddress
    std::vector<size_t> fileRank;          ///< Inverse of byFileOffset
    std::vector<size_t> memRank;           ///< Inverse of byMemAddress

    std::optional<size_t> indexContainingFileOffset(uint32_t fileOffset) const;
    std::optional<size_t> indexContainingMemAddress(uint32_t memAddress) const;

public:
    uint32_t bssMemAddress = 0;
    uint32_t bssSize = 0;
    uint32_t entryPoint = 0;
    uint32_t bodyOffset = dol::BODY_OFFSET;

    /**
     * @brief Decode a DOL header.
     *
     * Per kind, slots are read in ascending order and the first slot with a
     * zero offset, address or size ends that kind's list.
     *
     * @throws FormatError if @p image is shorter than the header or a section
     * reaches past the 32-bit space
     */
    static ExecutableLayout parse(const std::vector<uint8_t>& image);

    // Text sections in slot order, then data sections in slot order.
    const std::vector<ExecutableSection>& sections() const { return sectionList; }
    std::vector<ExecutableSection> sectionsByFileOffset() const;
    std::vector<ExecutableSection> sectionsByMemAddress() const;

    std::optional<ExecutableSection> sectionContainingMemAddress(uint32_t memAddress) const;
    std::optional<ExecutableSection> sectionContainingFileOffset(uint32_t fileOffset) const;

    std::optional<uint32_t> fileOffsetForMemAddress(uint32_t memAddress) const;
    std::optional<uint32_t> memAddressForFileOffset(uint32_t fileOffset) const;

    /**
     * @brief Whether [start, endExclusive) of the file is loaded as one gap-free
     * block of memory, in the same order.
     *
     * endExclusive itself need not be mapped.
     * @return nullopt if @p start does not belong to any section
     */
    std::optional<bool> isRangeContiguousByFileOffset(uint32_t start, uint32_t endExclusive) const;

    // Same question, asked with memory addresses. nullopt if either end is unmapped.
    std::optional<bool> isRangeContiguousByMemAddress(uint32_t startAddress, uint32_t endAddressExclusive) const;
};

} // namespace gcdisc
