#include "executable_layout.hpp"
#include "bytes.hpp"
#include "errors.hpp"
#include <algorithm>
#include <numeric>

namespace gcdisc {

std::string to_string(SectionKind kind)
{
    return kind == SectionKind::Text ? "text" : "data";
}

namespace {

void collectSections(const std::vector<uint8_t>& image, SectionKind kind, size_t slots,
                     size_t offsetsAt, size_t addressesAt, size_t sizesAt,
                     std::vector<ExecutableSection>& out)
{
    for (size_t slot = 0; slot < slots; ++slot) {
        const uint32_t offset = bytes::readU32(image, offsetsAt + slot * 4);
        const uint32_t address = bytes::readU32(image, addressesAt + slot * 4);
        const uint32_t size = bytes::readU32(image, sizesAt + slot * 4);

        // No gaps: the first unused slot ends the list.
        if (offset == 0 || address == 0 || size == 0) break;

        if (static_cast<uint64_t>(offset) + size > UINT32_MAX ||
            static_cast<uint64_t>(address) + size > UINT32_MAX) {
            throw FormatError(to_string(kind) + " section " + std::to_string(slot)
                              + " reaches past the 32-bit address space");
        }
        out.push_back({static_cast<uint32_t>(slot), kind, offset, address, size});
    }
}

std::vector<size_t> inverse(const std::vector<size_t>& permutation)
{
    std::vector<size_t> rank(permutation.size());
    for (size_t i = 0; i < permutation.size(); ++i) {
        rank[permutation[i]] = i;
    }
    return rank;
}

} // namespace

ExecutableLayout ExecutableLayout::parse(const std::vector<uint8_t>& image)
{
    bytes::requireAvailable(image, 0, dol::HEADER_END, "DOL header");

    ExecutableLayout result;
    collectSections(image, SectionKind::Text, dol::TEXT_SLOTS,
                    dol::TEXT_OFFSETS, dol::TEXT_ADDRESSES, dol::TEXT_SIZES, result.sectionList);
    collectSections(image, SectionKind::Data, dol::DATA_SLOTS,
                    dol::DATA_OFFSETS, dol::DATA_ADDRESSES, dol::DATA_SIZES, result.sectionList);

    result.bssMemAddress = bytes::readU32(image, dol::BSS_ADDRESS);
    result.bssSize = bytes::readU32(image, dol::BSS_SIZE);
    result.entryPoint = bytes::readU32(image, dol::ENTRY_POINT);

    const auto& list = result.sectionList;
    result.byFileOffset.resize(list.size());
    std::iota(result.byFileOffset.begin(), result.byFileOffset.end(), 0);
    result.byMemAddress = result.byFileOffset;

    std::stable_sort(result.byFileOffset.begin(), result.byFileOffset.end(),
                     [&](size_t a, size_t b) { return list[a].fileOffset < list[b].fileOffset; });
    std::stable_sort(result.byMemAddress.begin(), result.byMemAddress.end(),
                     [&](size_t a, size_t b) { return list[a].memAddress < list[b].memAddress; });

    result.fileRank = inverse(result.byFileOffset);
    result.memRank = inverse(result.byMemAddress);
    return result;
}

std::vector<ExecutableSection> ExecutableLayout::sectionsByFileOffset() const
{
    std::vector<ExecutableSection> ordered;
    ordered.reserve(byFileOffset.size());
    for (size_t i : byFileOffset) ordered.push_back(sectionList[i]);
    return ordered;
}

std::vector<ExecutableSection> ExecutableLayout::sectionsByMemAddress() const
{
    std::vector<ExecutableSection> ordered;
    ordered.reserve(byMemAddress.size());
    for (size_t i : byMemAddress) ordered.push_back(sectionList[i]);
    return ordered;
}

std::optional<size_t> ExecutableLayout::indexContainingFileOffset(uint32_t fileOffset) const
{
    for (size_t i = 0; i < sectionList.size(); ++i) {
        const auto& section = sectionList[i];
        if (fileOffset >= section.fileOffset && fileOffset < section.endFileOffset()) return i;
    }
    return std::nullopt;
}

std::optional<size_t> ExecutableLayout::indexContainingMemAddress(uint32_t memAddress) const
{
    for (size_t i = 0; i < sectionList.size(); ++i) {
        const auto& section = sectionList[i];
        if (memAddress >= section.memAddress && memAddress < section.endMemAddress()) return i;
    }
    return std::nullopt;
}

std::optional<ExecutableSection> ExecutableLayout::sectionContainingMemAddress(uint32_t memAddress) const
{
    auto i = indexContainingMemAddress(memAddress);
    if (!i) return std::nullopt;
    return sectionList[*i];
}

std::optional<ExecutableSection> ExecutableLayout::sectionContainingFileOffset(uint32_t fileOffset) const
{
    auto i = indexContainingFileOffset(fileOffset);
    if (!i) return std::nullopt;
    return sectionList[*i];
}

std::optional<uint32_t> ExecutableLayout::fileOffsetForMemAddress(uint32_t memAddress) const
{
    auto section = sectionContainingMemAddress(memAddress);
    if (!section) return std::nullopt;
    return section->fileOffset + (memAddress - section->memAddress);
}

std::optional<uint32_t> ExecutableLayout::memAddressForFileOffset(uint32_t fileOffset) const
{
    auto section = sectionContainingFileOffset(fileOffset);
    if (!section) return std::nullopt;
    return section->memAddress + (fileOffset - section->fileOffset);
}

std::optional<bool> ExecutableLayout::isRangeContiguousByFileOffset(uint32_t start, uint32_t endExclusive) const
{
    auto current = indexContainingFileOffset(start);
    if (!current) return std::nullopt;

    // Walk from section to section while the file order and the memory order
    // agree on the successor and it follows without a gap in both spaces.
    // Every step moves forward in file order, so this ends after at most
    // sections().size() steps.
    while (endExclusive > sectionList[*current].endFileOffset()) {
        const size_t fileNext = fileRank[*current] + 1;
        const size_t memNext = memRank[*current] + 1;
        if (fileNext >= byFileOffset.size() || memNext >= byMemAddress.size()) return false;

        const size_t next = byFileOffset[fileNext];
        if (next != byMemAddress[memNext] || !sectionList[*current].isImmediatelyBefore(sectionList[next])) {
            return false;
        }
        current = next;
    }
    return true;
}

std::optional<bool> ExecutableLayout::isRangeContiguousByMemAddress(uint32_t startAddress,
                                                                     uint32_t endAddressExclusive) const
{
    auto start = fileOffsetForMemAddress(startAddress);
    auto end = fileOffsetForMemAddress(endAddressExclusive);
    if (!start || !end) return std::nullopt;
    return isRangeContiguousByFileOffset(*start, *end);
}

} // namespace gcdisc
