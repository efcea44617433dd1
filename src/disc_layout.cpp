#include "disc_layout.hpp"
#include "bytes.hpp"
#include "errors.hpp"

namespace gcdisc {

DiscLayout DiscLayout::parse(const Container& container)
{
    constexpr uint64_t required = layout::APPLOADER_OFFSET + layout::APPLOADER_DESCRIPTOR_SIZE;
    if (container.size() < required) {
        throw FormatError("Image too small for a disc header: " + bytes::hex(container.size())
                          + " bytes, need " + bytes::hex(required));
    }

    // Build into a local so a failure leaves nothing half-decoded.
    DiscLayout result;

    const auto header = container.read(0, layout::HEADER_SIZE);
    result.gameCode = std::string(header.begin(), header.begin() + 4);
    result.makerCode = std::string(header.begin() + 4, header.begin() + 6);
    result.diskId = header[6];
    result.version = header[7];
    result.gameName = bytes::readCString(header, layout::GAME_NAME_OFFSET, layout::GAME_NAME_MAX);

    result.executableOffset = bytes::readU32(header, layout::REGION_TABLE_OFFSET);
    result.fstOffset = bytes::readU32(header, layout::REGION_TABLE_OFFSET + 4);
    result.fstSize = bytes::readU32(header, layout::REGION_TABLE_OFFSET + 8);
    result.maxFstSize = bytes::readU32(header, layout::REGION_TABLE_OFFSET + 12);

    // start.dol has no size field; it is assumed to end where the FST starts.
    if (result.fstOffset < result.executableOffset) {
        throw FormatError("FST offset " + bytes::hex(result.fstOffset) + " lies before the executable at "
                          + bytes::hex(result.executableOffset));
    }
    result.executableSize = result.fstOffset - result.executableOffset;

    // date (10), 6 bytes padding, entry point, code size, trailer size
    const auto descriptor = container.read(layout::APPLOADER_OFFSET, layout::APPLOADER_DESCRIPTOR_SIZE);
    result.apploader.date = std::string(descriptor.begin(), descriptor.begin() + layout::APPLOADER_DATE_SIZE);
    result.apploader.entryPoint = bytes::readU32(descriptor, 0x10);
    result.apploader.codeSize = bytes::readU32(descriptor, 0x14);
    result.apploader.trailerSize = bytes::readU32(descriptor, 0x18);
    result.apploader.codeOffset = layout::APPLOADER_CODE_OFFSET;

    return result;
}

std::vector<FileEntry> DiscLayout::privilegedRegions() const
{
    return {
        {layout::BOOT_FILE, 0, layout::HEADER_SIZE},
        {layout::DISC_INFO_FILE, layout::DISC_INFO_OFFSET, layout::DISC_INFO_SIZE},
        {layout::FST_FILE, fstOffset, fstSize},
        {layout::EXECUTABLE_FILE, executableOffset, executableSize},
        {layout::APPLOADER_FILE, apploader.codeOffset, apploader.codeSize},
    };
}

} // namespace gcdisc
