#pragma once
#include "container.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace gcdisc {

// A named byte range of the container: a privileged region or an FST file.
struct FileEntry {
    std::string path;
    uint32_t offset;
    uint32_t size;

    uint64_t end() const { return static_cast<uint64_t>(offset) + size; }
    bool operator==(const FileEntry&) const = default;
};

namespace layout {
    constexpr uint32_t HEADER_SIZE = 0x440;          ///< boot.bin
    constexpr uint32_t GAME_NAME_OFFSET = 0x20;
    constexpr uint32_t GAME_NAME_MAX = 0x3E0;
    constexpr uint32_t REGION_TABLE_OFFSET = 0x420;  ///< executable/FST offsets and sizes
    constexpr uint32_t DISC_INFO_OFFSET = 0x440;     ///< bi2.bin
    constexpr uint32_t DISC_INFO_SIZE = 0x2000;
    constexpr uint32_t APPLOADER_OFFSET = 0x2440;
    constexpr uint32_t APPLOADER_DESCRIPTOR_SIZE = 0x1C;
    constexpr uint32_t APPLOADER_CODE_OFFSET = APPLOADER_OFFSET + 0x20;
    constexpr uint32_t APPLOADER_DATE_SIZE = 10;

    inline const std::string BOOT_FILE = "boot.bin";
    inline const std::string DISC_INFO_FILE = "bi2.bin";
    inline const std::string FST_FILE = "fst.bin";
    inline const std::string EXECUTABLE_FILE = "start.dol";
    inline const std::string APPLOADER_FILE = "appldr.bin";
}

struct ApploaderDescriptor {
    std::string date;       ///< ASCII build date, e.g. "2001/11/14"
    uint32_t entryPoint;
    uint32_t codeSize;
    uint32_t trailerSize;
    uint32_t codeOffset;    ///< Container offset of the apploader code
};

/**
 * @brief Fixed-offset fields of the disc header and the regions derived from them.
 *
 * Only structural decoding is done here: a container too short to hold the
 * header and the apploader descriptor is a FormatError, as is an FST that
 * starts before the main executable (its size is derived from the distance).
 */
class DiscLayout {
public:
    std::string gameCode;    ///< 4 bytes
    std::string makerCode;   ///< 2 bytes
    uint8_t diskId = 0;
    uint8_t version = 0;
    std::string gameName;

    uint32_t executableOffset = 0;
    uint32_t executableSize = 0;
    uint32_t fstOffset = 0;
    uint32_t fstSize = 0;
    uint32_t maxFstSize = 0;    ///< Only meaningful for multi-disc games

    ApploaderDescriptor apploader{};

    static DiscLayout parse(const Container& container);

    // boot.bin, bi2.bin, fst.bin, start.dol, appldr.bin in that order
    std::vector<FileEntry> privilegedRegions() const;
};

} // namespace gcdisc
