#include "commands.hpp"
#include "bytes.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <stdexcept>
#include <vector>

namespace gcdisc::commands {

namespace {

bool endsWith(std::string_view text, std::string_view suffix)
{
    if (text.size() < suffix.size()) return false;
    auto tail = text.substr(text.size() - suffix.size());
    return std::equal(tail.begin(), tail.end(), suffix.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

std::vector<uint8_t> readHostFile(const std::string& filename)
{
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw IoError("Could not open file: " + filename);
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

} // namespace

SectionOrder parseSectionOrder(std::string_view name)
{
    if (name == "file") return SectionOrder::Header;
    if (name == "dol") return SectionOrder::FileOffset;
    if (name == "mem") return SectionOrder::MemAddress;
    throw InvalidArgumentError("Unknown section order '" + std::string(name) + "' (expected file, dol or mem)");
}

int64_t parseNumber(const std::string& text)
{
    // No octal: "010" is an error, not 8.
    std::string_view digits(text);
    if (digits.starts_with("-") || digits.starts_with("+")) digits.remove_prefix(1);
    if (digits.size() > 1 && digits[0] == '0' && std::isdigit(static_cast<unsigned char>(digits[1]))
        && digits.find_first_not_of('0') != std::string_view::npos) {
        throw InvalidArgumentError("Invalid number: '" + text + "' (leading zeros are not allowed)");
    }

    size_t pos = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &pos, 0);
    } catch (const std::logic_error&) {
        throw InvalidArgumentError("Invalid number: '" + text + "'");
    }
    if (pos != text.size()) {
        throw InvalidArgumentError("Invalid number: '" + text + "'");
    }
    return value;
}

void printIsoInfo(const DiscImage& image, std::ostream& out)
{
    const auto& disc = image.layout();
    using bytes::hex;

    out << "Game Code: " << disc.gameCode << "\n";
    out << "Maker Code: " << disc.makerCode << "\n";
    out << "Disk Id: " << static_cast<int>(disc.diskId) << "\n";
    out << "Version: " << static_cast<int>(disc.version) << "\n";
    out << "Game Name: " << disc.gameName << "\n";
    out << "\n";
    out << "DOL offset: " << hex(disc.executableOffset) << "\n";
    out << "DOL size: " << hex(disc.executableSize) << "\n";
    out << "FST offset: " << hex(disc.fstOffset) << "\n";
    out << "FST Size: " << hex(disc.fstSize) << "\n";
    out << "Max FST Size: " << hex(disc.maxFstSize) << "\n";
    out << "FST Entries: " << hex(image.files().numFstEntries()) << "\n";
    out << "\n";
    out << "Apploader Date: " << disc.apploader.date << "\n";
    out << "Apploader Entry Point: " << hex(disc.apploader.entryPoint) << "\n";
    out << "Apploader Code Size: " << hex(disc.apploader.codeSize) << "\n";
    out << "Apploader Trailer Size: " << hex(disc.apploader.trailerSize) << "\n";
}

std::optional<size_t> columnCount(std::optional<int> requested)
{
    if (!requested) return std::nullopt;
    if (*requested <= 0) {
        throw InvalidArgumentError("Column count must be positive, got " + std::to_string(*requested));
    }
    return static_cast<size_t>(*requested);
}

void printListing(const DiscImage& image, std::string_view directory, std::optional<size_t> columns,
                  bool withSizes, std::ostream& out)
{
    if (columns && *columns == 0) {
        throw InvalidArgumentError("Column count must be positive");
    }
    const auto& files = image.files();
    if (!files.isDirectory(directory)) {
        throw NotFoundError("No such directory in image: " + std::string(directory));
    }

    const std::string prefix = FileTable::directoryPrefix(directory);
    std::vector<std::string> cells;
    for (auto name : files.listDirectory(directory)) {
        std::string cell(name);
        if (withSizes) {
            cell += " (" + std::to_string(files.fileSize(prefix + cell)) + ")";
        }
        cells.push_back(std::move(cell));
    }

    size_t widest = 0;
    for (const auto& cell : cells) widest = std::max(widest, cell.size());
    const size_t columnWidth = widest + 3;
    const size_t perRow = columns ? *columns : std::max<size_t>(1, 100 / columnWidth);

    for (size_t i = 0; i < cells.size(); i += perRow) {
        const size_t last = std::min(cells.size(), i + perRow);
        for (size_t j = i; j < last; ++j) {
            out << std::left << std::setw(static_cast<int>(columnWidth)) << cells[j];
        }
        out << "\n";
    }
}

void printExecutableInfo(const ExecutableLayout& executable, SectionOrder order, std::ostream& out)
{
    using bytes::hex;

    out << "BSS Memory Address: " << hex(executable.bssMemAddress) << "\n";
    out << "BSS Size: " << hex(executable.bssSize) << "\n";
    out << "Entry Point: " << hex(executable.entryPoint) << "\n";

    std::vector<ExecutableSection> sections;
    switch (order) {
        case SectionOrder::Header: sections = executable.sections(); break;
        case SectionOrder::FileOffset: sections = executable.sectionsByFileOffset(); break;
        case SectionOrder::MemAddress: sections = executable.sectionsByMemAddress(); break;
    }

    out << "\nSections:\n";
    for (size_t i = 0; i < sections.size(); ++i) {
        const auto& section = sections[i];
        out << to_string(section.kind) << " " << section.index
            << " - DOL: " << std::right << std::setw(8) << hex(section.fileOffset)
            << " to " << std::setw(8) << hex(section.endFileOffset())
            << ", Memory: " << hex(section.memAddress) << " to " << hex(section.endMemAddress())
            << " (size: " << hex(section.size) << ")\n";

        if (i + 1 >= sections.size()) continue;
        const auto& next = sections[i + 1];
        if (order == SectionOrder::FileOffset && next.fileOffset > section.endFileOffset()) {
            out << "Gap (DOL): " << hex(next.fileOffset - section.endFileOffset()) << "\n";
        }
        if (order == SectionOrder::MemAddress && next.memAddress > section.endMemAddress()) {
            out << "Gap (memory): " << hex(next.memAddress - section.endMemAddress()) << "\n";
        }
    }
}

ExecutableLayout loadExecutable(const std::string& filename, std::string_view internalPath)
{
    if (endsWith(filename, ".iso") || endsWith(filename, ".gcm")) {
        DiscImage image(filename, true);
        return image.executableLayout(internalPath);
    }
    if (endsWith(filename, ".dol")) {
        return ExecutableLayout::parse(readHostFile(filename));
    }
    throw InvalidArgumentError("File extension must be .iso, .gcm or .dol: " + filename);
}

size_t extractFile(const DiscImage& image, std::string_view path, const std::string& destination,
                   int64_t offset, std::optional<int64_t> length)
{
    const auto data = image.readFile(path, offset, length.value_or(-1));

    std::ofstream out(destination, std::ios::binary);
    if (!out.is_open()) {
        throw IoError("Could not open file for writing: " + destination);
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) {
        throw IoError("Write to " + destination + " failed");
    }
    return data.size();
}

size_t patchFile(DiscImage& image, std::string_view path, const std::string& source, int64_t offset)
{
    return image.writeFile(path, offset, readHostFile(source));
}

} // namespace gcdisc::commands
