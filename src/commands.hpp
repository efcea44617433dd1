#pragma once
#include "disc_image.hpp"
#include "executable_layout.hpp"
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

// The operations behind each gcdisc subcommand. They print to the stream they
// are given so main() stays a thin argument parser.
namespace gcdisc::commands {

enum class SectionOrder {
    Header,       ///< text then data, slot order ("file")
    FileOffset,   ///< "dol"
    MemAddress    ///< "mem"
};

// "file", "dol" or "mem"
SectionOrder parseSectionOrder(std::string_view name);

// Decimal, or hexadecimal with a 0x prefix. "010" is rejected rather than read as octal.
int64_t parseNumber(const std::string& text);

void printIsoInfo(const DiscImage& image, std::ostream& out);

// --cols value for printListing; nullopt stays nullopt. Throws InvalidArgumentError unless positive.
std::optional<size_t> columnCount(std::optional<int> requested);

/**
 * @brief Print the files below @p directory in columns.
 * @param columns Column count; by default as many as fit into 100 characters
 * @param withSizes Append "(size)" to every name
 * @throws NotFoundError if nothing is stored below @p directory
 * @throws InvalidArgumentError if @p columns is 0
 */
void printListing(const DiscImage& image, std::string_view directory, std::optional<size_t> columns,
                  bool withSizes, std::ostream& out);

void printExecutableInfo(const ExecutableLayout& executable, SectionOrder order, std::ostream& out);

// Open a DOL directly (".dol") or from inside a disc image (".iso", ".gcm").
ExecutableLayout loadExecutable(const std::string& filename, std::string_view internalPath);

/**
 * @brief Copy an internal file, or a part of it, to a host file.
 * @return Number of bytes written to @p destination
 */
size_t extractFile(const DiscImage& image, std::string_view path, const std::string& destination,
                   int64_t offset = 0, std::optional<int64_t> length = std::nullopt);

/**
 * @brief Overwrite an internal file at @p offset with the contents of a host file.
 * The internal file keeps its size; data that does not fit is rejected.
 * @return Number of bytes written
 */
size_t patchFile(DiscImage& image, std::string_view path, const std::string& source, int64_t offset = 0);

} // namespace gcdisc::commands
