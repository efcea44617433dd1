#include "file_table.hpp"
#include "bytes.hpp"
#include "errors.hpp"

namespace gcdisc {

// --- DirectoryListing ---

DirectoryListing::iterator::iterator(const std::vector<FileEntry>* files,
                                     std::shared_ptr<const std::string> directoryPrefix, size_t start)
    : entries(files), prefix(std::move(directoryPrefix)), position(start)
{
    skipNonMatching();
}

void DirectoryListing::iterator::skipNonMatching()
{
    const auto& files = *entries;
    while (position < files.size() && !std::string_view(files[position].path).starts_with(*prefix)) {
        ++position;
    }
}

std::string_view DirectoryListing::iterator::operator*() const
{
    return std::string_view(entries->at(position).path).substr(prefix->size());
}

DirectoryListing::iterator& DirectoryListing::iterator::operator++()
{
    ++position;
    skipNonMatching();
    return *this;
}

DirectoryListing::iterator DirectoryListing::iterator::operator++(int)
{
    iterator previous = *this;
    ++(*this);
    return previous;
}

std::vector<std::string> DirectoryListing::toVector() const
{
    std::vector<std::string> result;
    for (auto name : *this) {
        result.emplace_back(name);
    }
    return result;
}

// --- FileTable ---

std::string FileTable::directoryPrefix(std::string_view path)
{
    while (path.starts_with("/")) path.remove_prefix(1);
    if (path.empty()) return "";

    std::string prefix(path);
    if (prefix.back() != '/') prefix.push_back('/');
    return prefix;
}

void FileTable::add(FileEntry entry, uint64_t containerSize)
{
    if (entry.end() > containerSize) {
        throw FormatError("'" + entry.path + "' (" + bytes::hex(entry.offset) + "+" + bytes::hex(entry.size)
                          + ") extends past the end of the image (" + bytes::hex(containerSize) + ")");
    }

    auto it = index.find(entry.path);
    if (it != index.end()) {
        entries[it->second] = std::move(entry);
        return;
    }
    index.emplace(entry.path, entries.size());
    entries.push_back(std::move(entry));
}

std::vector<FstEntry> FileTable::decodeEntries(const std::vector<uint8_t>& fst)
{
    if (fst.size() < FST_ENTRY_SIZE) {
        throw FormatError("FST too small for a root entry: " + bytes::hex(fst.size()) + " bytes");
    }
    if (fst[0] == 0) {
        throw FormatError("FST root entry is not a directory");
    }

    // The root's size field holds the number of entries in the whole table.
    const uint32_t count = bytes::readU32(fst, 8);
    if (count == 0 || static_cast<uint64_t>(count) * FST_ENTRY_SIZE > fst.size()) {
        throw FormatError("FST declares " + std::to_string(count) + " entries, but only "
                          + std::to_string(fst.size() / FST_ENTRY_SIZE) + " fit into " + bytes::hex(fst.size())
                          + " bytes");
    }

    std::vector<FstEntry> table;
    table.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        const size_t at = static_cast<size_t>(i) * FST_ENTRY_SIZE;
        const uint32_t nameOffset = bytes::readU24(fst, at + 1);
        const uint32_t offset = bytes::readU32(fst, at + 4);
        const uint32_t size = bytes::readU32(fst, at + 8);
        if (fst[at] != 0) {
            table.push_back(FstDirectory{nameOffset, offset, size});
        } else {
            table.push_back(FstFile{nameOffset, offset, size});
        }
    }
    return table;
}

void FileTable::decodeFst(const Container& container, uint32_t fstOffset, uint32_t fstSize)
{
    if (static_cast<uint64_t>(fstOffset) + fstSize > container.size()) {
        throw FormatError("FST (" + bytes::hex(fstOffset) + "+" + bytes::hex(fstSize)
                          + ") extends past the end of the image");
    }

    const auto fst = container.read(fstOffset, fstSize);
    const auto table = decodeEntries(fst);
    const uint32_t count = static_cast<uint32_t>(table.size());
    const size_t names = static_cast<size_t>(count) * FST_ENTRY_SIZE;

    auto readName = [&](uint32_t index, uint32_t nameOffset) {
        const size_t start = names + nameOffset;
        size_t stop = start;
        while (stop < fst.size() && fst[stop] != 0) ++stop;
        if (stop >= fst.size()) {
            throw FormatError("Name of FST entry " + std::to_string(index) + " at string offset "
                              + bytes::hex(nameOffset) + " is not terminated inside the FST");
        }
        return std::string(fst.begin() + static_cast<std::ptrdiff_t>(start),
                           fst.begin() + static_cast<std::ptrdiff_t>(stop));
    };

    // Pre-order walk. Each open directory stays on the worklist until the
    // index reaches its end, which is how the table encodes subtree extents.
    struct OpenDirectory {
        uint32_t endIndex;
        std::string prefix;
    };
    std::vector<OpenDirectory> worklist{{count, ""}};

    for (uint32_t i = 1; i < count; ++i) {
        while (worklist.back().endIndex <= i) {
            worklist.pop_back();
        }
        const uint32_t parentEnd = worklist.back().endIndex;

        if (const auto* directory = std::get_if<FstDirectory>(&table[i])) {
            if (directory->endIndex <= i || directory->endIndex > parentEnd) {
                throw FormatError("FST directory " + std::to_string(i) + " ends at entry "
                                  + std::to_string(directory->endIndex) + ", outside (" + std::to_string(i) + ", "
                                  + std::to_string(parentEnd) + "]");
            }
            std::string prefix = worklist.back().prefix + readName(i, directory->nameOffset) + "/";
            worklist.push_back({directory->endIndex, std::move(prefix)});
        } else {
            const auto& file = std::get<FstFile>(table[i]);
            std::string path = worklist.back().prefix + readName(i, file.nameOffset);
            if (path.starts_with("/")) path.erase(0, 1);
            add({std::move(path), file.offset, file.size}, container.size());
        }
    }

    entryCount = count;
    stringTable = static_cast<uint64_t>(fstOffset) + names;
}

FileTable FileTable::build(const Container& container, uint32_t fstOffset, uint32_t fstSize)
{
    FileTable table;
    table.decodeFst(container, fstOffset, fstSize);
    return table;
}

FileTable FileTable::build(const Container& container, const DiscLayout& layout)
{
    FileTable table;
    for (auto& region : layout.privilegedRegions()) {
        table.add(std::move(region), container.size());
    }
    table.decodeFst(container, layout.fstOffset, layout.fstSize);
    return table;
}

bool FileTable::isFile(std::string_view path) const
{
    return index.find(path) != index.end();
}

bool FileTable::isDirectory(std::string_view path) const
{
    const std::string prefix = directoryPrefix(path);
    for (const auto& file : entries) {
        if (std::string_view(file.path).starts_with(prefix)) return true;
    }
    return false;
}

DirectoryListing FileTable::listDirectory(std::string_view path) const
{
    return DirectoryListing(entries, directoryPrefix(path));
}

const FileEntry& FileTable::entry(std::string_view path) const
{
    auto it = index.find(path);
    if (it == index.end()) {
        throw NotFoundError("No such file in image: " + std::string(path));
    }
    return entries[it->second];
}

ByteRangeView FileTable::open(Container& container, std::string_view path) const
{
    const auto& file = entry(path);
    return ByteRangeView(container, file.offset, file.size);
}

} // namespace gcdisc
