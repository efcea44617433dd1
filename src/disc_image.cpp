#include "disc_image.hpp"
#include "errors.hpp"

namespace gcdisc {

DiscImage::DiscImage(const std::string& filename, bool readOnly)
    : DiscImage(std::make_unique<FileContainer>(filename, readOnly))
{
}

DiscImage::DiscImage(std::unique_ptr<Container> backing)
    : container(std::move(backing)),
      discLayout(DiscLayout::parse(*container)),
      table(FileTable::build(*container, discLayout))
{
}

std::vector<uint8_t> DiscImage::readFile(std::string_view path, int64_t offset, int64_t count) const
{
    const auto& file = table.entry(path);
    return ByteRangeView(*container, file.offset, file.size).readAt(offset, count);
}

size_t DiscImage::writeFile(std::string_view path, int64_t offset, const std::vector<uint8_t>& data)
{
    return table.open(*container, path).writeAt(offset, data);
}

ByteRangeView DiscImage::open(std::string_view path)
{
    return table.open(*container, path);
}

ExecutableLayout DiscImage::executableLayout(std::string_view path) const
{
    // Read directly so an empty entry reports a truncated header, not a bad offset.
    const auto& file = table.entry(path);
    return ExecutableLayout::parse(container->read(file.offset, file.size));
}

} // namespace gcdisc
