#pragma once
#include <cstdint>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace gcdisc {

/**
 * @brief A flat, seekable byte space the decoders read from and patch.
 *
 * The decoders never open files themselves; they are handed one of these.
 * Reads and writes past size() throw OutOfRangeError / RangeExceededError,
 * failures of the underlying medium throw IoError.
 */
class Container {
public:
    virtual ~Container() = default;

    virtual uint64_t size() const = 0;
    virtual std::vector<uint8_t> read(uint64_t offset, uint64_t count) const = 0;
    virtual void write(uint64_t offset, const std::vector<uint8_t>& data) = 0;

protected:
    void checkRange(uint64_t offset, uint64_t count) const;
};

// Backed by a file on disk. The stream is owned and closed with the container.
class FileContainer : public Container {
    mutable std::fstream stream;
    std::string path;
    uint64_t length = 0;
    bool writable;

public:
    explicit FileContainer(const std::string& filename, bool readOnly = false);

    uint64_t size() const override { return length; }
    std::vector<uint8_t> read(uint64_t offset, uint64_t count) const override;
    void write(uint64_t offset, const std::vector<uint8_t>& data) override;

    const std::string& filename() const { return path; }
    bool isWritable() const { return writable; }
};

class MemoryContainer : public Container {
    std::vector<uint8_t> buffer;

public:
    MemoryContainer() = default;
    explicit MemoryContainer(std::vector<uint8_t> data) : buffer(std::move(data)) {}

    uint64_t size() const override { return buffer.size(); }
    std::vector<uint8_t> read(uint64_t offset, uint64_t count) const override;
    void write(uint64_t offset, const std::vector<uint8_t>& data) override;

    const std::vector<uint8_t>& data() const { return buffer; }
};

} // namespace gcdisc
