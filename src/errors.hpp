#pragma once
#include <stdexcept>
#include <string>

namespace gcdisc {

// Base of everything the library throws.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Truncated or structurally invalid fixed-layout data
 * (disc header, FST, DOL header).
 */
class FormatError : public Error {
public:
    explicit FormatError(const std::string& what) : Error(what) {}
};

/**
 * @brief Offset outside a declared region.
 */
class OutOfRangeError : public Error {
public:
    explicit OutOfRangeError(const std::string& what) : Error(what) {}
};

/**
 * @brief Extent crossing the end of a declared region. Regions never grow or shrink.
 */
class RangeExceededError : public Error {
public:
    explicit RangeExceededError(const std::string& what) : Error(what) {}
};

class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& what) : Error(what) {}
};

class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& what) : Error(what) {}
};

// Failure of the backing container itself (open, short read, failed write).
class IoError : public Error {
public:
    explicit IoError(const std::string& what) : Error(what) {}
};

} // namespace gcdisc
