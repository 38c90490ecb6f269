#pragma once

#include <stdexcept>
#include <string>

namespace pngfiles {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Bad signature or undecodable chunk tag.
class FormatError : public Error {
public:
    using Error::Error;
};

// Stored chunk CRC does not match the computed one.
class IntegrityError : public Error {
public:
    using Error::Error;
};

// A length field points past the end of the buffer.
class OutOfBoundsError : public Error {
public:
    using Error::Error;
};

// Malformed file record serialization.
class EncodingError : public Error {
public:
    using Error::Error;
};

class CompressionError : public Error {
public:
    using Error::Error;
};

class DuplicateKeyError : public Error {
public:
    explicit DuplicateKeyError(const std::string& key)
        : Error("Key already in use: " + key), key_(key) {}

    const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

class SizeLimitError : public Error {
public:
    using Error::Error;
};

class IoError : public Error {
public:
    using Error::Error;
};

}  // namespace pngfiles
