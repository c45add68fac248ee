#pragma once

#include <stdexcept>
#include <string>

namespace rangeio {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The server does not answer the probe with "Accept-Ranges: bytes".
class RangesNotSupportedError : public Error {
public:
    RangesNotSupportedError() : Error("server does not support byte-range requests") {}
    explicit RangesNotSupportedError(const std::string& what) : Error(what) {}
};

// The resource length could not be read from the probe response.
class MetadataParseError : public Error {
public:
    using Error::Error;
};

// Invalid offset/length arguments. The stream state is left untouched.
class BoundsError : public Error {
public:
    using Error::Error;
};

// Any failure reported by a RangeClient. status is the HTTP status when one
// was received, 0 otherwise.
class TransportError : public Error {
public:
    explicit TransportError(const std::string& what, int status = 0)
        : Error(what), status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};

class EndOfStreamError : public Error {
public:
    using Error::Error;
};

class StreamClosedError : public Error {
public:
    StreamClosedError() : Error("stream is closed") {}
};

} // namespace rangeio
