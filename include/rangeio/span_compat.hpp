#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace rangeio {

// A simplified, C++17-compatible writable view over a contiguous sequence of
// bytes, similar to std::span<std::uint8_t>. Destination of bulk reads.
class mutable_bytes_view {
public:
    mutable_bytes_view() : data_(nullptr), size_(0) {}

    mutable_bytes_view(std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}

    mutable_bytes_view(std::vector<std::uint8_t>& vec) : data_(vec.data()), size_(vec.size()) {}

    std::uint8_t* data() const { return data_; }
    std::size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    std::uint8_t* begin() const { return data_; }
    std::uint8_t* end() const { return data_ + size_; }

private:
    std::uint8_t* data_;
    std::size_t size_;
};

} // namespace rangeio
