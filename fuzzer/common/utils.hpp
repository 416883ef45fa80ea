// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string_view>

namespace luhn_fuzz {

inline std::string_view bytes_to_string_view(const uint8_t *data, size_t size)
{
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return std::string_view{reinterpret_cast<const char *>(data), size};
}

// Splits the fuzzer input into a selector byte followed by the remaining bytes
class InputSplitter {
public:
    InputSplitter(const uint8_t *data, size_t size) : data_(data), size_(size) {}

    template <typename T> T get()
    {
        if (offset_ + sizeof(T) > size_) {
            return T{};
        }
        T value;
        std::memcpy(&value, data_ + offset_, sizeof(T));
        offset_ += sizeof(T);
        return value;
    }

    std::string_view get_remaining()
    {
        if (offset_ >= size_) {
            return {};
        }
        auto result = bytes_to_string_view(data_ + offset_, size_ - offset_);
        offset_ = size_;
        return result;
    }

private:
    const uint8_t *data_;
    size_t size_;
    size_t offset_{0};
};

} // namespace luhn_fuzz
