#pragma once

/**
 * @file cbor.hpp
 * @brief Minimal CBOR (RFC 8949) encoding and decoding
 *
 * Covers the subset used by world chunk export: integers, float64,
 * text and byte strings, booleans, arrays and maps with definite lengths.
 */

#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tectogen {
namespace cbor {

// CBOR major types
constexpr uint8_t UNSIGNED_INT = 0;
constexpr uint8_t NEGATIVE_INT = 1;
constexpr uint8_t BYTE_STRING = 2;
constexpr uint8_t TEXT_STRING = 3;
constexpr uint8_t ARRAY = 4;
constexpr uint8_t MAP = 5;
constexpr uint8_t SIMPLE = 7;

// Simple values
constexpr uint8_t FALSE_VALUE = 20;
constexpr uint8_t TRUE_VALUE = 21;
constexpr uint8_t NULL_VALUE = 22;
constexpr uint8_t FLOAT64 = 27;

// ============================================================================
// Encoding
// ============================================================================

// Encode a CBOR header (major type + argument), big-endian argument
inline void encodeHeader(std::vector<uint8_t>& out, uint8_t majorType, uint64_t value) {
    uint8_t mt = static_cast<uint8_t>(majorType << 5);

    int argBytes;
    if (value < 24) {
        out.push_back(static_cast<uint8_t>(mt | value));
        return;
    } else if (value <= 0xFF) {
        out.push_back(mt | 24);
        argBytes = 1;
    } else if (value <= 0xFFFF) {
        out.push_back(mt | 25);
        argBytes = 2;
    } else if (value <= 0xFFFFFFFF) {
        out.push_back(mt | 26);
        argBytes = 4;
    } else {
        out.push_back(mt | 27);
        argBytes = 8;
    }

    for (int i = argBytes - 1; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

inline void encodeUInt(std::vector<uint8_t>& out, uint64_t value) {
    encodeHeader(out, UNSIGNED_INT, value);
}

inline void encodeInt(std::vector<uint8_t>& out, int64_t value) {
    if (value >= 0) {
        encodeHeader(out, UNSIGNED_INT, static_cast<uint64_t>(value));
    } else {
        encodeHeader(out, NEGATIVE_INT, static_cast<uint64_t>(-1 - value));
    }
}

inline void encodeDouble(std::vector<uint8_t>& out, double value) {
    out.push_back((SIMPLE << 5) | FLOAT64);
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    for (int i = 7; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>(bits >> (i * 8)));
    }
}

inline void encodeString(std::vector<uint8_t>& out, std::string_view str) {
    encodeHeader(out, TEXT_STRING, str.size());
    out.insert(out.end(), str.begin(), str.end());
}

inline void encodeBytes(std::vector<uint8_t>& out, std::span<const uint8_t> bytes) {
    encodeHeader(out, BYTE_STRING, bytes.size());
    out.insert(out.end(), bytes.begin(), bytes.end());
}

inline void encodeBool(std::vector<uint8_t>& out, bool value) {
    out.push_back((SIMPLE << 5) | (value ? TRUE_VALUE : FALSE_VALUE));
}

inline void encodeMapHeader(std::vector<uint8_t>& out, size_t count) {
    encodeHeader(out, MAP, count);
}

inline void encodeArrayHeader(std::vector<uint8_t>& out, size_t count) {
    encodeHeader(out, ARRAY, count);
}

// ============================================================================
// Decoding
// ============================================================================

/// Sequential CBOR reader. Reading past the end yields zeros and sets failed().
class Decoder {
public:
    explicit Decoder(std::span<const uint8_t> span) : data_(span.data()), size_(span.size()) {}

    [[nodiscard]] bool hasMore() const { return pos_ < size_; }
    [[nodiscard]] size_t remaining() const { return size_ - pos_; }
    [[nodiscard]] bool failed() const { return failed_; }

    uint8_t read() {
        if (pos_ >= size_) {
            failed_ = true;
            return 0;
        }
        return data_[pos_++];
    }

    // Read CBOR header, returns (major type, argument value)
    std::pair<uint8_t, uint64_t> readHeader() {
        uint8_t initial = read();
        uint8_t majorType = initial >> 5;
        uint8_t additional = initial & 0x1F;

        if (additional < 24) {
            return {majorType, additional};
        }

        int argBytes = 0;
        switch (additional) {
            case 24: argBytes = 1; break;
            case 25: argBytes = 2; break;
            case 26: argBytes = 4; break;
            case 27: argBytes = 8; break;
            default:
                // Indefinite lengths are not produced by our encoder
                failed_ = true;
                return {majorType, 0};
        }

        uint64_t value = 0;
        for (int i = 0; i < argBytes; ++i) {
            value = (value << 8) | read();
        }
        return {majorType, value};
    }

    std::string readString(uint64_t length) {
        std::string result;
        if (length > remaining()) {
            failed_ = true;
            return result;
        }
        result.assign(reinterpret_cast<const char*>(data_ + pos_), static_cast<size_t>(length));
        pos_ += static_cast<size_t>(length);
        return result;
    }

    std::vector<uint8_t> readBytes(uint64_t length) {
        std::vector<uint8_t> result;
        if (length > remaining()) {
            failed_ = true;
            return result;
        }
        result.assign(data_ + pos_, data_ + pos_ + length);
        pos_ += static_cast<size_t>(length);
        return result;
    }

    double readFloat64() {
        uint64_t bits = 0;
        for (int i = 0; i < 8; ++i) {
            bits = (bits << 8) | read();
        }
        double result;
        std::memcpy(&result, &bits, sizeof(result));
        return result;
    }

    // Read an integer (handles both unsigned and negative)
    int64_t readInt() {
        auto [majorType, value] = readHeader();
        if (majorType == UNSIGNED_INT) {
            return static_cast<int64_t>(value);
        } else if (majorType == NEGATIVE_INT) {
            return -1 - static_cast<int64_t>(value);
        }
        failed_ = true;
        return 0;
    }

    uint64_t readUInt() {
        auto [majorType, value] = readHeader();
        if (majorType != UNSIGNED_INT) {
            failed_ = true;
            return 0;
        }
        return value;
    }

    // Skip a CBOR value (unknown map fields)
    void skipValue() {
        auto [majorType, value] = readHeader();
        switch (majorType) {
            case UNSIGNED_INT:
            case NEGATIVE_INT:
                break;
            case BYTE_STRING:
            case TEXT_STRING:
                if (value > remaining()) {
                    failed_ = true;
                    pos_ = size_;
                } else {
                    pos_ += static_cast<size_t>(value);
                }
                break;
            case ARRAY:
                for (uint64_t i = 0; i < value && !failed_; ++i) {
                    skipValue();
                }
                break;
            case MAP:
                for (uint64_t i = 0; i < value && !failed_; ++i) {
                    skipValue();
                    skipValue();
                }
                break;
            case SIMPLE:
                // readHeader already consumed any float payload
                break;
            default:
                failed_ = true;
                break;
        }
    }

private:
    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
    bool failed_ = false;
};

}  // namespace cbor
}  // namespace tectogen
