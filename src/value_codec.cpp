#include "value_codec.hpp"
#include "modbus_error.hpp"
#include <cmath>
#include <cstring>
#include <limits>
#include <sstream>

namespace {

double rawValue(const std::vector<uint16_t>& block, size_t offset, DataType type) {
    switch (type) {
        case DataType::Int16:
            return static_cast<int16_t>(block[offset]);
        case DataType::UInt16:
            return block[offset];
        case DataType::Int32:
            return static_cast<int32_t>(ValueCodec::combineWords(block[offset], block[offset + 1]));
        case DataType::UInt32:
            return ValueCodec::combineWords(block[offset], block[offset + 1]);
        case DataType::Float32:
            return ValueCodec::wordsToFloat(block[offset], block[offset + 1]);
    }
    return 0.0;
}

[[noreturn]] void rangeError(const RegisterDescriptor& d, double value, const char* reason) {
    std::ostringstream msg;
    msg << "Value " << value << " for register 0x" << std::hex << d.address << " " << reason;
    throw ModbusError(ErrorKind::RangeError, msg.str());
}

template <typename T>
int64_t checkedInteger(double raw, double display, const RegisterDescriptor& d) {
    long long rounded = std::llround(raw);
    if (rounded < static_cast<long long>(std::numeric_limits<T>::min()) ||
        rounded > static_cast<long long>(std::numeric_limits<T>::max())) {
        rangeError(d, display, "does not fit the register type");
    }
    return rounded;
}

} // namespace

float ValueCodec::wordsToFloat(uint16_t high, uint16_t low) {
    uint32_t bits = combineWords(high, low);
    float f;
    std::memcpy(&f, &bits, sizeof(f));
    return f;
}

void ValueCodec::floatToWords(float value, uint16_t& high, uint16_t& low) {
    uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    high = static_cast<uint16_t>((bits >> 16) & 0xFFFF);
    low = static_cast<uint16_t>(bits & 0xFFFF);
}

Value ValueCodec::decode(const std::vector<uint16_t>& words, const RegisterDescriptor& descriptor) {
    if (words.size() != descriptor.word_count || descriptor.word_count != wordCountFor(descriptor.type)) {
        std::ostringstream msg;
        msg << "Register 0x" << std::hex << descriptor.address << std::dec << " expects "
            << wordCountFor(descriptor.type) << " words, got " << words.size();
        throw ModbusError(ErrorKind::MalformedPayload, msg.str());
    }
    return decodeAt(words, 0, descriptor);
}

Value ValueCodec::decodeAt(const std::vector<uint16_t>& block, size_t offset, const RegisterDescriptor& descriptor) {
    if (offset + wordCountFor(descriptor.type) > block.size()) {
        std::ostringstream msg;
        msg << "Register 0x" << std::hex << descriptor.address << std::dec << " lies outside a block of "
            << block.size() << " words";
        throw ModbusError(ErrorKind::MalformedPayload, msg.str());
    }

    double raw = rawValue(block, offset, descriptor.type);
    if (descriptor.kind == ValueKind::Switch) {
        return raw != 0.0;
    }
    return raw * descriptor.scale + descriptor.offset;
}

std::vector<uint16_t> ValueCodec::encode(const Value& value, const RegisterDescriptor& descriptor) {
    double display;
    if (const bool* b = std::get_if<bool>(&value)) {
        display = *b ? 1.0 : 0.0;
    } else {
        display = std::get<double>(value);
    }

    if (!std::isfinite(display)) {
        rangeError(descriptor, display, "is not a finite number");
    }

    // Switches carry the raw state, no scaling.
    if (descriptor.kind == ValueKind::Switch) {
        std::vector<uint16_t> words(descriptor.word_count, 0);
        words.back() = display != 0.0 ? 1 : 0;
        return words;
    }

    if (descriptor.range && !descriptor.range->contains(display)) {
        std::ostringstream reason;
        reason << "is outside [" << descriptor.range->min << ", " << descriptor.range->max << "]";
        rangeError(descriptor, display, reason.str().c_str());
    }

    double raw = (display - descriptor.offset) / descriptor.scale;

    switch (descriptor.type) {
        case DataType::Int16:
            return {static_cast<uint16_t>(static_cast<int16_t>(checkedInteger<int16_t>(raw, display, descriptor)))};
        case DataType::UInt16:
            return {static_cast<uint16_t>(checkedInteger<uint16_t>(raw, display, descriptor))};
        case DataType::Int32: {
            uint32_t bits = static_cast<uint32_t>(static_cast<int32_t>(checkedInteger<int32_t>(raw, display, descriptor)));
            return {static_cast<uint16_t>(bits >> 16), static_cast<uint16_t>(bits & 0xFFFF)};
        }
        case DataType::UInt32: {
            uint32_t bits = static_cast<uint32_t>(checkedInteger<uint32_t>(raw, display, descriptor));
            return {static_cast<uint16_t>(bits >> 16), static_cast<uint16_t>(bits & 0xFFFF)};
        }
        case DataType::Float32: {
            if (std::fabs(raw) > std::numeric_limits<float>::max()) {
                rangeError(descriptor, display, "does not fit the register type");
            }
            uint16_t high, low;
            floatToWords(static_cast<float>(raw), high, low);
            return {high, low};
        }
    }
    return {};
}
