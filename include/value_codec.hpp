#ifndef VALUE_CODEC_H
#define VALUE_CODEC_H

#include "heat_pump_types.hpp"
#include <cstdint>
#include <vector>

/**
 * @class ValueCodec
 * @brief Converts between holding-register words and display values.
 *
 * 32-bit values are stored high word first. Float32 is an IEEE-754 bit pattern.
 * Display value = raw * scale + offset.
 */
class ValueCodec {
public:
    /**
     * @brief Decodes the words of one register into a display value.
     * @param words Exactly descriptor.word_count words.
     * @param descriptor The register description.
     * @return A double, or a bool for switch registers.
     * @throw ModbusError with ErrorKind::MalformedPayload if the word count differs.
     */
    static Value decode(const std::vector<uint16_t>& words, const RegisterDescriptor& descriptor);

    /**
     * @brief Encodes a display value into register words.
     * @param value The value in display units.
     * @param descriptor The register description.
     * @return descriptor.word_count words, high word first.
     * @throw ModbusError with ErrorKind::RangeError if the value is outside the
     *        valid range, not finite, or not representable in the raw type.
     */
    static std::vector<uint16_t> encode(const Value& value, const RegisterDescriptor& descriptor);

    /// @brief Decodes a span inside a larger block read (no copy of the block).
    static Value decodeAt(const std::vector<uint16_t>& block, size_t offset, const RegisterDescriptor& descriptor);

    static uint32_t combineWords(uint16_t high, uint16_t low) {
        return (static_cast<uint32_t>(high) << 16) | low;
    }

    static float wordsToFloat(uint16_t high, uint16_t low);
    static void floatToWords(float value, uint16_t& high, uint16_t& low);
};

#endif // VALUE_CODEC_H
