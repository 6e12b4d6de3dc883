#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace protocol {

enum class ValueFormat {
    Int16,
    UInt16,
    Int32,
    UInt32,
    Int32WordSwapped,
    Float16,
    Float32,
    Float32WordSwapped,
    Hex,
    String
};

using Value = std::variant<std::int64_t, double, std::string>;

struct DecodedValue {
    ValueFormat format;
    std::string formatName;
    Value value;
};

// The requested window does not fit in the raw bytes.
struct DecodeError {
    ValueFormat format;
    std::string formatName;
    std::string message;
};

struct DecodeReport {
    std::vector<DecodedValue> values;
    std::vector<DecodeError> errors;

    const DecodedValue* find(ValueFormat format) const;
};

// Pure: the result depends only on `raw` and `formats`. A format whose window is
// larger than `raw` lands in `errors` without affecting the others.
DecodeReport decodeValues(const std::vector<std::uint8_t>& raw, const std::vector<ValueFormat>& formats);

std::string valueFormatName(ValueFormat format);
std::optional<ValueFormat> parseValueFormat(const std::string& name);
const std::vector<ValueFormat>& allValueFormats();

double halfToDouble(std::uint16_t half);

} // namespace protocol
