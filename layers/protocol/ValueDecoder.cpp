#include "ValueDecoder.h"

#include <cmath>
#include <cstring>
#include <iomanip>
#include <limits>
#include <sstream>

namespace protocol {

namespace {

struct FormatInfo {
    ValueFormat format;
    const char* name;
    std::size_t window; // 0: the whole buffer
};

const FormatInfo kFormats[] = {
    {ValueFormat::Int16, "int16", 2},
    {ValueFormat::UInt16, "uint16", 2},
    {ValueFormat::Int32, "int32_be", 4},
    {ValueFormat::UInt32, "uint32_be", 4},
    {ValueFormat::Int32WordSwapped, "int32_word_swapped", 4},
    {ValueFormat::Float16, "float16", 2},
    {ValueFormat::Float32, "float32_be", 4},
    {ValueFormat::Float32WordSwapped, "float32_word_swapped", 4},
    {ValueFormat::Hex, "hex", 0},
    {ValueFormat::String, "string", 0},
};

const FormatInfo& infoFor(ValueFormat format) {
    for (const auto& info : kFormats) {
        if (info.format == format) {
            return info;
        }
    }
    return kFormats[0];
}

std::uint16_t word(const std::vector<std::uint8_t>& raw, std::size_t offset) {
    return static_cast<std::uint16_t>((raw[offset] << 8) | raw[offset + 1]);
}

std::uint32_t bigEndian32(const std::vector<std::uint8_t>& raw) {
    return (static_cast<std::uint32_t>(word(raw, 0)) << 16) | word(raw, 2);
}

std::uint32_t wordSwapped32(const std::vector<std::uint8_t>& raw) {
    return (static_cast<std::uint32_t>(word(raw, 2)) << 16) | word(raw, 0);
}

double floatFromBits(std::uint32_t bits) {
    float value = 0.0F;
    std::memcpy(&value, &bits, sizeof(value));
    return static_cast<double>(value);
}

std::string renderHex(const std::vector<std::uint8_t>& raw) {
    std::ostringstream out;
    out << std::uppercase << std::hex << std::setfill('0');
    std::size_t i = 0;
    for (; i + 1 < raw.size(); i += 2) {
        if (i != 0) {
            out << ' ';
        }
        out << "0x" << std::setw(4) << word(raw, i);
    }
    if (i < raw.size()) {
        if (i != 0) {
            out << ' ';
        }
        out << "0x" << std::setw(2) << static_cast<int>(raw[i]);
    }
    return out.str();
}

// Latin-1 in, UTF-8 out.
std::string renderString(const std::vector<std::uint8_t>& raw) {
    std::size_t end = raw.size();
    while (end > 0 && raw[end - 1] == 0) {
        --end;
    }

    std::string out;
    out.reserve(end);
    for (std::size_t i = 0; i < end; ++i) {
        const auto c = raw[i];
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back(static_cast<char>(0xC0 | (c >> 6)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }
    return out;
}

Value decodeOne(ValueFormat format, const std::vector<std::uint8_t>& raw) {
    switch (format) {
        case ValueFormat::Int16:
            return static_cast<std::int64_t>(static_cast<std::int16_t>(word(raw, 0)));
        case ValueFormat::UInt16:
            return static_cast<std::int64_t>(word(raw, 0));
        case ValueFormat::Int32:
            return static_cast<std::int64_t>(static_cast<std::int32_t>(bigEndian32(raw)));
        case ValueFormat::UInt32:
            return static_cast<std::int64_t>(bigEndian32(raw));
        case ValueFormat::Int32WordSwapped:
            return static_cast<std::int64_t>(static_cast<std::int32_t>(wordSwapped32(raw)));
        case ValueFormat::Float16:
            return halfToDouble(word(raw, 0));
        case ValueFormat::Float32:
            return floatFromBits(bigEndian32(raw));
        case ValueFormat::Float32WordSwapped:
            return floatFromBits(wordSwapped32(raw));
        case ValueFormat::Hex:
            return renderHex(raw);
        case ValueFormat::String:
            return renderString(raw);
    }
    return std::string{};
}

} // namespace

const DecodedValue* DecodeReport::find(ValueFormat format) const {
    for (const auto& value : values) {
        if (value.format == format) {
            return &value;
        }
    }
    return nullptr;
}

DecodeReport decodeValues(const std::vector<std::uint8_t>& raw, const std::vector<ValueFormat>& formats) {
    DecodeReport report;
    for (const auto format : formats) {
        const auto& info = infoFor(format);
        const std::size_t needed = info.window == 0 ? 1 : info.window;
        if (raw.size() < needed) {
            report.errors.push_back({format, info.name,
                                     "Insufficient data: " + std::string(info.name) + " needs " +
                                         std::to_string(needed) + " bytes, got " + std::to_string(raw.size())});
            continue;
        }
        report.values.push_back({format, info.name, decodeOne(format, raw)});
    }
    return report;
}

std::string valueFormatName(ValueFormat format) {
    return infoFor(format).name;
}

std::optional<ValueFormat> parseValueFormat(const std::string& name) {
    for (const auto& info : kFormats) {
        if (name == info.name) {
            return info.format;
        }
    }
    return std::nullopt;
}

const std::vector<ValueFormat>& allValueFormats() {
    static const std::vector<ValueFormat> formats = [] {
        std::vector<ValueFormat> all;
        for (const auto& info : kFormats) {
            all.push_back(info.format);
        }
        return all;
    }();
    return formats;
}

double halfToDouble(std::uint16_t half) {
    const bool negative = (half & 0x8000U) != 0U;
    const int exponent = (half >> 10) & 0x1F;
    const int mantissa = half & 0x03FF;

    double magnitude = 0.0;
    if (exponent == 0) {
        magnitude = std::ldexp(static_cast<double>(mantissa), -24);
    } else if (exponent == 0x1F) {
        magnitude = mantissa == 0 ? std::numeric_limits<double>::infinity()
                                  : std::numeric_limits<double>::quiet_NaN();
    } else {
        magnitude = std::ldexp(static_cast<double>(mantissa + 0x0400), exponent - 25);
    }
    return negative ? -magnitude : magnitude;
}

} // namespace protocol
