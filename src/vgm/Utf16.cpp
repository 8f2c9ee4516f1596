#include "vgmtool/vgm/Utf16.hpp"

#include <format>

namespace vgmtool::vgm {
namespace {

void appendUtf8(std::string& out, std::uint32_t codePoint) {
    if (codePoint < 0x80) {
        out.push_back(static_cast<char>(codePoint));
    } else if (codePoint < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    } else if (codePoint < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (codePoint >> 18)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    }
}

void appendUnit(std::vector<std::uint8_t>& out, std::uint16_t unit) {
    out.push_back(static_cast<std::uint8_t>(unit & 0xFFu));
    out.push_back(static_cast<std::uint8_t>(unit >> 8));
}

}  // namespace

VgmResult<std::string> decodeUtf16Le(std::span<const std::uint8_t> bytes, std::string_view field) {
    if (bytes.size() % 2 != 0) {
        return std::unexpected(
            VgmError::invalidUtf16(std::string(field), std::format("odd byte count {}", bytes.size())));
    }

    std::string out;
    out.reserve(bytes.size() / 2);
    const std::size_t unitCount = bytes.size() / 2;
    for (std::size_t i = 0; i < unitCount; ++i) {
        const std::uint16_t unit = static_cast<std::uint16_t>(bytes[i * 2] | (bytes[i * 2 + 1] << 8));
        if (unit >= 0xD800 && unit <= 0xDBFF) {
            if (i + 1 >= unitCount) {
                return std::unexpected(VgmError::invalidUtf16(std::string(field), "truncated surrogate pair"));
            }
            const std::uint16_t low = static_cast<std::uint16_t>(bytes[(i + 1) * 2] | (bytes[(i + 1) * 2 + 1] << 8));
            if (low < 0xDC00 || low > 0xDFFF) {
                return std::unexpected(VgmError::invalidUtf16(
                    std::string(field), std::format("high surrogate 0x{:04X} followed by 0x{:04X}", unit, low)));
            }
            appendUtf8(out, 0x10000u + ((static_cast<std::uint32_t>(unit) - 0xD800u) << 10) + (low - 0xDC00u));
            ++i;
            continue;
        }
        if (unit >= 0xDC00 && unit <= 0xDFFF) {
            return std::unexpected(
                VgmError::invalidUtf16(std::string(field), std::format("unpaired low surrogate 0x{:04X}", unit)));
        }
        appendUtf8(out, unit);
    }
    return out;
}

VgmResult<std::vector<std::uint8_t>> encodeUtf16Le(std::string_view utf8, std::string_view field) {
    std::vector<std::uint8_t> out;
    out.reserve(utf8.size() * 2);

    std::size_t i = 0;
    while (i < utf8.size()) {
        const auto lead = static_cast<std::uint8_t>(utf8[i]);
        std::uint32_t codePoint = 0;
        std::size_t extra = 0;
        if (lead < 0x80) {
            codePoint = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            codePoint = lead & 0x1Fu;
            extra = 1;
        } else if ((lead & 0xF0) == 0xE0) {
            codePoint = lead & 0x0Fu;
            extra = 2;
        } else if ((lead & 0xF8) == 0xF0) {
            codePoint = lead & 0x07u;
            extra = 3;
        } else {
            return std::unexpected(
                VgmError::invalidUtf16(std::string(field), std::format("invalid UTF-8 lead byte at {}", i)));
        }

        if (i + extra >= utf8.size()) {
            return std::unexpected(VgmError::invalidUtf16(std::string(field), "truncated UTF-8 sequence"));
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const auto cont = static_cast<std::uint8_t>(utf8[i + k]);
            if ((cont & 0xC0) != 0x80) {
                return std::unexpected(
                    VgmError::invalidUtf16(std::string(field), std::format("invalid UTF-8 continuation at {}", i + k)));
            }
            codePoint = (codePoint << 6) | (cont & 0x3Fu);
        }
        // Shortest form only; anything else would not survive a decode.
        constexpr std::uint32_t kMinForLength[] = {0x00, 0x80, 0x800, 0x10000};
        if (codePoint < kMinForLength[extra]) {
            return std::unexpected(
                VgmError::invalidUtf16(std::string(field), std::format("overlong UTF-8 sequence at {}", i)));
        }
        // A 0x0000 unit terminates the string on disk.
        if (codePoint == 0) {
            return std::unexpected(
                VgmError::invalidUtf16(std::string(field), std::format("embedded NUL at {}", i)));
        }
        if (codePoint > 0x10FFFF || (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
            return std::unexpected(
                VgmError::invalidUtf16(std::string(field), std::format("code point U+{:X} not encodable", codePoint)));
        }

        if (codePoint >= 0x10000) {
            const std::uint32_t v = codePoint - 0x10000;
            appendUnit(out, static_cast<std::uint16_t>(0xD800 + (v >> 10)));
            appendUnit(out, static_cast<std::uint16_t>(0xDC00 + (v & 0x3FF)));
        } else {
            appendUnit(out, static_cast<std::uint16_t>(codePoint));
        }
        i += extra + 1;
    }
    return out;
}

}  // namespace vgmtool::vgm
