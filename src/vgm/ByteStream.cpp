#include "vgmtool/vgm/ByteStream.hpp"

#include <algorithm>
#include <iterator>

namespace vgmtool::vgm {

VgmResult<void> ByteReader::require(std::size_t count) const {
    if (remaining() < count) {
        return std::unexpected(VgmError::bufferUnderflow(position_, count, remaining()));
    }
    return {};
}

VgmResult<std::uint8_t> ByteReader::peekU8() const {
    if (auto ok = require(1); !ok) {
        return std::unexpected(ok.error());
    }
    return data_[position_];
}

VgmResult<std::uint8_t> ByteReader::readU8() {
    if (auto ok = require(1); !ok) {
        return std::unexpected(ok.error());
    }
    return data_[position_++];
}

VgmResult<std::uint16_t> ByteReader::readU16() {
    if (auto ok = require(2); !ok) {
        return std::unexpected(ok.error());
    }
    const auto value = static_cast<std::uint16_t>(data_[position_] | (data_[position_ + 1] << 8));
    position_ += 2;
    return value;
}

VgmResult<std::uint16_t> ByteReader::readU16Be() {
    if (auto ok = require(2); !ok) {
        return std::unexpected(ok.error());
    }
    const auto value = static_cast<std::uint16_t>((data_[position_] << 8) | data_[position_ + 1]);
    position_ += 2;
    return value;
}

VgmResult<std::uint32_t> ByteReader::readU24() {
    if (auto ok = require(3); !ok) {
        return std::unexpected(ok.error());
    }
    const std::uint32_t value = static_cast<std::uint32_t>(data_[position_]) |
                                (static_cast<std::uint32_t>(data_[position_ + 1]) << 8) |
                                (static_cast<std::uint32_t>(data_[position_ + 2]) << 16);
    position_ += 3;
    return value;
}

VgmResult<std::uint32_t> ByteReader::readU32() {
    if (auto ok = require(4); !ok) {
        return std::unexpected(ok.error());
    }
    std::uint32_t value = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        value |= static_cast<std::uint32_t>(data_[position_ + i]) << (8 * i);
    }
    position_ += 4;
    return value;
}

VgmResult<std::uint32_t> ByteReader::readU32Be() {
    if (auto ok = require(4); !ok) {
        return std::unexpected(ok.error());
    }
    std::uint32_t value = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        value = (value << 8) | data_[position_ + i];
    }
    position_ += 4;
    return value;
}

VgmResult<std::vector<std::uint8_t>> ByteReader::readBytes(std::size_t count) {
    if (auto ok = require(count); !ok) {
        return std::unexpected(ok.error());
    }
    const auto first = data_.begin() + static_cast<std::ptrdiff_t>(position_);
    std::vector<std::uint8_t> out(first, first + static_cast<std::ptrdiff_t>(count));
    position_ += count;
    return out;
}

VgmResult<void> ByteReader::skip(std::size_t count) {
    if (auto ok = require(count); !ok) {
        return std::unexpected(ok.error());
    }
    position_ += count;
    return {};
}

VgmResult<void> ByteReader::seek(std::size_t position) {
    if (position > data_.size()) {
        return std::unexpected(VgmError::bufferUnderflow(position_, position - position_, remaining()));
    }
    position_ = position;
    return {};
}

void ByteWriter::writeU8(std::uint8_t value) {
    buffer().push_back(value);
}

void ByteWriter::writeU16(std::uint16_t value) {
    auto& out = buffer();
    out.push_back(static_cast<std::uint8_t>(value & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
}

void ByteWriter::writeU16Be(std::uint16_t value) {
    auto& out = buffer();
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>(value & 0xFFu));
}

void ByteWriter::writeU24(std::uint32_t value) {
    auto& out = buffer();
    for (int i = 0; i < 3; ++i) {
        out.push_back(static_cast<std::uint8_t>((value >> (8 * i)) & 0xFFu));
    }
}

void ByteWriter::writeU32(std::uint32_t value) {
    auto& out = buffer();
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<std::uint8_t>((value >> (8 * i)) & 0xFFu));
    }
}

void ByteWriter::writeU32Be(std::uint32_t value) {
    auto& out = buffer();
    for (int i = 3; i >= 0; --i) {
        out.push_back(static_cast<std::uint8_t>((value >> (8 * i)) & 0xFFu));
    }
}

void ByteWriter::writeBytes(std::span<const std::uint8_t> bytes) {
    auto& out = buffer();
    out.insert(out.end(), bytes.begin(), bytes.end());
}

void ByteWriter::padTo(std::size_t position) {
    auto& out = buffer();
    if (out.size() < position) {
        out.resize(position, 0);
    }
}

VgmResult<void> ByteWriter::patchU32(std::size_t position, std::uint32_t value) {
    auto& out = buffer();
    if (position + 4 > out.size()) {
        const std::size_t available = out.size() > position ? out.size() - position : 0;
        return std::unexpected(VgmError::bufferUnderflow(position, 4, available));
    }
    for (std::size_t i = 0; i < 4; ++i) {
        out[position + i] = static_cast<std::uint8_t>((value >> (8 * i)) & 0xFFu);
    }
    return {};
}

}  // namespace vgmtool::vgm
