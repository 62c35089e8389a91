#ifndef JCX_ECLUSE_VALUEGEN_GUID_H
#define JCX_ECLUSE_VALUEGEN_GUID_H

#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace jcailloux::ecluse::valuegen {

// Guid: 16 raw bytes, rendered in the canonical 8-4-4-4-12 form.
// Stored by the MySQL dialect as CHAR(36).

struct Guid {
    std::array<uint8_t, 16> bytes{};

    [[nodiscard]] bool isNil() const noexcept {
        for (auto b : bytes) if (b) return false;
        return true;
    }

    [[nodiscard]] std::string toString() const {
        static constexpr char kHex[] = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
            out += kHex[bytes[i] >> 4];
            out += kHex[bytes[i] & 0x0f];
        }
        return out;
    }

    /// Parse the 36-char dashed form (case-insensitive). nullopt on malformed input.
    static std::optional<Guid> parse(std::string_view text) noexcept {
        if (text.size() != 36) return std::nullopt;
        Guid g;
        size_t byte = 0;
        for (size_t i = 0; i < text.size();) {
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (text[i] != '-') return std::nullopt;
                ++i;
                continue;
            }
            int hi = nibble(text[i]);
            int lo = nibble(text[i + 1]);
            if (hi < 0 || lo < 0) return std::nullopt;
            g.bytes[byte++] = static_cast<uint8_t>((hi << 4) | lo);
            i += 2;
        }
        return g;
    }

    constexpr auto operator<=>(const Guid&) const = default;

private:
    static int nibble(char c) noexcept {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
};

}  // namespace jcailloux::ecluse::valuegen

#endif  // JCX_ECLUSE_VALUEGEN_GUID_H
