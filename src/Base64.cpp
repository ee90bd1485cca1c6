#include "clipfolio/Base64.hpp"
#include <cstdint>

namespace clipfolio {

static const char* B64_TABLE = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static int b64Index(unsigned char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

std::string base64Encode(std::string_view bytes) {
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);
    for (size_t i = 0; i < bytes.size(); i += 3) {
        const uint32_t a = static_cast<uint8_t>(bytes[i]);
        const uint32_t b = (i + 1 < bytes.size()) ? static_cast<uint8_t>(bytes[i + 1]) : 0;
        const uint32_t c = (i + 2 < bytes.size()) ? static_cast<uint8_t>(bytes[i + 2]) : 0;
        const uint32_t triple = (a << 16) | (b << 8) | c;

        out.push_back(B64_TABLE[(triple >> 18) & 0x3F]);
        out.push_back(B64_TABLE[(triple >> 12) & 0x3F]);
        out.push_back((i + 1 < bytes.size()) ? B64_TABLE[(triple >> 6) & 0x3F] : '=');
        out.push_back((i + 2 < bytes.size()) ? B64_TABLE[triple & 0x3F] : '=');
    }
    return out;
}

std::optional<std::string> base64Decode(std::string_view text) {
    // Strip data URI header
    size_t comma = text.find(',');
    if (comma != std::string_view::npos) text = text.substr(comma + 1);

    std::string s;
    s.reserve(text.size());
    for (char c : text) {
        if (c == '\n' || c == '\r' || c == '\t' || c == ' ') continue;
        s.push_back(c);
    }
    if (s.size() % 4 != 0) return std::nullopt;

    std::string out;
    out.reserve((s.size() / 4) * 3);
    for (size_t i = 0; i < s.size(); i += 4) {
        int v[4];
        for (int k = 0; k < 4; k++) {
            unsigned char c = static_cast<unsigned char>(s[i + k]);
            if (c == '=') {
                // Padding only in the last two positions of the final quartet
                if (i + 4 != s.size() || k < 2) return std::nullopt;
                v[k] = -2;
            } else {
                v[k] = b64Index(c);
                if (v[k] < 0) return std::nullopt;
            }
        }
        if (v[2] == -2 && v[3] != -2) return std::nullopt;

        uint32_t triple = (static_cast<uint32_t>(v[0]) << 18) | (static_cast<uint32_t>(v[1]) << 12);
        if (v[2] >= 0) triple |= static_cast<uint32_t>(v[2]) << 6;
        if (v[3] >= 0) triple |= static_cast<uint32_t>(v[3]);

        out.push_back(static_cast<char>((triple >> 16) & 0xFF));
        if (v[2] >= 0) out.push_back(static_cast<char>((triple >> 8) & 0xFF));
        if (v[3] >= 0) out.push_back(static_cast<char>(triple & 0xFF));
    }
    return out;
}

} // namespace clipfolio
