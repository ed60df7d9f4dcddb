#include "protocol/base64.h"
#include <array>
#include <cstdint>
#include <vector>

namespace samaira {
namespace protocol {

namespace {

const char b64_table[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::array<int, 256> make_reverse_table() {
    std::array<int, 256> t;
    t.fill(-1);
    for (int i = 0; i < 64; i++) {
        t[static_cast<unsigned char>(b64_table[i])] = i;
    }
    return t;
}

} // anonymous namespace

std::string base64_encode_pcm16(const AudioBuffer& samples) {
    std::vector<uint8_t> bytes;
    bytes.reserve(samples.size() * 2);
    for (Sample s : samples) {
        uint16_t u = static_cast<uint16_t>(s);
        bytes.push_back(static_cast<uint8_t>(u & 0xFF));
        bytes.push_back(static_cast<uint8_t>(u >> 8));
    }

    std::string ret;
    ret.reserve(((bytes.size() + 2) / 3) * 4);
    int val = 0, valb = -6;
    for (uint8_t b : bytes) {
        val = ((val << 8) + b) & 0xFFFFFF;
        valb += 8;
        while (valb >= 0) {
            ret.push_back(b64_table[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6) ret.push_back(b64_table[((val << 8) >> (valb + 8)) & 0x3F]);
    while (ret.size() % 4) ret.push_back('=');
    return ret;
}

Result<AudioBuffer> base64_decode_pcm16(const std::string& encoded) {
    static const std::array<int, 256> T = make_reverse_table();

    if (encoded.empty()) {
        return make_protocol_error("Empty audio payload");
    }
    if (encoded.size() % 4 != 0) {
        return make_protocol_error("Base64 length is not a multiple of 4");
    }

    size_t padding = 0;
    if (encoded[encoded.size() - 1] == '=') {
        padding++;
        if (encoded[encoded.size() - 2] == '=') padding++;
    }
    const size_t data_chars = encoded.size() - padding;

    std::vector<uint8_t> bytes;
    bytes.reserve(encoded.size() / 4 * 3);
    int val = 0, valb = -8;
    for (size_t i = 0; i < data_chars; ++i) {
        int d = T[static_cast<unsigned char>(encoded[i])];
        if (d == -1) {
            return make_protocol_error("Invalid base64 character at offset " + std::to_string(i));
        }
        val = ((val << 6) + d) & 0xFFFFFF;
        valb += 6;
        if (valb >= 0) {
            bytes.push_back(static_cast<uint8_t>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }

    if (bytes.size() % 2 != 0) {
        return make_protocol_error("PCM16 payload has odd byte count");
    }

    AudioBuffer out(bytes.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        uint16_t u = static_cast<uint16_t>(bytes[2 * i]) |
                     static_cast<uint16_t>(bytes[2 * i + 1] << 8);
        out[i] = static_cast<Sample>(u);
    }
    return out;
}

} // namespace protocol
} // namespace samaira
