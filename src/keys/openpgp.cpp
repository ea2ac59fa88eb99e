/**
 * @file openpgp.cpp
 * @brief Implementation of the OpenPGP public key parser
 */

#include "relvault/keys/openpgp.hpp"

#include <relvault/compat/format.hpp>
#include <relvault/security/crypto.hpp>

#include <algorithm>
#include <array>
#include <cctype>

namespace relvault::keys {

namespace crypto = relvault::security::crypto;

// =============================================================================
// Constants
// =============================================================================

namespace {

constexpr std::string_view begin_marker = "-----BEGIN PGP PUBLIC KEY BLOCK-----";
constexpr std::string_view end_marker = "-----END PGP PUBLIC KEY BLOCK-----";
constexpr const char* module_name = "openpgp";

constexpr std::size_t armor_line_width = 64;

/// Curve OIDs of ECC keys and their field size in bits
struct curve_info {
    std::array<std::uint8_t, 10> oid;
    std::size_t oid_size;
    int bits;
};

constexpr std::array<curve_info, 5> known_curves = {{
    // NIST P-256
    {{0x2A, 0x86, 0x48, 0xCE, 0x3D, 0x03, 0x01, 0x07}, 8, 256},
    // NIST P-384
    {{0x2B, 0x81, 0x04, 0x00, 0x22}, 5, 384},
    // NIST P-521
    {{0x2B, 0x81, 0x04, 0x00, 0x23}, 5, 521},
    // Ed25519
    {{0x2B, 0x06, 0x01, 0x04, 0x01, 0xDA, 0x47, 0x0F, 0x01}, 9, 256},
    // Curve25519
    {{0x2B, 0x06, 0x01, 0x04, 0x01, 0x97, 0x55, 0x01, 0x05, 0x01}, 10, 256},
}};

struct packet {
    int tag{0};
    byte_buffer body;
};

template <typename T>
auto parse_error(const std::string& message) -> Result<T> {
    return relvault_error<T>(error_codes::key_parse_error, message, module_name);
}

auto trim(std::string_view s) -> std::string_view {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

auto split_lines(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            if (start < text.size()) {
                lines.push_back(text.substr(start));
            }
            break;
        }
        auto line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

auto to_lower(std::string_view s) -> std::string {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

auto read_be(const byte_buffer& data, std::size_t pos, std::size_t count)
    -> std::uint32_t {
    std::uint32_t value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        value = (value << 8) | data[pos + i];
    }
    return value;
}

// =============================================================================
// Armor
// =============================================================================

auto dearmor(std::string_view text) -> Result<byte_buffer> {
    auto lines = split_lines(text);

    std::size_t i = 0;
    while (i < lines.size() && trim(lines[i]) != begin_marker) {
        ++i;
    }
    if (i == lines.size()) {
        return parse_error<byte_buffer>("Missing BEGIN PGP PUBLIC KEY BLOCK");
    }
    ++i;

    // Armor headers ("Version: ...", "Comment: ...") end at a blank line
    while (i < lines.size() && !trim(lines[i]).empty() &&
           lines[i].find(':') != std::string_view::npos) {
        ++i;
    }
    if (i < lines.size() && trim(lines[i]).empty()) {
        ++i;
    }

    std::string body;
    std::optional<std::string_view> checksum;
    bool terminated = false;
    for (; i < lines.size(); ++i) {
        auto line = trim(lines[i]);
        if (line == end_marker) {
            terminated = true;
            break;
        }
        if (!line.empty() && line.front() == '=' && line.size() == 5) {
            checksum = line.substr(1);
            continue;
        }
        if (checksum) {
            return parse_error<byte_buffer>("Data after armor checksum");
        }
        body.append(line);
    }
    if (!terminated) {
        return parse_error<byte_buffer>("Missing END PGP PUBLIC KEY BLOCK");
    }

    auto decoded = crypto::base64_decode(body);
    if (!decoded || decoded->empty()) {
        return parse_error<byte_buffer>("Armor body is not valid base64");
    }

    if (checksum) {
        auto crc_bytes = crypto::base64_decode(*checksum);
        if (!crc_bytes || crc_bytes->size() != 3) {
            return parse_error<byte_buffer>("Armor checksum is not valid base64");
        }
        if (read_be(*crc_bytes, 0, 3) != crc24(*decoded)) {
            return parse_error<byte_buffer>("Armor checksum mismatch");
        }
    }
    return std::move(*decoded);
}

// =============================================================================
// Packets
// =============================================================================

auto read_packets(const byte_buffer& data) -> Result<std::vector<packet>> {
    std::vector<packet> packets;
    std::size_t pos = 0;

    while (pos < data.size()) {
        std::uint8_t ctb = data[pos++];
        if ((ctb & 0x80) == 0) {
            return parse_error<std::vector<packet>>("Invalid packet header");
        }

        packet pkt;
        std::size_t length = 0;

        if (ctb & 0x40) {
            // New format
            pkt.tag = ctb & 0x3F;
            if (pos >= data.size()) {
                return parse_error<std::vector<packet>>("Truncated packet length");
            }
            std::uint8_t first = data[pos++];
            if (first < 192) {
                length = first;
            } else if (first < 224) {
                if (pos >= data.size()) {
                    return parse_error<std::vector<packet>>("Truncated packet length");
                }
                length = ((static_cast<std::size_t>(first) - 192) << 8) +
                         data[pos++] + 192;
            } else if (first == 255) {
                if (pos + 4 > data.size()) {
                    return parse_error<std::vector<packet>>("Truncated packet length");
                }
                length = read_be(data, pos, 4);
                pos += 4;
            } else {
                return parse_error<std::vector<packet>>(
                    "Partial body lengths are not allowed in key packets");
            }
        } else {
            // Old format
            pkt.tag = (ctb >> 2) & 0x0F;
            switch (ctb & 0x03) {
                case 0:
                case 1:
                case 2: {
                    std::size_t n = std::size_t{1} << (ctb & 0x03);
                    if (pos + n > data.size()) {
                        return parse_error<std::vector<packet>>(
                            "Truncated packet length");
                    }
                    length = read_be(data, pos, n);
                    pos += n;
                    break;
                }
                default:
                    length = data.size() - pos;
                    break;
            }
        }

        if (length > data.size() - pos) {
            return parse_error<std::vector<packet>>("Truncated packet body");
        }
        pkt.body.assign(data.begin() + static_cast<std::ptrdiff_t>(pos),
                        data.begin() + static_cast<std::ptrdiff_t>(pos + length));
        pos += length;
        packets.push_back(std::move(pkt));
    }
    return packets;
}

auto parse_public_key_packet(const byte_buffer& body, parsed_key& key)
    -> VoidResult {
    if (body.size() < 6) {
        return relvault_void_error(error_codes::key_parse_error,
                                   "Public key packet too short", module_name);
    }
    if (body[0] != 4) {
        return relvault_void_error(
            error_codes::key_parse_error,
            compat::format("Unsupported public key version {}", int(body[0])),
            module_name);
    }

    key.created = std::chrono::system_clock::time_point(
        std::chrono::seconds(read_be(body, 1, 4)));
    key.algorithm = body[5];

    switch (static_cast<public_key_algorithm>(key.algorithm)) {
        case public_key_algorithm::rsa:
        case public_key_algorithm::rsa_encrypt_only:
        case public_key_algorithm::rsa_sign_only:
        case public_key_algorithm::dsa:
        case public_key_algorithm::elgamal:
            // Size of the first MPI (n for RSA, p otherwise)
            if (body.size() < 8) {
                return relvault_void_error(error_codes::key_parse_error,
                                           "Missing key material", module_name);
            }
            key.length = static_cast<int>(read_be(body, 6, 2));
            break;
        case public_key_algorithm::ecdh:
        case public_key_algorithm::ecdsa:
        case public_key_algorithm::eddsa: {
            if (body.size() < 7 || body.size() < 7u + body[6]) {
                return relvault_void_error(error_codes::key_parse_error,
                                           "Missing curve OID", module_name);
            }
            std::size_t oid_size = body[6];
            key.length = 0;
            for (const auto& curve : known_curves) {
                if (curve.oid_size == oid_size &&
                    std::equal(curve.oid.begin(), curve.oid.begin() + oid_size,
                               body.begin() + 7)) {
                    key.length = curve.bits;
                    break;
                }
            }
            break;
        }
        default:
            return relvault_void_error(
                error_codes::key_parse_error,
                compat::format("Unsupported public key algorithm {}", key.algorithm),
                module_name);
    }

    // v4 fingerprint: SHA-1 over 0x99, two-octet length, packet body
    byte_buffer hashed;
    hashed.reserve(body.size() + 3);
    hashed.push_back(0x99);
    hashed.push_back(static_cast<std::uint8_t>((body.size() >> 8) & 0xFF));
    hashed.push_back(static_cast<std::uint8_t>(body.size() & 0xFF));
    hashed.insert(hashed.end(), body.begin(), body.end());

    key.fingerprint = crypto::to_hex(crypto::sha1(hashed));
    key.key_id = key.fingerprint.substr(key.fingerprint.size() - 16);
    return ok();
}

auto extract_email(std::string_view uid) -> std::optional<std::string> {
    auto open = uid.rfind('<');
    auto close = uid.rfind('>');
    if (open != std::string_view::npos && close != std::string_view::npos &&
        close > open + 1) {
        return to_lower(uid.substr(open + 1, close - open - 1));
    }
    auto bare = trim(uid);
    if (bare.find('@') != std::string_view::npos &&
        bare.find(' ') == std::string_view::npos) {
        return to_lower(bare);
    }
    return std::nullopt;
}

auto declared_uids(const parsed_key& key) -> std::vector<std::string> {
    std::vector<std::string> uids;
    if (key.primary_declared_uid) {
        uids.push_back(*key.primary_declared_uid);
    }
    uids.insert(uids.end(), key.secondary_declared_uids.begin(),
                key.secondary_declared_uids.end());
    return uids;
}

}  // namespace

// =============================================================================
// Public API
// =============================================================================

auto crc24(const byte_buffer& data) noexcept -> std::uint32_t {
    std::uint32_t crc = 0xB704CE;
    for (auto b : data) {
        crc ^= static_cast<std::uint32_t>(b) << 16;
        for (int i = 0; i < 8; ++i) {
            crc <<= 1;
            if (crc & 0x1000000) {
                crc ^= 0x1864CFB;
            }
        }
    }
    return crc & 0xFFFFFF;
}

auto armor_public_key(const byte_buffer& packets) -> std::string {
    auto body = crypto::base64_encode(packets);
    auto crc = crc24(packets);
    byte_buffer crc_bytes = {static_cast<std::uint8_t>((crc >> 16) & 0xFF),
                             static_cast<std::uint8_t>((crc >> 8) & 0xFF),
                             static_cast<std::uint8_t>(crc & 0xFF)};

    std::string out;
    out.reserve(body.size() + body.size() / armor_line_width + 96);
    out.append(begin_marker).append("\n\n");
    for (std::size_t i = 0; i < body.size(); i += armor_line_width) {
        out.append(body.substr(i, armor_line_width)).push_back('\n');
    }
    out.append("=").append(crypto::base64_encode(crc_bytes)).push_back('\n');
    out.append(end_marker).push_back('\n');
    return out;
}

auto parse_armored_key(std::string_view armored) -> Result<parsed_key> {
    auto data = dearmor(armored);
    if (data.is_err()) {
        return Result<parsed_key>(data.error());
    }

    auto packets = read_packets(data.value());
    if (packets.is_err()) {
        return Result<parsed_key>(packets.error());
    }

    const auto& list = packets.value();
    if (list.empty() || list.front().tag != packet_tag::public_key) {
        return parse_error<parsed_key>("Block does not start with a public key");
    }

    parsed_key key;
    auto header = parse_public_key_packet(list.front().body, key);
    if (header.is_err()) {
        return Result<parsed_key>(header.error());
    }

    bool have_primary_uid = false;
    for (std::size_t i = 1; i < list.size(); ++i) {
        const auto& pkt = list[i];
        if (pkt.tag == packet_tag::public_key) {
            return parse_error<parsed_key>("Block contains more than one key");
        }
        if (pkt.tag != packet_tag::user_id) {
            continue;
        }
        std::string uid(pkt.body.begin(), pkt.body.end());
        if (!have_primary_uid) {
            key.primary_declared_uid = std::move(uid);
            have_primary_uid = true;
        } else {
            key.secondary_declared_uids.push_back(std::move(uid));
        }
    }

    key.ascii_armored_key = armor_public_key(data.value());
    return key;
}

auto split_key_blocks(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> blocks;
    std::string current;
    bool inside = false;

    for (auto line : split_lines(text)) {
        auto trimmed = trim(line);
        if (trimmed == begin_marker) {
            if (inside) {
                // Unterminated block followed by a new one
                blocks.push_back(std::move(current));
            }
            current.assign(trimmed).push_back('\n');
            inside = true;
            continue;
        }
        if (!inside) {
            continue;
        }
        current.append(line).push_back('\n');
        if (trimmed == end_marker) {
            blocks.push_back(std::move(current));
            current.clear();
            inside = false;
        }
    }
    if (inside) {
        blocks.push_back(std::move(current));
    }
    return blocks;
}

auto algorithm_name(int algorithm, int length) -> std::string {
    switch (static_cast<public_key_algorithm>(algorithm)) {
        case public_key_algorithm::rsa:
        case public_key_algorithm::rsa_encrypt_only:
        case public_key_algorithm::rsa_sign_only:
            return compat::format("rsa{}", length);
        case public_key_algorithm::dsa:
            return compat::format("dsa{}", length);
        case public_key_algorithm::elgamal:
            return compat::format("elg{}", length);
        case public_key_algorithm::eddsa:
            return "ed25519";
        case public_key_algorithm::ecdsa:
            return compat::format("nistp{}", length);
        case public_key_algorithm::ecdh:
            return compat::format("ecdh{}", length);
    }
    return compat::format("unknown{}", algorithm);
}

auto find_apache_uid(const parsed_key& key) -> std::optional<std::string> {
    constexpr std::string_view domain = "@apache.org";
    for (const auto& uid : declared_uids(key)) {
        auto email = extract_email(uid);
        if (email && email->size() > domain.size() &&
            email->ends_with(domain)) {
            return email->substr(0, email->size() - domain.size());
        }
    }
    return std::nullopt;
}

bool declares_email(const parsed_key& key, std::string_view email) {
    auto wanted = to_lower(email);
    for (const auto& uid : declared_uids(key)) {
        if (extract_email(uid) == wanted) {
            return true;
        }
    }
    return false;
}

}  // namespace relvault::keys
