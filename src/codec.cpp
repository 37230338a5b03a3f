#include <ot-cpp/codec.hpp>

#include "codec/byte_reader.hpp"
#include "codec/compression.hpp"
#include "encoding/leb128.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <string_view>
#include <utility>

namespace ot_cpp {

namespace {

constexpr std::uint8_t flag_plain = 0x00;
constexpr std::uint8_t flag_deflated = 0x01;

constexpr std::uint64_t tag_retain = 0;
constexpr std::uint64_t tag_insert = 1;
constexpr std::uint64_t tag_delete = 2;
constexpr std::uint64_t tag_mask = 0x03;

// Longest run a single header can carry. Longer retains and deletes are
// written as several headers, which decode merges back together.
constexpr std::uint64_t max_header_length = ~std::uint64_t{0} >> 2;

auto header_count(std::uint64_t length) -> std::uint64_t {
    return (length + max_header_length - 1) / max_header_length;
}

void encode_run(std::uint64_t length, std::uint64_t tag, std::vector<std::byte>& out) {
    while (length > 0) {
        const auto piece = std::min(length, max_header_length);
        encoding::encode_uleb128((piece << 2) | tag, out);
        length -= piece;
    }
}

void encode_body(const TextOperation& op, std::vector<std::byte>& out) {
    auto headers = std::uint64_t{0};
    for (const auto& o : op) {
        headers += std::holds_alternative<Insert>(o) ? 1 : header_count(length(o));
    }

    encoding::encode_uleb128(headers, out);
    for (const auto& o : op) {
        std::visit(overload{
            [&](const Retain& r) { encode_run(r.count, tag_retain, out); },
            [&](const Insert& i) {
                encoding::encode_uleb128((std::uint64_t{i.text.size()} << 2) | tag_insert, out);
                const auto* bytes = reinterpret_cast<const std::byte*>(i.text.data());
                out.insert(out.end(), bytes, bytes + i.text.size());
            },
            [&](const Delete& d) { encode_run(d.count, tag_delete, out); },
        }, o);
    }
}

auto reject(std::string_view reason) -> std::optional<TextOperation> {
    spdlog::debug("ot-cpp: rejected encoded operation: {}", reason);
    return std::nullopt;
}

auto decode_body(std::span<const std::byte> body) -> std::optional<TextOperation> {
    auto reader = codec::ByteReader{body};
    auto count = reader.read_uleb128();
    if (!count) return reject("truncated op count");

    auto builder = OperationBuilder{};
    const auto append = [&builder](Op op) {
        try {
            builder.append(std::move(op));
        } catch (const IncompatibleOperationError&) {
            return false;
        }
        return true;
    };

    for (std::uint64_t n = 0; n < *count; ++n) {
        auto header = reader.read_uleb128();
        if (!header) return reject("truncated op header");

        const auto len = static_cast<std::size_t>(*header >> 2);
        if (len == 0) return reject("zero-length op");

        switch (*header & tag_mask) {
            case tag_retain:
                if (!append(Retain{len})) return reject("operation length overflow");
                break;
            case tag_insert: {
                auto text = reader.read_text(len);
                if (!text) return reject("truncated insert text");
                if (!append(Insert{std::move(*text)})) return reject("operation length overflow");
                break;
            }
            case tag_delete:
                if (!append(Delete{len})) return reject("operation length overflow");
                break;
            default:
                return reject("unknown op tag");
        }
    }

    if (!reader.at_end()) return reject("trailing bytes after body");
    return std::move(builder).build();
}

}  // anonymous namespace

auto encode(const TextOperation& op, const EncodeOptions& options)
    -> std::vector<std::byte> {
    auto body = std::vector<std::byte>{};
    encode_body(op, body);

    if (options.compress && body.size() >= options.deflate_threshold) {
        auto compressed = codec::deflate_compress(body);
        if (compressed && compressed->size() < body.size()) {
            auto out = std::vector<std::byte>{std::byte{flag_deflated}};
            encoding::encode_uleb128(body.size(), out);
            out.insert(out.end(), compressed->begin(), compressed->end());
            return out;
        }
    }

    auto out = std::vector<std::byte>{std::byte{flag_plain}};
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

auto decode(std::span<const std::byte> data) -> std::optional<TextOperation> {
    auto reader = codec::ByteReader{data};
    auto flag = reader.read_u8();
    if (!flag) return reject("empty input");

    switch (*flag) {
        case flag_plain:
            return decode_body(reader.rest());
        case flag_deflated: {
            auto size = reader.read_uleb128();
            if (!size) return reject("truncated body size");
            auto body = codec::deflate_decompress(reader.rest(),
                                                  static_cast<std::size_t>(*size));
            if (!body) return reject("body failed to inflate");
            return decode_body(*body);
        }
        default:
            return reject("unknown flag byte");
    }
}

}  // namespace ot_cpp
