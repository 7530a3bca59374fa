#include <timeshare/common/critical.hpp>
#include <timeshare/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string_view>

namespace timeshare::schema {

namespace {

constexpr auto kHexDigits = std::string_view{"0123456789abcdef"};
constexpr auto kBase64Table = std::string_view{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

std::string_view strip_hex_prefix(std::string_view input) {
  if (input.starts_with("0x") || input.starts_with("0X")) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_value(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<uint8_t> base64_value(const char c) {
  auto position = kBase64Table.find(c);
  if (position == std::string_view::npos) {
    return std::nullopt;
  }
  return static_cast<uint8_t>(position);
}

std::optional<hash32_t> hash32_from_hex(std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != std::tuple_size_v<hash32_t>) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::ranges::copy(*decoded, std::begin(hash));
  return hash;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{make_string_view(bytes)};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{make_string_view(bytes)};
}

hash32_t make_hash32(const bytes_t& bytes) {
  if (bytes.size() != std::tuple_size_v<hash32_t>) {
    timeshare::common::critical("make_hash32 expected exactly 32 bytes");
  }
  auto hash = hash32_t{};
  std::ranges::copy(bytes, std::begin(hash));
  return hash;
}

hash32_t make_hash32(const std::string& bytes) {
  return make_hash32(std::string_view{bytes});
}

hash32_t make_hash32(const std::string_view& bytes) {
  auto hash = hash32_from_hex(bytes);
  if (!hash) {
    timeshare::common::critical("make_hash32 expected 64 hex characters");
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string& bytes) {
  return hash32_from_hex(bytes);
}

std::optional<hash32_t> try_make_hash32(const std::string_view& bytes) {
  return hash32_from_hex(bytes);
}

hash32_t make_zero_hash() {
  return {};
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto value : bytes) {
    out.push_back(kHexDigits[(value >> 4u) & 0x0Fu]);
    out.push_back(kHexDigits[value & 0x0Fu]);
  }
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = strip_hex_prefix(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }
  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_value(hex[i]);
    auto low = hex_value(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

std::string to_base64(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);

  auto index = size_t{0};
  for (; (index + 3) <= bytes.size(); index += 3) {
    auto value = (static_cast<uint32_t>(bytes[index]) << 16u) |
                 (static_cast<uint32_t>(bytes[index + 1]) << 8u) |
                 static_cast<uint32_t>(bytes[index + 2]);
    out.push_back(kBase64Table[(value >> 18u) & 0x3Fu]);
    out.push_back(kBase64Table[(value >> 12u) & 0x3Fu]);
    out.push_back(kBase64Table[(value >> 6u) & 0x3Fu]);
    out.push_back(kBase64Table[value & 0x3Fu]);
  }

  auto remaining = bytes.size() - index;
  if (remaining == 0) {
    return out;
  }
  auto value = static_cast<uint32_t>(bytes[index]) << 16u;
  if (remaining == 2) {
    value |= static_cast<uint32_t>(bytes[index + 1]) << 8u;
  }
  out.push_back(kBase64Table[(value >> 18u) & 0x3Fu]);
  out.push_back(kBase64Table[(value >> 12u) & 0x3Fu]);
  out.push_back(remaining == 2 ? kBase64Table[(value >> 6u) & 0x3Fu] : '=');
  out.push_back('=');
  return out;
}

std::optional<bytes_t> try_from_base64(std::string_view encoded) {
  auto compact = std::string{};
  compact.reserve(encoded.size());
  std::ranges::copy_if(encoded, std::back_inserter(compact), [](char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) == 0;
  });
  if ((compact.size() % 4) != 0) {
    return std::nullopt;
  }

  auto out = bytes_t{};
  out.reserve((compact.size() / 4) * 3);
  for (size_t i = 0; i < compact.size(); i += 4) {
    auto last = (i + 4) == compact.size();
    auto padding = size_t{0};
    auto value = uint32_t{0};
    for (size_t j = 0; j < 4; ++j) {
      auto ch = compact[i + j];
      if (ch == '=') {
        // Padding is only valid in the last two positions of the last block.
        if (!last || j < 2) {
          return std::nullopt;
        }
        ++padding;
        value <<= 6u;
        continue;
      }
      if (padding > 0) {
        return std::nullopt;
      }
      auto sextet = base64_value(ch);
      if (!sextet) {
        return std::nullopt;
      }
      value = (value << 6u) | *sextet;
    }
    out.push_back(static_cast<uint8_t>((value >> 16u) & 0xFFu));
    if (padding < 2) {
      out.push_back(static_cast<uint8_t>((value >> 8u) & 0xFFu));
    }
    if (padding < 1) {
      out.push_back(static_cast<uint8_t>(value & 0xFFu));
    }
  }
  return out;
}

bytes_t from_base64(std::string_view encoded) {
  auto decoded = try_from_base64(encoded);
  if (!decoded.has_value()) {
    timeshare::common::critical("invalid base64 input");
  }
  return *decoded;
}

std::string to_string(const signer_id_t& signer) {
  return std::visit(
      overloaded{[](const ed25519_signer_id& value) {
                   return "ed25519:" + to_hex(value.public_key);
                 },
                 [](const secp256k1_signer_id& value) {
                   return "secp256k1:" + to_hex(value.public_key);
                 },
                 [](const named_signer_t& value) {
                   return "named:" + to_hex(value);
                 }},
      signer);
}

std::optional<signer_id_t> try_make_signer_id(std::string_view text) {
  auto separator = text.find(':');
  auto kind = separator == std::string_view::npos ? std::string_view{"named"}
                                                  : text.substr(0, separator);
  if (separator != std::string_view::npos) {
    text.remove_prefix(separator + 1);
  }

  auto decoded = try_from_hex(text);
  if (!decoded) {
    return std::nullopt;
  }
  auto copy_into = [&](auto& key) -> bool {
    if (decoded->size() != key.size()) {
      return false;
    }
    std::ranges::copy(*decoded, std::begin(key));
    return true;
  };

  if (kind == "ed25519") {
    auto signer = ed25519_signer_id{};
    if (!copy_into(signer.public_key)) {
      return std::nullopt;
    }
    return signer_id_t{signer};
  }
  if (kind == "secp256k1") {
    auto signer = secp256k1_signer_id{};
    if (!copy_into(signer.public_key)) {
      return std::nullopt;
    }
    return signer_id_t{signer};
  }
  if (kind == "named") {
    auto named = named_signer_t{};
    if (!copy_into(named)) {
      return std::nullopt;
    }
    return signer_id_t{named};
  }
  return std::nullopt;
}

}  // namespace timeshare::schema
