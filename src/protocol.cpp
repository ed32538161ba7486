#include "protocol.hpp"

#include <asio/ip/address_v4.hpp>

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>

namespace {

std::vector<std::string> split_fields(const std::string& input, char separator) {
  std::vector<std::string> parts;
  std::string current;
  std::istringstream ss(input);
  while(std::getline(ss, current, separator)) {
    parts.push_back(current);
  }
  if(!input.empty() && input.back() == separator) parts.emplace_back();
  return parts;
}

std::optional<uint16_t> parse_port(const std::string& text) {
  if(text.empty() || text.size() > 5) return std::nullopt;
  if(!std::all_of(text.begin(), text.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) {
    return std::nullopt;
  }
  int value = std::stoi(text);
  if(value <= 0 || value > 65535) return std::nullopt;
  return static_cast<uint16_t>(value);
}

std::string trim_trailing_nulls(std::string value) {
  while(!value.empty() && (value.back() == '\0' || value.back() == '\n' || value.back() == '\r')) {
    value.pop_back();
  }
  return value;
}

} // namespace

const char* payload_kind_name(PayloadKind kind) {
  return kind == PayloadKind::Capability ? kTypeAvatar : kTypeFile;
}

const char* transfer_error_name(TransferError error) {
  switch(error) {
    case TransferError::None: return "none";
    case TransferError::ProtocolFormat: return "protocol";
    case TransferError::ChecksumMismatch: return "checksum";
    case TransferError::Filesystem: return "filesystem";
    case TransferError::Network: return "network";
    case TransferError::Cancelled: return "cancelled";
  }
  return "unknown";
}

bool TransferMetadata::verification_required() const {
  return !expected_checksum.empty() &&
         expected_checksum != kChecksumSkipped &&
         expected_checksum != kChecksumSenderFailed;
}

bool is_ipv4_address(const std::string& candidate) {
  if(candidate.empty()) return false;
  std::error_code ec;
  auto addr = asio::ip::make_address_v4(candidate, ec);
  return !ec && addr.to_string() == candidate;
}

std::string make_announcement(const PeerIdentity& self) {
  std::ostringstream out;
  out << kAnnouncePrefix << ':' << self.display_name << ':' << self.address << ':'
      << self.transfer_port << ':' << self.address;
  return out.str();
}

std::optional<PeerIdentity> parse_announcement(const std::string& raw,
                                               const std::string& source_address,
                                               std::string& error) {
  auto message = trim_trailing_nulls(raw);
  auto parts = split_fields(message, ':');
  if(parts.size() < 5 || parts.front() != kAnnouncePrefix) {
    error = "expected 5 fields";
    return std::nullopt;
  }
  // Fields are taken from the right so a name containing ':' survives.
  const std::string& trailing_addr = parts[parts.size() - 1];
  const std::string& port_text = parts[parts.size() - 2];
  const std::string& leading_addr = parts[parts.size() - 3];
  std::string name;
  for(std::size_t i = 1; i + 3 < parts.size(); ++i) {
    if(i > 1) name += ':';
    name += parts[i];
  }

  if(leading_addr != trailing_addr) {
    error = "embedded addresses differ (" + leading_addr + " vs " + trailing_addr + ")";
    return std::nullopt;
  }
  if(leading_addr != source_address) {
    error = "embedded address " + leading_addr + " does not match source " + source_address;
    return std::nullopt;
  }
  if(!is_ipv4_address(leading_addr)) {
    error = "invalid address '" + leading_addr + "'";
    return std::nullopt;
  }
  auto port = parse_port(port_text);
  if(!port) {
    error = "invalid port '" + port_text + "'";
    return std::nullopt;
  }

  PeerIdentity identity;
  identity.display_name = name;
  identity.address = leading_addr;
  identity.transfer_port = *port;
  return identity;
}

std::string make_avatar_request(const std::string& address, uint16_t transfer_port) {
  std::ostringstream out;
  out << kAvatarRequestPrefix << ':' << address << ':' << address << ':' << transfer_port;
  return out.str();
}

std::optional<AvatarRequest> parse_avatar_request(const std::string& raw,
                                                  const std::string& source_address,
                                                  std::string& error) {
  auto message = trim_trailing_nulls(raw);
  auto parts = split_fields(message, ':');
  if(parts.size() != 4 || parts[0] != kAvatarRequestPrefix) {
    error = "expected 4 fields";
    return std::nullopt;
  }
  if(parts[1] != parts[2]) {
    error = "embedded addresses differ (" + parts[1] + " vs " + parts[2] + ")";
    return std::nullopt;
  }
  if(parts[1] != source_address) {
    error = "embedded address " + parts[1] + " does not match source " + source_address;
    return std::nullopt;
  }
  if(!is_ipv4_address(parts[1])) {
    error = "invalid address '" + parts[1] + "'";
    return std::nullopt;
  }
  auto port = parse_port(parts[3]);
  if(!port) {
    error = "invalid port '" + parts[3] + "'";
    return std::nullopt;
  }
  return AvatarRequest{parts[1], *port};
}

json metadata_to_json(const TransferMetadata& metadata) {
  json j;
  j["name"] = metadata.file_name;
  j["size"] = metadata.size_bytes;
  j["senderUsername"] = metadata.sender_name;
  j["senderIp"] = metadata.sender_address;
  j["md5Checksum"] = metadata.expected_checksum;
  j["transferId"] = metadata.transfer_id;
  j["type"] = payload_kind_name(metadata.kind);
  return j;
}

std::optional<TransferMetadata> metadata_from_json(const json& doc, std::string& error) {
  if(!doc.is_object()) {
    error = "metadata is not an object";
    return std::nullopt;
  }
  auto string_field = [&](const char* key, const std::string& fallback) -> std::optional<std::string> {
    auto it = doc.find(key);
    if(it == doc.end() || it->is_null()) return fallback;
    if(!it->is_string()) {
      error = std::string("field '") + key + "' is not a string";
      return std::nullopt;
    }
    return it->get<std::string>();
  };

  TransferMetadata metadata;
  auto name = string_field("name", "unknown_file");
  auto sender = string_field("senderUsername", "Unknown");
  auto sender_ip = string_field("senderIp", "");
  auto checksum = string_field("md5Checksum", "");
  auto transfer_id = string_field("transferId", "");
  auto type = string_field("type", kTypeFile);
  if(!name || !sender || !sender_ip || !checksum || !transfer_id || !type) return std::nullopt;

  auto size_it = doc.find("size");
  if(size_it != doc.end() && !size_it->is_null()) {
    bool non_negative = size_it->is_number_unsigned() ||
                        (size_it->is_number_integer() && size_it->get<int64_t>() >= 0);
    if(!non_negative) {
      error = "field 'size' is not a non-negative integer";
      return std::nullopt;
    }
    metadata.size_bytes = size_it->get<uint64_t>();
  }

  if(*type == kTypeFile) {
    metadata.kind = PayloadKind::Data;
  } else if(*type == kTypeAvatar) {
    metadata.kind = PayloadKind::Capability;
  } else {
    error = "unknown transfer type '" + *type + "'";
    return std::nullopt;
  }

  metadata.file_name = *name;
  metadata.sender_name = *sender;
  metadata.sender_address = *sender_ip;
  metadata.expected_checksum = *checksum;
  metadata.transfer_id = *transfer_id;
  return metadata;
}

std::optional<TransferMetadata> parse_metadata_document(const std::string& document,
                                                        std::string& error) {
  json doc = json::parse(document, nullptr, false);
  if(doc.is_discarded()) {
    error = "metadata is not valid JSON";
    return std::nullopt;
  }
  return metadata_from_json(doc, error);
}

std::vector<char> encode_frame_header(const TransferMetadata& metadata) {
  std::string document = metadata_to_json(metadata).dump(-1, ' ', false, json::error_handler_t::replace);
  const auto length = static_cast<uint32_t>(document.size());
  std::vector<char> frame;
  frame.reserve(kLengthPrefixBytes + document.size());
  frame.push_back(static_cast<char>((length >> 24) & 0xFF));
  frame.push_back(static_cast<char>((length >> 16) & 0xFF));
  frame.push_back(static_cast<char>((length >> 8) & 0xFF));
  frame.push_back(static_cast<char>(length & 0xFF));
  frame.insert(frame.end(), document.begin(), document.end());
  return frame;
}

uint32_t decode_length_prefix(const unsigned char* bytes) {
  return (static_cast<uint32_t>(bytes[0]) << 24) |
         (static_cast<uint32_t>(bytes[1]) << 16) |
         (static_cast<uint32_t>(bytes[2]) << 8) |
         static_cast<uint32_t>(bytes[3]);
}
