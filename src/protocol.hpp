#pragma once
#include <nlohmann/json.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;

// protocol.hpp
inline constexpr uint16_t kDefaultTransferPort = 8090;
inline constexpr uint16_t kDefaultDiscoveryPort = 8091;

// Upper bound on the metadata document. Anything larger is treated as a
// corrupt or hostile sender and the connection is dropped.
inline constexpr uint32_t kMaxMetadataBytes = 1024 * 1024;
inline constexpr std::size_t kLengthPrefixBytes = 4;

// "RDY", sent receiver -> sender once the destination sink is open.
inline constexpr std::array<unsigned char, 3> kReadyToken = {0x52, 0x44, 0x59};

inline constexpr const char* kAnnouncePrefix = "WOXXY_ANNOUNCE";
inline constexpr const char* kAvatarRequestPrefix = "AVATAR_REQUEST";

inline constexpr const char* kChecksumSkipped = "no-check";
inline constexpr const char* kChecksumSenderFailed = "CHECKSUM_ERROR";

inline constexpr const char* kTypeFile = "FILE";
inline constexpr const char* kTypeAvatar = "AVATAR_FILE";

struct PeerIdentity {
  std::string display_name;
  std::string address;          // dotted quad, also the peer key
  uint16_t transfer_port = 0;

  bool operator==(const PeerIdentity& other) const {
    return display_name == other.display_name &&
           address == other.address &&
           transfer_port == other.transfer_port;
  }
  bool operator!=(const PeerIdentity& other) const { return !(*this == other); }
};

enum class PayloadKind { Data, Capability };

const char* payload_kind_name(PayloadKind kind);

struct TransferMetadata {
  std::string file_name;
  uint64_t size_bytes = 0;
  std::string sender_name;
  std::string sender_address;
  std::string expected_checksum;   // hex digest, kChecksumSkipped or kChecksumSenderFailed
  PayloadKind kind = PayloadKind::Data;
  std::string transfer_id;

  // False for the two sentinels and for an absent checksum.
  bool verification_required() const;
};

// WOXXY_ANNOUNCE:<name>:<addr>:<port>:<addr>
std::string make_announcement(const PeerIdentity& self);

// Validates the double address against itself and against the datagram's
// source. The display name may itself contain ':'.
std::optional<PeerIdentity> parse_announcement(const std::string& message,
                                               const std::string& source_address,
                                               std::string& error);

struct AvatarRequest {
  std::string address;
  uint16_t transfer_port = 0;
};

// AVATAR_REQUEST:<addr>:<addr>:<port>
std::string make_avatar_request(const std::string& address, uint16_t transfer_port);
std::optional<AvatarRequest> parse_avatar_request(const std::string& message,
                                                  const std::string& source_address,
                                                  std::string& error);

bool is_ipv4_address(const std::string& candidate);

json metadata_to_json(const TransferMetadata& metadata);
std::optional<TransferMetadata> metadata_from_json(const json& doc, std::string& error);
std::optional<TransferMetadata> parse_metadata_document(const std::string& document,
                                                        std::string& error);

// [4-byte big-endian length][UTF-8 metadata document]
std::vector<char> encode_frame_header(const TransferMetadata& metadata);
uint32_t decode_length_prefix(const unsigned char* bytes);

enum class TransferError { None, ProtocolFormat, ChecksumMismatch, Filesystem, Network, Cancelled };

const char* transfer_error_name(TransferError error);

struct TransferOutcome {
  TransferError error = TransferError::None;
  std::string message;

  bool ok() const { return error == TransferError::None; }

  static TransferOutcome success() { return {}; }
  static TransferOutcome failure(TransferError kind, std::string text) {
    return TransferOutcome{kind, std::move(text)};
  }
};
