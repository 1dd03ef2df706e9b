#pragma once

#include <openssl/ssl.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace challtestsrv::acme {

inline constexpr std::string_view kAcmeTls1Protocol{"acme-tls/1"};

// What the certificate hook knows about the connecting client.
struct ClientHelloInfo {
  std::string server_name;
  // ALPN protocols exactly as offered by the client, in order.
  std::vector<std::string> supported_protos;
};

// Decodes an ALPN ProtocolNameList body (repeated <len><bytes>), with or
// without its leading two-byte length. Returns std::nullopt if malformed.
std::optional<std::vector<std::string>>
parse_alpn_protocol_list(const unsigned char *data, std::size_t len,
                         bool has_length_prefix);

// Extracts the first host_name from a raw server_name extension body.
std::optional<std::string> parse_server_name_ext(const unsigned char *data,
                                                 std::size_t len);

// Reads SNI and ALPN from the ClientHello; only valid inside the
// client-hello callback.
ClientHelloInfo client_hello_info(SSL *ssl);

// Wire form used by SSL_CTX_set_alpn_protos / SSL_set_alpn_protos.
std::vector<unsigned char>
encode_alpn_protocol_list(const std::vector<std::string> &protos);

} // namespace challtestsrv::acme
