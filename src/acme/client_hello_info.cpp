#include "acme/client_hello_info.hpp"

#include <openssl/tls1.h>

namespace challtestsrv::acme {

namespace {

std::size_t read_u16(const unsigned char *p) {
  return (static_cast<std::size_t>(p[0]) << 8) | static_cast<std::size_t>(p[1]);
}

} // namespace

std::optional<std::vector<std::string>>
parse_alpn_protocol_list(const unsigned char *data, std::size_t len,
                         bool has_length_prefix) {
  if (data == nullptr) {
    return std::nullopt;
  }

  const unsigned char *p = data;
  std::size_t remaining = len;
  if (has_length_prefix) {
    if (remaining < 2 || read_u16(p) != remaining - 2) {
      return std::nullopt;
    }
    p += 2;
    remaining -= 2;
  }

  std::vector<std::string> protos;
  while (remaining > 0) {
    const std::size_t plen = *p;
    ++p;
    --remaining;
    // Zero-length protocol names are forbidden by RFC 7301.
    if (plen == 0 || plen > remaining) {
      return std::nullopt;
    }
    protos.emplace_back(reinterpret_cast<const char *>(p), plen);
    p += plen;
    remaining -= plen;
  }
  return protos;
}

std::optional<std::string> parse_server_name_ext(const unsigned char *data,
                                                 std::size_t len) {
  if (data == nullptr || len < 2 || read_u16(data) != len - 2) {
    return std::nullopt;
  }

  const unsigned char *p = data + 2;
  std::size_t remaining = len - 2;
  while (remaining >= 3) {
    const unsigned char name_type = p[0];
    const std::size_t name_len = read_u16(p + 1);
    p += 3;
    remaining -= 3;
    if (name_len > remaining) {
      return std::nullopt;
    }
    if (name_type == TLSEXT_NAMETYPE_host_name) {
      return std::string(reinterpret_cast<const char *>(p), name_len);
    }
    p += name_len;
    remaining -= name_len;
  }
  return std::nullopt;
}

ClientHelloInfo client_hello_info(SSL *ssl) {
  ClientHelloInfo info;

  const unsigned char *ext = nullptr;
  std::size_t ext_len = 0;
  if (SSL_client_hello_get0_ext(ssl, TLSEXT_TYPE_server_name, &ext,
                                &ext_len) == 1) {
    if (auto name = parse_server_name_ext(ext, ext_len)) {
      info.server_name = std::move(*name);
    }
  }

  ext = nullptr;
  ext_len = 0;
  if (SSL_client_hello_get0_ext(ssl,
                                TLSEXT_TYPE_application_layer_protocol_negotiation,
                                &ext, &ext_len) == 1) {
    if (auto protos = parse_alpn_protocol_list(ext, ext_len, true)) {
      info.supported_protos = std::move(*protos);
    }
  }
  return info;
}

std::vector<unsigned char>
encode_alpn_protocol_list(const std::vector<std::string> &protos) {
  std::vector<unsigned char> out;
  for (const auto &proto : protos) {
    if (proto.empty() || proto.size() > 255) {
      continue;
    }
    out.push_back(static_cast<unsigned char>(proto.size()));
    out.insert(out.end(), proto.begin(), proto.end());
  }
  return out;
}

} // namespace challtestsrv::acme
