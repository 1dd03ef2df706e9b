#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include <openssl/err.h>
#include <openssl/objects.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "acme/client_hello_info.hpp"
#include "openssl/crypt_util.hpp"
#include "openssl/openssl_raii.hpp"

namespace test_support {

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

// A connected, not yet handshaken TLS client. Members are ordered so the
// stream is destroyed before the context and io_context it refers to.
struct TlsClient {
  net::io_context ioc;
  ssl::context ctx{ssl::context::tls_client};
  std::unique_ptr<ssl::stream<tcp::socket>> stream;

  SSL *native() { return stream->native_handle(); }

  void handshake() { stream->handshake(ssl::stream_base::client); }
};

inline std::unique_ptr<TlsClient>
connect_tls(std::uint16_t port, const std::string &sni,
            const std::vector<std::string> &protos) {
  auto client = std::make_unique<TlsClient>();
  client->ctx.set_verify_mode(ssl::verify_none);
  if (!protos.empty()) {
    const auto wire = challtestsrv::acme::encode_alpn_protocol_list(protos);
    // SSL_CTX_set_alpn_protos returns 0 on success.
    if (SSL_CTX_set_alpn_protos(client->ctx.native_handle(), wire.data(),
                                static_cast<unsigned int>(wire.size())) !=
        0) {
      return nullptr;
    }
  }

  client->stream =
      std::make_unique<ssl::stream<tcp::socket>>(client->ioc, client->ctx);
  client->stream->next_layer().connect(
      tcp::endpoint(net::ip::make_address("127.0.0.1"), port));

  if (!sni.empty() &&
      SSL_set_tlsext_host_name(client->native(), sni.c_str()) != 1) {
    return nullptr;
  }
  return client;
}

inline std::string alpn_selected(SSL *ssl) {
  const unsigned char *sel = nullptr;
  unsigned int sel_len = 0;
  SSL_get0_alpn_selected(ssl, &sel, &sel_len);
  if (sel == nullptr) {
    return {};
  }
  return std::string(reinterpret_cast<const char *>(sel), sel_len);
}

inline challtestsrv::cryptutil::X509_ptr peer_certificate(SSL *ssl) {
  return challtestsrv::cryptutil::X509_ptr(SSL_get1_peer_certificate(ssl),
                                           &X509_free);
}

inline std::string common_name(X509 *cert) {
  char buf[256] = {0};
  const int len = X509_NAME_get_text_by_NID(X509_get_subject_name(cert),
                                            NID_commonName, buf, sizeof(buf));
  if (len < 0) {
    return {};
  }
  return std::string(buf, static_cast<std::size_t>(len));
}

// Raw extnValue bytes of the acmeIdentifier extension, if present.
inline std::optional<std::string> acme_identifier_value(X509 *cert) {
  challtestsrv::cryptutil::ASN1_OBJECT_ptr oid(
      OBJ_txt2obj(
          std::string(challtestsrv::opensslutil::kAcmeIdentifierOid).c_str(),
          1),
      &ASN1_OBJECT_free);
  if (!oid) {
    return std::nullopt;
  }
  const int idx = X509_get_ext_by_OBJ(cert, oid.get(), -1);
  if (idx < 0) {
    return std::nullopt;
  }
  X509_EXTENSION *ext = X509_get_ext(cert, idx);
  ASN1_OCTET_STRING *data = X509_EXTENSION_get_data(ext);
  return std::string(
      reinterpret_cast<const char *>(ASN1_STRING_get0_data(data)),
      static_cast<std::size_t>(ASN1_STRING_length(data)));
}

inline bool acme_identifier_is_critical(X509 *cert) {
  challtestsrv::cryptutil::ASN1_OBJECT_ptr oid(
      OBJ_txt2obj(
          std::string(challtestsrv::opensslutil::kAcmeIdentifierOid).c_str(),
          1),
      &ASN1_OBJECT_free);
  const int idx = oid ? X509_get_ext_by_OBJ(cert, oid.get(), -1) : -1;
  return idx >= 0 && X509_EXTENSION_get_critical(X509_get_ext(cert, idx)) == 1;
}

// 0x04 0x20 followed by SHA-256(key_authorization).
inline std::string expected_acme_identifier(std::string_view key_auth) {
  const auto digest = challtestsrv::cryptutil::sha256(key_auth);
  std::string out("\x04\x20", 2);
  out.append(reinterpret_cast<const char *>(digest.data()), digest.size());
  return out;
}

inline std::vector<std::string> dns_sans(X509 *cert) {
  std::vector<std::string> out;
  auto *gens = static_cast<GENERAL_NAMES *>(
      X509_get_ext_d2i(cert, NID_subject_alt_name, nullptr, nullptr));
  if (!gens) {
    return out;
  }
  for (int i = 0; i < sk_GENERAL_NAME_num(gens); ++i) {
    const GENERAL_NAME *gen = sk_GENERAL_NAME_value(gens, i);
    if (gen->type == GEN_DNS) {
      const ASN1_IA5STRING *dns = gen->d.dNSName;
      out.emplace_back(
          reinterpret_cast<const char *>(ASN1_STRING_get0_data(dns)),
          static_cast<std::size_t>(ASN1_STRING_length(dns)));
    } else {
      out.emplace_back();
    }
  }
  GENERAL_NAMES_free(gens);
  return out;
}

// True when a failed handshake was answered with an unrecognized_name alert.
inline bool is_unrecognized_name_alert(const boost::system::error_code &ec) {
  return ec.category() == net::error::get_ssl_category() &&
         ERR_GET_REASON(static_cast<unsigned long>(ec.value())) ==
             SSL_R_TLSV1_UNRECOGNIZED_NAME;
}

// Waits up to `limit` for the server to end the connection. Returns the
// error the pending read completed with, or nullopt if it never completed.
inline std::optional<boost::system::error_code>
wait_for_close(TlsClient &client, std::chrono::steady_clock::duration limit) {
  std::optional<boost::system::error_code> result;
  char byte = 0;
  client.stream->async_read_some(
      net::buffer(&byte, 1),
      [&result](const boost::system::error_code &ec, std::size_t) {
        result = ec;
      });
  client.ioc.restart();
  client.ioc.run_for(limit);
  if (!result) {
    // Still open: abort the read so its handler never outlives `result`.
    boost::system::error_code ignored;
    client.stream->next_layer().close(ignored);
    client.ioc.restart();
    client.ioc.run();
    return std::nullopt;
  }
  return result;
}

} // namespace test_support
