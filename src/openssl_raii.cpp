#include "openssl/openssl_raii.hpp"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/rand.h>

#include <cstdint>
#include <ctime>
#include <limits>
#include <utility>

namespace challtestsrv {
namespace opensslutil {

namespace {

template <typename T>
monad::MyResult<T> ossl_err(const std::string& what) {
  return monad::MyResult<T>::Err(
      monad::make_error(my_errors::OPENSSL::UNEXPECTED_RESULT, what));
}

}  // namespace

monad::MyResult<cryptutil::EVP_PKEY_ptr> make_ec_p256_key() {
  cryptutil::EVP_PKEY_CTX_ptr pctx(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr),
                                   &EVP_PKEY_CTX_free);
  if (!pctx)
    return ossl_err<cryptutil::EVP_PKEY_ptr>("EVP_PKEY_CTX_new_id failed");

  if (EVP_PKEY_keygen_init(pctx.get()) <= 0) {
    return ossl_err<cryptutil::EVP_PKEY_ptr>("EVP_PKEY_keygen_init failed");
  }

  if (EVP_PKEY_CTX_set_ec_paramgen_curve_nid(pctx.get(),
                                             NID_X9_62_prime256v1) <= 0) {
    return ossl_err<cryptutil::EVP_PKEY_ptr>(
        "EVP_PKEY_CTX_set_ec_paramgen_curve_nid failed");
  }

  EVP_PKEY* pkey = nullptr;
  if (EVP_PKEY_keygen(pctx.get(), &pkey) <= 0) {
    return ossl_err<cryptutil::EVP_PKEY_ptr>("EVP_PKEY_keygen failed");
  }
  return monad::MyResult<cryptutil::EVP_PKEY_ptr>::Ok(
      cryptutil::EVP_PKEY_ptr(pkey, &EVP_PKEY_free));
}

monad::MyResult<cryptutil::ASN1_INTEGER_ptr> make_random_serial() {
  cryptutil::BIGNUM_ptr range(BN_new(), &BN_free);
  cryptutil::BIGNUM_ptr serial(BN_new(), &BN_free);
  if (!range || !serial)
    return ossl_err<cryptutil::ASN1_INTEGER_ptr>("BN_new failed");

  if (BN_set_word(range.get(), static_cast<BN_ULONG>(
                                   std::numeric_limits<std::int64_t>::max())) !=
      1) {
    return ossl_err<cryptutil::ASN1_INTEGER_ptr>("BN_set_word failed");
  }
  if (BN_rand_range(serial.get(), range.get()) != 1) {
    return ossl_err<cryptutil::ASN1_INTEGER_ptr>("BN_rand_range failed");
  }

  ASN1_INTEGER* ai = BN_to_ASN1_INTEGER(serial.get(), nullptr);
  if (!ai)
    return ossl_err<cryptutil::ASN1_INTEGER_ptr>("BN_to_ASN1_INTEGER failed");
  return monad::MyResult<cryptutil::ASN1_INTEGER_ptr>::Ok(
      cryptutil::ASN1_INTEGER_ptr(ai, &ASN1_INTEGER_free));
}

monad::MyVoidResult add_ext(cryptutil::X509_ptr& cert, int nid,
                            const std::string& val) {
  X509V3_CTX ctx;
  X509V3_set_ctx(&ctx, cert.get(), cert.get(), nullptr, nullptr, 0);
  cryptutil::X509_EXTENSION_ptr ex(
      X509V3_EXT_conf_nid(nullptr, &ctx, nid, val.c_str()),
      &X509_EXTENSION_free);
  if (!ex)
    return monad::MyVoidResult::Err(
        monad::make_error(my_errors::OPENSSL::UNEXPECTED_RESULT,
                          "X509V3_EXT_conf_nid failed for " + val));
  if (X509_add_ext(cert.get(), ex.get(), -1) != 1) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::OPENSSL::UNEXPECTED_RESULT, "X509_add_ext failed"));
  }
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult add_dns_san(cryptutil::X509_ptr& cert,
                                std::string_view dns_name) {
  // Built from GENERAL_NAME directly; the config-string form would split a
  // name containing ',' into several entries.
  GENERAL_NAMES* gens = sk_GENERAL_NAME_new_null();
  if (!gens)
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::OPENSSL::UNEXPECTED_RESULT, "sk_GENERAL_NAME_new failed"));
  std::unique_ptr<GENERAL_NAMES, decltype(&GENERAL_NAMES_free)> gens_raii(
      gens, &GENERAL_NAMES_free);

  GENERAL_NAME* gen = GENERAL_NAME_new();
  ASN1_IA5STRING* ia5 = ASN1_IA5STRING_new();
  if (!gen || !ia5 ||
      ASN1_STRING_set(ia5, dns_name.data(), static_cast<int>(dns_name.size())) !=
          1) {
    GENERAL_NAME_free(gen);
    ASN1_IA5STRING_free(ia5);
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::OPENSSL::UNEXPECTED_RESULT, "failed to build dNSName"));
  }
  GENERAL_NAME_set0_value(gen, GEN_DNS, ia5);
  if (sk_GENERAL_NAME_push(gens, gen) == 0) {
    GENERAL_NAME_free(gen);
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::OPENSSL::UNEXPECTED_RESULT, "sk_GENERAL_NAME_push failed"));
  }

  if (X509_add1_ext_i2d(cert.get(), NID_subject_alt_name, gens, 0,
                        X509V3_ADD_DEFAULT) != 1) {
    return monad::MyVoidResult::Err(
        monad::make_error(my_errors::OPENSSL::UNEXPECTED_RESULT,
                          "X509_add1_ext_i2d(subjectAltName) failed"));
  }
  return monad::MyVoidResult::Ok();
}

monad::MyResult<std::string> der_octet_string(const unsigned char* data,
                                              std::size_t len) {
  auto e = [](const std::string& message) {
    return monad::MyResult<std::string>::Err(monad::make_error(
        my_errors::TLSALPN::EXTENSION_ENCODE_FAILED, message));
  };

  cryptutil::ASN1_OCTET_STRING_ptr os(ASN1_OCTET_STRING_new(),
                                      &ASN1_OCTET_STRING_free);
  if (!os) return e("ASN1_OCTET_STRING_new failed");
  if (ASN1_OCTET_STRING_set(os.get(), data, static_cast<int>(len)) != 1)
    return e("ASN1_OCTET_STRING_set failed");

  const int der_len = i2d_ASN1_OCTET_STRING(os.get(), nullptr);
  if (der_len <= 0) return e("i2d_ASN1_OCTET_STRING failed");

  std::string der(static_cast<std::size_t>(der_len), '\0');
  auto* p = reinterpret_cast<unsigned char*>(der.data());
  if (i2d_ASN1_OCTET_STRING(os.get(), &p) != der_len)
    return e("i2d_ASN1_OCTET_STRING length mismatch");
  return monad::MyResult<std::string>::Ok(std::move(der));
}

monad::MyVoidResult add_acme_identifier(cryptutil::X509_ptr& cert,
                                        std::string_view key_authorization) {
  auto e = [](const std::string& message) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::TLSALPN::EXTENSION_ENCODE_FAILED, message));
  };

  const auto digest = cryptutil::sha256(key_authorization);
  auto value_r = der_octet_string(digest.data(), digest.size());
  if (value_r.is_err()) {
    return monad::MyVoidResult::Err(std::move(value_r.error()));
  }
  const std::string value = std::move(value_r.value());

  cryptutil::ASN1_OBJECT_ptr oid(
      OBJ_txt2obj(std::string(kAcmeIdentifierOid).c_str(), 1),
      &ASN1_OBJECT_free);
  if (!oid) return e("OBJ_txt2obj(acmeIdentifier) failed");

  cryptutil::ASN1_OCTET_STRING_ptr ext_data(ASN1_OCTET_STRING_new(),
                                            &ASN1_OCTET_STRING_free);
  if (!ext_data) return e("ASN1_OCTET_STRING_new failed");
  if (ASN1_OCTET_STRING_set(
          ext_data.get(), reinterpret_cast<const unsigned char*>(value.data()),
          static_cast<int>(value.size())) != 1) {
    return e("ASN1_OCTET_STRING_set failed");
  }

  cryptutil::X509_EXTENSION_ptr ext(
      X509_EXTENSION_create_by_OBJ(nullptr, oid.get(), 1 /* critical */,
                                   ext_data.get()),
      &X509_EXTENSION_free);
  if (!ext) return e("X509_EXTENSION_create_by_OBJ failed");

  if (X509_add_ext(cert.get(), ext.get(), -1) != 1)
    return e("X509_add_ext(acmeIdentifier) failed");
  return monad::MyVoidResult::Ok();
}

monad::MyResult<TlsIdentity> make_fallback_identity() {
  auto e = [](const std::string& message) {
    return monad::MyResult<TlsIdentity>::Err(monad::make_error(
        my_errors::TLSALPN::IDENTITY_GENERATION_FAILED, message));
  };

  auto key_r = make_ec_p256_key();
  if (key_r.is_err()) {
    return e("Unable to generate HTTPS ECDSA key: " + key_r.error().what);
  }
  cryptutil::EVP_PKEY_ptr key = std::move(key_r.value());

  auto serial_r = make_random_serial();
  if (serial_r.is_err()) {
    return e("Unable to generate HTTPS cert serial number: " +
             serial_r.error().what);
  }

  cryptutil::X509_ptr cert(X509_new(), &X509_free);
  if (!cert) return e("X509_new failed");

  if (X509_set_version(cert.get(), 2) != 1) return e("set version failed");
  if (X509_set_serialNumber(cert.get(), serial_r.value().get()) != 1)
    return e("X509_set_serialNumber failed");

  cryptutil::X509_NAME_ptr name(X509_NAME_new(), &X509_NAME_free);
  if (!name) return e("X509_NAME_new failed");
  const std::string cn(kFallbackCommonName);
  if (X509_NAME_add_entry_by_txt(
          name.get(), "CN", MBSTRING_ASC,
          reinterpret_cast<const unsigned char*>(cn.c_str()), -1, -1, 0) != 1)
    return e("X509_NAME_add_entry_by_txt(CN) failed");
  if (X509_set_subject_name(cert.get(), name.get()) != 1 ||
      X509_set_issuer_name(cert.get(), name.get()) != 1) {
    return e("set name failed");
  }

  // Backdated an hour to absorb clock skew between client and server.
  const std::time_t now = std::time(nullptr);
  if (!ASN1_TIME_set(X509_getm_notBefore(cert.get()), now - 60 * 60) ||
      !ASN1_TIME_adj(X509_getm_notAfter(cert.get()), now, 365, 0))
    return e("set time failed");

  if (X509_set_pubkey(cert.get(), key.get()) != 1)
    return e("X509_set_pubkey failed");

  const std::pair<int, const char*> exts[] = {
      {NID_basic_constraints, "critical,CA:TRUE"},
      {NID_key_usage, "critical,digitalSignature,keyCertSign"},
      {NID_ext_key_usage, "serverAuth,clientAuth"},
      {NID_subject_key_identifier, "hash"}};
  for (const auto& [nid, value] : exts) {
    auto r = add_ext(cert, nid, value);
    if (r.is_err()) {
      return e("Unable to issue HTTPS cert: " + r.error().what);
    }
  }

  if (X509_sign(cert.get(), key.get(), EVP_sha256()) <= 0)
    return e("Unable to issue HTTPS cert: X509_sign failed");

  TlsIdentity identity;
  identity.cert = share_cert(std::move(cert));
  identity.key = share_key(std::move(key));
  return monad::MyResult<TlsIdentity>::Ok(std::move(identity));
}

monad::MyResult<cryptutil::X509_ptr> make_tls_alpn01_cert(
    EVP_PKEY* key, std::string_view server_name,
    std::string_view key_authorization) {
  auto e = [](const std::string& message) {
    return monad::MyResult<cryptutil::X509_ptr>::Err(
        monad::make_error(my_errors::TLSALPN::CERT_SIGN_FAILED, message));
  };

  if (!key) return e("challenge signing key is null");

  cryptutil::X509_ptr cert(X509_new(), &X509_free);
  if (!cert) return e("X509_new failed");
  if (X509_set_version(cert.get(), 2) != 1) return e("set version failed");

  if (ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1729) != 1)
    return e("ASN1_INTEGER_set(serial) failed");

  if (!X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0) ||
      !X509_gmtime_adj(X509_getm_notAfter(cert.get()), 60L * 60 * 24))
    return e("set time failed");

  if (X509_set_pubkey(cert.get(), key) != 1)
    return e("X509_set_pubkey failed");

  if (auto r = add_dns_san(cert, server_name); r.is_err()) {
    return e("failed creating challenge certificate: " + r.error().what);
  }

  if (auto r = add_acme_identifier(cert, key_authorization); r.is_err()) {
    // Keep the encoding error code; the handshake reports it as such.
    return monad::MyResult<cryptutil::X509_ptr>::Err(
        monad::make_error(my_errors::TLSALPN::EXTENSION_ENCODE_FAILED,
                          "failed marshalling hash OCTET STRING: " +
                              r.error().what));
  }

  if (X509_sign(cert.get(), key, EVP_sha256()) <= 0)
    return e("failed creating challenge certificate: X509_sign failed");

  return monad::MyResult<cryptutil::X509_ptr>::Ok(std::move(cert));
}

monad::MyResult<std::string> cert_to_pem(X509* cert) {
  cryptutil::BIO_ptr bio(BIO_new(BIO_s_mem()), &BIO_free);
  if (!bio) return ossl_err<std::string>("BIO_new failed");
  if (PEM_write_bio_X509(bio.get(), cert) != 1)
    return ossl_err<std::string>("PEM_write_bio_X509 failed");
  return monad::MyResult<std::string>::Ok(cryptutil::bio_to_string(bio.get()));
}

std::shared_ptr<X509> share_cert(cryptutil::X509_ptr cert) {
  return std::shared_ptr<X509>(cert.release(), &X509_free);
}

std::shared_ptr<EVP_PKEY> share_key(cryptutil::EVP_PKEY_ptr key) {
  return std::shared_ptr<EVP_PKEY>(key.release(), &EVP_PKEY_free);
}

}  // namespace opensslutil
}  // namespace challtestsrv
