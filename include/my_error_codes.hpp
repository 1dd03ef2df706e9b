#pragma once

namespace my_errors {

namespace GENERAL {  // General errors

constexpr int INVALID_ARGUMENT = 5000;  // Invalid argument
constexpr int MISSING_FIELD = 5008;  // Missing field
constexpr int POINTER_IS_NULL = 5011;  // Pointer is null
constexpr int CREATE_FAILED = 5014;  // Create failed
constexpr int FILE_NOT_FOUND = 5019;  // File not found
constexpr int FILE_READ_WRITE = 5020;  // File read/write error
}  // namespace GENERAL

namespace NETWORK {  // Network errors

constexpr int SSL_ERROR = 5204;  // SSL error
}  // namespace NETWORK

namespace JSON {  // Json errors

constexpr int MALFORMED = 9000;  // Malformed JSON text
constexpr int TYPE_MISMATCH = 9003;  // JSON type mismatch
}  // namespace JSON

namespace OPENSSL {  // OPENSSL errors

constexpr int UNEXPECTED_RESULT = 8000;  // Unexpected result
}  // namespace OPENSSL

namespace TLSALPN {  // TLS-ALPN-01 challenge errors

constexpr int UNKNOWN_SERVER_NAME = 6100;  // No challenge registered for SNI
constexpr int EXTENSION_ENCODE_FAILED = 6101;  // acmeIdentifier encoding failed
constexpr int CERT_SIGN_FAILED = 6102;  // Challenge certificate signing failed
constexpr int IDENTITY_GENERATION_FAILED = 6103;  // Fallback identity failed
}  // namespace TLSALPN

}  // namespace my_errors
