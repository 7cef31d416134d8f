#pragma once
#include <string>
#include <string_view>
#include <peerlink/rpc/types.hpp>

namespace peerlink::rpc
{

/// @brief Strips PEM armor and whitespace from a certificate, leaving its base64 body.
std::string StripCertificateArmor(std::string_view pem);

/// @brief Computes SHA-256 over the DER form of a PEM certificate.
///
/// The DER is obtained by removing every BEGIN/END CERTIFICATE marker and all whitespace, then
/// base64-decoding the remainder.
///
/// @param[in] certificatePem PEM text of one certificate.
///
/// @return 32-byte digest.
///
/// @throw crypto::CryptoException if the body is not valid base64.
Bytes ComputeIdentityDigest(const Bytes& certificatePem);

} // namespace peerlink::rpc
