#pragma once
#include <filesystem>
#include <optional>
#include <system_error>
#include <peerlink/rpc/credential_bundle.hpp>
#include <peerlink/rpc/properties.hpp>

namespace peerlink::rpc
{

class CredentialResolver final
{
public:
    /// @brief Resolves trust bytes and the client identity from @p properties.
    ///
    /// Client key and certificate sources are checked in this order: key given both as file and
    /// bytes, certificate given both as file and bytes, an incomplete file pair, an incomplete bytes
    /// pair. The key is decoded before the certificate.
    ///
    /// @param[in] properties Connection properties.
    /// @param[out] ec Configuration or credential decoding error. The returned bundle is empty when set.
    ///
    /// @return Resolved credentials.
    static CredentialBundle resolve(const ConnectionProperties& properties, std::error_code& ec);

    /// @brief Concatenates `pemBytes` with the contents of every path listed in `pemFile`.
    ///
    /// @return Empty optional when no trust material is configured, or on error.
    static std::optional<Bytes> resolveTrustBytes(const ConnectionProperties& properties, std::error_code& ec);

private:
    static std::optional<Bytes> readFile(const std::filesystem::path& path, std::error_code& ec);
};

} // namespace peerlink::rpc
