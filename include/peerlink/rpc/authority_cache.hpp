#pragma once
#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <casket/utils/noncopyable.hpp>

namespace peerlink::rpc
{

/// @brief Thread-safe map from CA trust bytes to the Subject CN of their first certificate.
///
/// Entries are never evicted. Concurrent writers of the same key leave a single entry.
class AuthorityCache final : public casket::NonCopyable
{
public:
    AuthorityCache() = default;

    ~AuthorityCache() = default;

    std::optional<std::string> find(const std::string& caTrustBytes) const;

    void insert(const std::string& caTrustBytes, std::string commonName);

    std::size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::string> entries_;
};

} // namespace peerlink::rpc
