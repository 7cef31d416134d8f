#include <mutex>
#include <peerlink/rpc/authority_cache.hpp>

namespace peerlink::rpc
{

std::optional<std::string> AuthorityCache::find(const std::string& caTrustBytes) const
{
    std::shared_lock lock(mutex_);
    auto found = entries_.find(caTrustBytes);
    if (found != entries_.end())
    {
        return found->second;
    }
    return std::nullopt;
}

void AuthorityCache::insert(const std::string& caTrustBytes, std::string commonName)
{
    std::unique_lock lock(mutex_);
    entries_.insert_or_assign(caTrustBytes, std::move(commonName));
}

std::size_t AuthorityCache::size() const
{
    std::shared_lock lock(mutex_);
    return entries_.size();
}

} // namespace peerlink::rpc
