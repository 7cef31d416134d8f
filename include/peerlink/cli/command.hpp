#pragma once
#include <string_view>
#include <vector>
#include <casket/utils/noncopyable.hpp>

namespace peerlink::cmd
{

class Command : public casket::NonCopyable
{
public:
    Command() = default;

    virtual ~Command() = default;

    virtual void execute(const std::vector<std::string_view>& args) = 0;
};

} // namespace peerlink::cmd
