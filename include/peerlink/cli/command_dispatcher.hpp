#pragma once
#include <functional>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <tuple>
#include <casket/utils/singleton.hpp>
#include <peerlink/cli/command.hpp>

namespace peerlink::cmd
{

/// @brief Registry of the tool subcommands, filled by REGISTER_COMMAND at static initialization.
class CommandDispatcher final : public casket::utils::Singleton<CommandDispatcher>
{
    using CommandPtr = std::unique_ptr<Command>;
    using CommandDescription = std::string;
    using CommandCreator = std::function<CommandPtr()>;
    using CommandMeta = std::tuple<CommandDescription, CommandCreator>;
    using CommandMap = std::map<std::string, CommandMeta>;

public:
    CommandDispatcher() = default;

    ~CommandDispatcher() = default;

    /// @throw std::runtime_error if no command is registered under @p name.
    CommandPtr createCommand(const std::string& name);

    void printCommands(std::ostream& os);

private:
    CommandMap& getCommands();

public:
    class Registrar final
    {
    public:
        Registrar(const std::string& name, const std::string& desc, const CommandCreator& creator);

        ~Registrar() = default;
    };

private:
    CommandMap commands_;
};

#define REGISTER_COMMAND(commandName, commandDesc, className)                                                          \
    const peerlink::cmd::CommandDispatcher::Registrar className##Registrar(                                            \
        commandName, commandDesc, []() -> std::unique_ptr<peerlink::cmd::Command> {                                    \
            return std::make_unique<className>();                                                                      \
        })

} // namespace peerlink::cmd
