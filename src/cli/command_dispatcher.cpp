#include <algorithm>
#include <stdexcept>
#include <peerlink/cli/command_dispatcher.hpp>

namespace peerlink::cmd
{

CommandDispatcher::CommandPtr CommandDispatcher::createCommand(const std::string& name)
{
    auto command = commands_.find(name);
    if (command == commands_.end())
    {
        throw std::runtime_error("Unknown command: " + name);
    }
    return std::get<CommandCreator>(command->second)();
}

void CommandDispatcher::printCommands(std::ostream& os)
{
    auto longest = std::max_element(commands_.begin(), commands_.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.first.size() < rhs.first.size();
    });

    const auto offset = (longest != commands_.end()) ? longest->first.size() + 4 : 4;

    for (const auto& [name, meta] : commands_)
    {
        os << name << std::string(offset - name.size(), ' ') << std::get<CommandDescription>(meta) << std::endl;
    }

    os << std::endl;
}

CommandDispatcher::CommandMap& CommandDispatcher::getCommands()
{
    return commands_;
}

CommandDispatcher::Registrar::Registrar(const std::string& name, const std::string& desc,
                                        const CommandDispatcher::CommandCreator& creator)
{
    auto& commands = CommandDispatcher::Instance().getCommands();
    if (commands.find(name) != commands.end())
    {
        throw std::logic_error("Duplicated command: " + name);
    }

    commands.emplace(name, std::make_tuple(desc, creator));
}

} // namespace peerlink::cmd
