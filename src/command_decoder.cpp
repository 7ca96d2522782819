#include "command_decoder.hpp"

#include <utility>

namespace dtmfdec::node {

CommandDecoder::CommandDecoder(char prefix, char suffix)
    : prefix_(prefix), suffix_(suffix) {}

void CommandDecoder::register_command(const std::string& code, const std::string& name,
                                      const std::string& description, Handler handler) {
    registry_[code] = Entry{name, description, std::move(handler)};
}

std::optional<CommandResult> CommandDecoder::key(char symbol) {
    buffer_ += symbol;

    if (buffer_.front() != prefix_) {
        buffer_.clear();
        return std::nullopt;
    }
    if (buffer_.size() < 2 || buffer_.back() != suffix_) {
        return std::nullopt;
    }

    // Strip prefix and suffix.
    std::string code = buffer_.substr(1, buffer_.size() - 2);
    buffer_.clear();
    return execute(code);
}

CommandResult CommandDecoder::execute(const std::string& code) const {
    auto it = registry_.find(code);
    if (it == registry_.end()) {
        return {code, {}, "bad command code: \"" + code + "\" does not exist", false};
    }

    CommandResult result{code, it->second.name, {}, true};
    if (it->second.handler) result.output = it->second.handler();
    return result;
}

std::vector<CommandDecoder::Command> CommandDecoder::commands() const {
    std::vector<Command> out;
    out.reserve(registry_.size());
    for (const auto& [code, entry] : registry_) {
        out.push_back({code, entry.name, entry.description});
    }
    return out;
}

} // namespace dtmfdec::node
