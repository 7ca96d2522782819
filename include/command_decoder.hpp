#ifndef DTMFDEC_NODE_COMMAND_DECODER_HPP
#define DTMFDEC_NODE_COMMAND_DECODER_HPP

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dtmfdec::node {

/// Outcome of a completed key sequence.
struct CommandResult {
    std::string code;     // digits between prefix and suffix
    std::string name;     // registered command name, empty if unknown
    std::string output;   // handler output or error text
    bool        found = false;
};

/// Collects pressed keys into "<prefix><code><suffix>" sequences and runs
/// the command registered under <code>.
///
/// Keys are discarded until the buffer starts with the prefix; a sequence
/// ends at the first suffix key, e.g. "*1234#" runs code "1234".
class CommandDecoder {
public:
    using Handler = std::function<std::string()>;

    struct Command {
        std::string code;
        std::string name;
        std::string description;
    };

    explicit CommandDecoder(char prefix = '*', char suffix = '#');

    /// Register (or replace) the handler for `code`.
    void register_command(const std::string& code, const std::string& name,
                          const std::string& description, Handler handler);

    /// Feed one pressed key. Returns a result when a sequence completes.
    std::optional<CommandResult> key(char symbol);

    /// Keys collected so far for the sequence in progress.
    const std::string& pending() const noexcept { return buffer_; }

    /// Registered commands ordered by code.
    std::vector<Command> commands() const;

    void clear() { buffer_.clear(); }

private:
    struct Entry {
        std::string name;
        std::string description;
        Handler     handler;
    };

    char                         prefix_;
    char                         suffix_;
    std::string                  buffer_;
    std::map<std::string, Entry> registry_;

    CommandResult execute(const std::string& code) const;
};

} // namespace dtmfdec::node

#endif // DTMFDEC_NODE_COMMAND_DECODER_HPP
