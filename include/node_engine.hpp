#ifndef DTMFDEC_NODE_ENGINE_HPP
#define DTMFDEC_NODE_ENGINE_HPP

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "audio_io.hpp"
#include "command_decoder.hpp"
#include "decode_pipeline.hpp"
#include "decoder_config.hpp"
#include "gateway.hpp"

namespace dtmfdec::node {

/// How decoded keys are presented while listening.
enum class ListenMode {
    Keys,       // print each key as it is pressed
    Plot,       // keys plus a text bar chart of the 8 tone energies
    Commands    // feed keys to the command decoder
};

/// Top-level orchestrator that wires Audio, Decoder, and Network together.
///
/// Receive path:
///   audio in (PortAudio) -> blocks -> DecodePipeline -> key events
///              -> console / spectrum / command consumers
///
/// Transmit path:
///   key string -> ToneGenerator -> audio out (PortAudio)
class NodeEngine {
public:
    NodeEngine() = default;

    /// Initialise all subsystems. The decoder config is validated first.
    bool init(const AudioConfig& audio_cfg, const DecoderConfig& decoder_cfg,
              const GatewayConfig& gw_cfg);

    /// Shut down all subsystems.
    void shutdown();

    // ----- Receive path -----

    /// Decode live audio for `duration_sec` seconds (<= 0 runs until a
    /// read fails). Returns the number of keys pressed, or -1 on error.
    int listen(double duration_sec, ListenMode mode);

    // ----- Transmit path -----

    /// Render `keys` as DTMF tones and play them.
    bool dial(std::string_view keys);

    // ----- Offline -----

    /// Render `keys`, decode the PCM, and return the pressed symbols.
    /// Needs no audio device.
    static bool selftest(std::string_view keys, const DecoderConfig& decoder_cfg,
                         const AudioConfig& audio_cfg, std::string& decoded,
                         std::string& error);

    CommandDecoder& commands() noexcept { return command_decoder_; }

private:
    AudioIO                         audio_;
    Gateway                         gateway_;
    AudioConfig                     audio_cfg_;
    std::unique_ptr<DecodePipeline> decode_pipeline_;
    CommandDecoder                  command_decoder_;

    void register_default_commands();
    void show_command_screen(const CommandResult* last) const;
    void on_command_key(char symbol);
};

/// Print the eight tone energies as a log-scaled text bar chart.
void print_spectrum(const BlockResult& block);

} // namespace dtmfdec::node

#endif // DTMFDEC_NODE_ENGINE_HPP
