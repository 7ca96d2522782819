#include "node_engine.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include "tone_generator.hpp"

namespace dtmfdec::node {

bool NodeEngine::init(const AudioConfig& audio_cfg,
                      const DecoderConfig& decoder_cfg,
                      const GatewayConfig& gw_cfg) {
    std::string error;
    decode_pipeline_ = DecodePipeline::create(decoder_cfg, error);
    if (!decode_pipeline_) {
        std::fprintf(stderr, "[engine] invalid decoder config: %s\n", error.c_str());
        return false;
    }

    audio_cfg_ = audio_cfg;
    audio_cfg_.sample_rate = decoder_cfg.sample_rate;

    if (!audio_.open(audio_cfg_)) {
        std::fprintf(stderr, "[engine] audio init failed\n");
        return false;
    }
    if (!gateway_.open(gw_cfg)) {
        std::fprintf(stderr, "[engine] gateway init failed\n");
        return false;
    }

    register_default_commands();
    return true;
}

void NodeEngine::shutdown() {
    decode_pipeline_.reset();
    audio_.close();
    gateway_.close();
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

void NodeEngine::register_default_commands() {
    command_decoder_.register_command(
        "1234", "hello", "Prints \"Hello, world!\" to the console",
        [] { return std::string("Hello, world!"); });

    command_decoder_.register_command(
        "1111", "joke", "Gets a random programming joke",
        [this] {
            std::string joke = gateway_.joke();
            return joke.empty() ? std::string("(no joke available)") : "Joke: " + joke;
        });

    command_decoder_.register_command(
        "2222", "activity", "Gets a random activity to do",
        [this] {
            std::string activity = gateway_.activity();
            return activity.empty() ? std::string("(no activity available)")
                                    : "Activity: " + activity;
        });
}

void NodeEngine::show_command_screen(const CommandResult* last) const {
    std::puts("\n    CODE        COMMAND         DESCRIPTION");
    std::puts("    ----        -------         -----------");
    for (const auto& cmd : command_decoder_.commands()) {
        std::printf("    %-11s %-15s %s\n", cmd.code.c_str(), cmd.name.c_str(),
                    cmd.description.c_str());
    }
    std::puts("");

    if (last) {
        if (last->found) {
            std::printf("Executed command: %s\n\n", last->code.c_str());
            std::printf("Command output:\n\n    %s\n\n", last->output.c_str());
        } else {
            std::printf("[BAD COMMAND CODE] %s\n\n", last->output.c_str());
        }
    }
    std::printf("COMMAND ~ %s", command_decoder_.pending().c_str());
    std::fflush(stdout);
}

void NodeEngine::on_command_key(char symbol) {
    auto result = command_decoder_.key(symbol);
    if (!result) {
        std::printf("\rCOMMAND ~ %s", command_decoder_.pending().c_str());
        std::fflush(stdout);
        return;
    }
    std::printf("\n[command] executing %s\n", result->code.c_str());
    show_command_screen(&*result);
}

// ---------------------------------------------------------------------------
// Receive path
// ---------------------------------------------------------------------------

int NodeEngine::listen(double duration_sec, ListenMode mode) {
    if (!decode_pipeline_) {
        std::fprintf(stderr, "[engine] decode pipeline not initialized\n");
        return -1;
    }
    if (!audio_.has_input() || !audio_.start_capture()) {
        std::fprintf(stderr, "[engine] no audio input\n");
        return -1;
    }

    const DecoderConfig& cfg = decode_pipeline_->config();
    const std::size_t    block_len = cfg.block_length;
    const std::uint64_t  max_blocks = duration_sec > 0.0
        ? static_cast<std::uint64_t>(std::ceil(duration_sec * cfg.sample_rate /
                                               static_cast<double>(block_len)))
        : 0;

    int presses = 0;
    decode_pipeline_->reset();

    if (mode == ListenMode::Commands) {
        show_command_screen(nullptr);
    } else {
        std::printf("(keys) -> ");
        std::fflush(stdout);
    }

    std::vector<float> block;
    for (std::uint64_t n = 0; max_blocks == 0 || n < max_blocks; ++n) {
        if (!audio_.read_block(block, block_len)) break;

        BlockResult result = decode_pipeline_->process(block);
        if (!result.accepted()) {
            std::fprintf(stderr, "[engine] block %llu rejected (%s): %s\n",
                         static_cast<unsigned long long>(n),
                         block_status_name(result.status), result.error.c_str());
            continue;
        }

        for (const auto& ev : result.events) {
            if (ev.type != KeyEventType::Pressed) continue;
            ++presses;

            switch (mode) {
                case ListenMode::Keys:
                    std::printf("%c", ev.symbol);
                    std::fflush(stdout);
                    break;
                case ListenMode::Plot:
                    std::printf("%c\n", ev.symbol);
                    print_spectrum(result);
                    std::printf("(keys) -> ");
                    std::fflush(stdout);
                    break;
                case ListenMode::Commands:
                    on_command_key(ev.symbol);
                    break;
            }
        }
    }

    decode_pipeline_->flush();
    audio_.stop_capture();
    std::puts("");
    return presses;
}

// ---------------------------------------------------------------------------
// Transmit path
// ---------------------------------------------------------------------------

bool NodeEngine::dial(std::string_view keys) {
    ToneTiming timing;
    timing.sample_rate = audio_cfg_.sample_rate;
    timing.tone_ms     = audio_cfg_.tone_ms;
    timing.gap_ms      = audio_cfg_.gap_ms;
    timing.amplitude   = audio_cfg_.amplitude;

    RenderResult rendered = ToneGenerator(timing).render(keys);
    if (!rendered.ok) {
        std::fprintf(stderr, "[engine] %s\n", rendered.error.c_str());
        return false;
    }

    std::printf("[engine] dialing %zu keys (%zu samples)\n",
                keys.size(), rendered.pcm.size());
    return audio_.play(rendered.pcm);
}

// ---------------------------------------------------------------------------
// Offline
// ---------------------------------------------------------------------------

bool NodeEngine::selftest(std::string_view keys, const DecoderConfig& decoder_cfg,
                          const AudioConfig& audio_cfg, std::string& decoded,
                          std::string& error) {
    auto pipeline = DecodePipeline::create(decoder_cfg, error);
    if (!pipeline) return false;

    ToneTiming timing;
    timing.sample_rate = decoder_cfg.sample_rate;
    timing.tone_ms     = audio_cfg.tone_ms;
    timing.gap_ms      = audio_cfg.gap_ms;
    timing.amplitude   = audio_cfg.amplitude;

    RenderResult rendered = ToneGenerator(timing).render(keys);
    if (!rendered.ok) {
        error = rendered.error;
        return false;
    }

    decoded.clear();
    pipeline->subscribe([&decoded](const KeyEvent& ev) {
        if (ev.type == KeyEventType::Pressed) decoded += ev.symbol;
    });

    DecodeSummary summary = pipeline->decode(rendered.pcm);
    pipeline->flush();
    if (summary.rejected > 0) {
        error = summary.error;
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Spectrum
// ---------------------------------------------------------------------------

void print_spectrum(const BlockResult& block) {
    constexpr int kBarWidth = 40;

    double peak = 1.0;
    for (const auto& fe : block.spectrum) peak = std::max(peak, fe.energy);
    const double span = std::log10(peak + 1.0);

    for (const auto& fe : block.spectrum) {
        const double level = span > 0.0 ? std::log10(fe.energy + 1.0) / span : 0.0;
        const int    width = static_cast<int>(std::lround(level * kBarWidth));

        bool selected = false;
        if (block.candidate) {
            selected = fe.frequency_hz == block.candidate->pair.low_hz ||
                       fe.frequency_hz == block.candidate->pair.high_hz;
        }
        std::printf("  %4d Hz %c |%-*s| %10.1f\n", fe.frequency_hz,
                    selected ? '*' : ' ', kBarWidth,
                    std::string(static_cast<std::size_t>(std::max(width, 0)), '#').c_str(),
                    fe.energy);
    }
}

} // namespace dtmfdec::node
