#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include "decoder_config.hpp"
#include "node_engine.hpp"

static void print_usage() {
    std::puts(
        "dtmf-node v1.0.0\n"
        "Usage:\n"
        "  dtmf-node listen <seconds> [--plot|--commands]  Decode keys from the mic (0 = forever)\n"
        "  dtmf-node dial <keys>                          Play keys as DTMF tones\n"
        "  dtmf-node selftest <keys>                      Synthesize and decode keys offline\n"
        "  dtmf-node devices                              List available audio devices\n"
        "\n"
        "Decoder options:\n"
        "  --rate <hz>          sample rate (default 8000)\n"
        "  --block <samples>    samples per block (default 205)\n"
        "  --min-energy <e>     minimum peak energy (default 5)\n"
        "  --peak-ratio <r>     peak vs. runner-up ratio (default 6)\n"
        "  --twist <r>          max low/high energy ratio, 0 = off (default 10)\n"
        "  --hold <blocks>      blocks to confirm a key (default 2)\n"
        "Audio options:\n"
        "  --input <index>      input device (default: system default)\n"
        "  --output <index>     output device (default: system default)\n"
        "  --tone-ms <ms>       dialed key duration (default 100)\n"
        "  --gap-ms <ms>        pause between dialed keys (default 100)\n"
    );
}

// ---------------------------------------------------------------------------
// Option parsing
// ---------------------------------------------------------------------------

struct Options {
    dtmfdec::node::DecoderConfig decoder;
    dtmfdec::node::AudioConfig   audio;
    dtmfdec::node::ListenMode    mode = dtmfdec::node::ListenMode::Keys;
};

static bool parse_double(const char* text, double& out) {
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(text, &end);
    if (errno != 0 || end == text || *end != '\0') return false;
    out = v;
    return true;
}

static bool parse_long(const char* text, long& out) {
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0') return false;
    out = v;
    return true;
}

// Parses argv[first..argc) into `opts`. Returns false on a bad option.
static bool parse_options(int argc, char* argv[], int first, Options& opts) {
    for (int i = first; i < argc; ++i) {
        const char* flag = argv[i];

        if (std::strcmp(flag, "--plot") == 0) {
            opts.mode = dtmfdec::node::ListenMode::Plot;
            continue;
        }
        if (std::strcmp(flag, "--commands") == 0) {
            opts.mode = dtmfdec::node::ListenMode::Commands;
            continue;
        }

        if (i + 1 >= argc) {
            std::fprintf(stderr, "error: missing value for %s\n", flag);
            return false;
        }
        const char* value = argv[++i];

        double d = 0.0;
        long   l = 0;
        bool   ok = true;

        if (std::strcmp(flag, "--rate") == 0) {
            ok = parse_double(value, d);
            opts.decoder.sample_rate = d;
        } else if (std::strcmp(flag, "--block") == 0) {
            ok = parse_long(value, l) && l > 0;
            opts.decoder.block_length = static_cast<std::size_t>(l);
        } else if (std::strcmp(flag, "--min-energy") == 0) {
            ok = parse_double(value, d);
            opts.decoder.min_energy_threshold = d;
        } else if (std::strcmp(flag, "--peak-ratio") == 0) {
            ok = parse_double(value, d);
            opts.decoder.min_peak_ratio = d;
        } else if (std::strcmp(flag, "--twist") == 0) {
            ok = parse_double(value, d);
            opts.decoder.max_twist_ratio = d;
        } else if (std::strcmp(flag, "--hold") == 0) {
            ok = parse_long(value, l);
            opts.decoder.min_hold_blocks = static_cast<int>(l);
        } else if (std::strcmp(flag, "--input") == 0) {
            ok = parse_long(value, l);
            opts.audio.input_device = static_cast<int>(l);
        } else if (std::strcmp(flag, "--output") == 0) {
            ok = parse_long(value, l);
            opts.audio.output_device = static_cast<int>(l);
        } else if (std::strcmp(flag, "--tone-ms") == 0) {
            ok = parse_double(value, d) && d > 0.0;
            opts.audio.tone_ms = d;
        } else if (std::strcmp(flag, "--gap-ms") == 0) {
            ok = parse_double(value, d) && d >= 0.0;
            opts.audio.gap_ms = d;
        } else {
            std::fprintf(stderr, "error: unknown option %s\n", flag);
            return false;
        }

        if (!ok) {
            std::fprintf(stderr, "error: bad value for %s: %s\n", flag, value);
            return false;
        }
    }

    auto check = dtmfdec::node::validate_config(opts.decoder);
    if (!check.valid) {
        std::fprintf(stderr, "error: %s\n", check.error.c_str());
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

static int cmd_selftest(const Options& opts, const char* keys) {
    std::string decoded;
    std::string error;
    if (!dtmfdec::node::NodeEngine::selftest(keys, opts.decoder, opts.audio,
                                            decoded, error)) {
        std::fprintf(stderr, "error: %s\n", error.c_str());
        return 1;
    }

    std::printf("[selftest] sent:    %s\n", keys);
    std::printf("[selftest] decoded: %s\n", decoded.c_str());

    // Keypad letters are decoded upper-case.
    std::string expected(keys);
    for (char& c : expected) {
        if (c >= 'a' && c <= 'd') c = static_cast<char>(c - 'a' + 'A');
    }
    if (decoded != expected) {
        std::puts("[selftest] MISMATCH");
        return 1;
    }
    std::puts("[selftest] PASS");
    return 0;
}

static int cmd_listen(dtmfdec::node::NodeEngine& engine, const Options& opts,
                      double seconds) {
    if (seconds > 0.0) {
        std::fprintf(stderr, "[listen] decoding %.1f seconds of audio\n", seconds);
    } else {
        std::fprintf(stderr, "[listen] decoding until interrupted\n");
    }

    int presses = engine.listen(seconds, opts.mode);
    if (presses < 0) {
        std::fprintf(stderr, "error: listening failed\n");
        return 1;
    }
    std::fprintf(stderr, "[listen] %d keys decoded\n", presses);
    return 0;
}

static int cmd_dial(dtmfdec::node::NodeEngine& engine, const char* keys) {
    if (!engine.dial(keys)) {
        std::fprintf(stderr, "error: dialing failed\n");
        return 1;
    }
    std::puts("[dial] done");
    return 0;
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "devices") == 0) {
        dtmfdec::node::AudioIO::list_devices();
        return 0;
    }

    if (argc < 3) {
        print_usage();
        return 1;
    }

    Options opts;
    if (!parse_options(argc, argv, 3, opts)) return 1;

    if (std::strcmp(cmd, "selftest") == 0) {
        return cmd_selftest(opts, argv[2]);
    }

    double seconds = 0.0;
    if (std::strcmp(cmd, "listen") == 0 && !parse_double(argv[2], seconds)) {
        std::fprintf(stderr, "error: bad duration: %s\n", argv[2]);
        return 1;
    }
    if (std::strcmp(cmd, "listen") != 0 && std::strcmp(cmd, "dial") != 0) {
        print_usage();
        return 1;
    }

    // Initialise the engine with the parsed config.
    dtmfdec::node::NodeEngine    engine;
    dtmfdec::node::GatewayConfig gw_cfg;

    if (!engine.init(opts.audio, opts.decoder, gw_cfg)) {
        std::fprintf(stderr, "error: failed to initialise engine\n");
        return 1;
    }

    int rc = 1;

    if (std::strcmp(cmd, "listen") == 0) {
        rc = cmd_listen(engine, opts, seconds);
    } else {
        rc = cmd_dial(engine, argv[2]);
    }

    engine.shutdown();
    return rc;
}
