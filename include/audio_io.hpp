#ifndef DTMFDEC_NODE_AUDIO_IO_HPP
#define DTMFDEC_NODE_AUDIO_IO_HPP

#include <cstddef>
#include <vector>

#include <portaudio.h>

namespace dtmfdec::node {

/// Configuration for audio I/O.
struct AudioConfig {
    double sample_rate   = 8000.0;   // G.711 telephone rate
    int    output_device = -1;       // -1 = default
    int    input_device  = -1;       // -1 = default
    double tone_ms       = 100.0;    // dialed key duration
    double gap_ms        = 100.0;    // pause between dialed keys
    double amplitude     = 0.4;      // per-tone output level
};

/// PortAudio wrapper: block-wise capture for live decoding and playback
/// of synthesized key sequences.
class AudioIO {
public:
    AudioIO();
    ~AudioIO();

    AudioIO(const AudioIO&) = delete;
    AudioIO& operator=(const AudioIO&) = delete;

    /// Initialise PortAudio and open the input and output streams.
    bool open(const AudioConfig& cfg);

    /// Stop streams and shut down PortAudio.
    void close();

    /// Play mono PCM through the output device (blocking).
    bool play(const std::vector<float>& pcm);

    /// Start the input stream for read_block().
    bool start_capture();

    /// Fill `block` with exactly `frames` captured samples (blocking).
    /// Input overflow is reported but not fatal.
    bool read_block(std::vector<float>& block, std::size_t frames);

    void stop_capture();

    bool has_input() const noexcept { return input_stream_ != nullptr; }

    /// List available audio devices and their indices.
    static void list_devices();

private:
    PaStream*   output_stream_ = nullptr;
    PaStream*   input_stream_  = nullptr;
    AudioConfig cfg_;
    bool        initialized_   = false;
    bool        capturing_     = false;
};

} // namespace dtmfdec::node

#endif // DTMFDEC_NODE_AUDIO_IO_HPP
