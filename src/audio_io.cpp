#include "audio_io.hpp"

#include <cstdio>

namespace dtmfdec::node {

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

AudioIO::AudioIO() = default;

AudioIO::~AudioIO() { close(); }

bool AudioIO::open(const AudioConfig& cfg) {
    cfg_ = cfg;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        std::fprintf(stderr, "[audio] Pa_Initialize failed: %s\n",
                     Pa_GetErrorText(err));
        return false;
    }
    initialized_ = true;

    // --- output stream ---
    PaStreamParameters out_params{};
    out_params.device = (cfg_.output_device >= 0)
                            ? cfg_.output_device
                            : Pa_GetDefaultOutputDevice();
    const PaDeviceInfo* out_info = (out_params.device == paNoDevice)
                                       ? nullptr
                                       : Pa_GetDeviceInfo(out_params.device);
    if (!out_info) {
        std::fprintf(stderr, "[audio] no output device available\n");
    } else {
        out_params.channelCount = 1;
        out_params.sampleFormat = paFloat32;
        out_params.suggestedLatency =
            out_info->defaultLowOutputLatency;

        err = Pa_OpenStream(&output_stream_, nullptr, &out_params,
                            cfg_.sample_rate, paFramesPerBufferUnspecified,
                            paClipOff, nullptr, nullptr);
        if (err != paNoError) {
            std::fprintf(stderr, "[audio] output stream open failed: %s\n",
                         Pa_GetErrorText(err));
            // Output is non-fatal: listening still works.
            output_stream_ = nullptr;
        }
    }

    // --- input stream ---
    PaStreamParameters in_params{};
    in_params.device = (cfg_.input_device >= 0)
                           ? cfg_.input_device
                           : Pa_GetDefaultInputDevice();
    const PaDeviceInfo* in_info = (in_params.device == paNoDevice)
                                      ? nullptr
                                      : Pa_GetDeviceInfo(in_params.device);
    if (!in_info) {
        std::fprintf(stderr, "[audio] no input device available\n");
    } else {
        in_params.channelCount = 1;
        in_params.sampleFormat = paFloat32;
        in_params.suggestedLatency =
            in_info->defaultLowInputLatency;

        err = Pa_OpenStream(&input_stream_, &in_params, nullptr,
                            cfg_.sample_rate, paFramesPerBufferUnspecified,
                            paClipOff, nullptr, nullptr);
        if (err != paNoError) {
            std::fprintf(stderr, "[audio] input stream open failed: %s\n",
                         Pa_GetErrorText(err));
            // Input is non-fatal: dialing still works.
            input_stream_ = nullptr;
        }
    }

    if (!output_stream_ && !input_stream_) {
        std::fprintf(stderr, "[audio] no usable audio stream\n");
        return false;
    }
    return true;
}

void AudioIO::close() {
    stop_capture();
    if (output_stream_) { Pa_CloseStream(output_stream_); output_stream_ = nullptr; }
    if (input_stream_)  { Pa_CloseStream(input_stream_);  input_stream_  = nullptr; }
    if (initialized_)   { Pa_Terminate(); initialized_ = false; }
}

// ---------------------------------------------------------------------------
// Playback
// ---------------------------------------------------------------------------

bool AudioIO::play(const std::vector<float>& pcm) {
    if (!output_stream_) return false;
    if (pcm.empty()) return true;

    PaError err = Pa_StartStream(output_stream_);
    if (err != paNoError) {
        std::fprintf(stderr, "[audio] output start failed: %s\n",
                     Pa_GetErrorText(err));
        return false;
    }

    err = Pa_WriteStream(output_stream_, pcm.data(),
                         static_cast<unsigned long>(pcm.size()));
    if (err != paNoError) {
        std::fprintf(stderr, "[audio] write failed: %s\n", Pa_GetErrorText(err));
    }

    Pa_StopStream(output_stream_);
    return err == paNoError;
}

// ---------------------------------------------------------------------------
// Capture
// ---------------------------------------------------------------------------

bool AudioIO::start_capture() {
    if (!input_stream_) return false;
    if (capturing_) return true;

    PaError err = Pa_StartStream(input_stream_);
    if (err != paNoError) {
        std::fprintf(stderr, "[audio] input start failed: %s\n",
                     Pa_GetErrorText(err));
        return false;
    }
    capturing_ = true;
    return true;
}

bool AudioIO::read_block(std::vector<float>& block, std::size_t frames) {
    if (!capturing_) return false;

    block.assign(frames, 0.0f);
    PaError err = Pa_ReadStream(input_stream_, block.data(),
                                static_cast<unsigned long>(frames));
    if (err == paInputOverflowed) {
        std::fprintf(stderr, "[audio] input overflow, samples dropped\n");
        return true;
    }
    if (err != paNoError) {
        std::fprintf(stderr, "[audio] read failed: %s\n", Pa_GetErrorText(err));
        return false;
    }
    return true;
}

void AudioIO::stop_capture() {
    if (capturing_ && input_stream_) Pa_StopStream(input_stream_);
    capturing_ = false;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

void AudioIO::list_devices() {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        std::fprintf(stderr, "[audio] Pa_Initialize failed: %s\n",
                     Pa_GetErrorText(err));
        return;
    }
    int n = Pa_GetDeviceCount();
    for (int i = 0; i < n; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        std::printf("  [%d] %s  (in:%d out:%d, %.0f Hz)\n",
                    i, info->name,
                    info->maxInputChannels,
                    info->maxOutputChannels,
                    info->defaultSampleRate);
    }
    Pa_Terminate();
}

} // namespace dtmfdec::node
