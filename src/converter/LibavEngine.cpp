#include "converter/LibavEngine.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavfilter/avfilter.h>
#include <libavfilter/buffersink.h>
#include <libavfilter/buffersrc.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/mem.h>
#include <libavutil/opt.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

#include "converter/Errors.hpp"

namespace {
constexpr int kFrameSamples = 1024;

std::string AvError(int code) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(code, buf, sizeof(buf));
    return buf;
}

void Check(int rc, const std::string& what) {
    if (rc < 0) {
        throw std::runtime_error(what + ": " + AvError(rc));
    }
}

std::string Num(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6g", value);
    return buf;
}

std::string LayoutName(int channels) {
    AVChannelLayout layout{};
    av_channel_layout_default(&layout, channels);
    char buf[64] = {0};
    av_channel_layout_describe(&layout, buf, sizeof(buf));
    av_channel_layout_uninit(&layout);
    return buf;
}

std::string JoinChain(const std::vector<std::string>& filters) {
    std::string chain;
    for (const std::string& filter : filters) {
        if (!chain.empty()) {
            chain += ",";
        }
        chain += filter;
    }
    return chain;
}

// Owns the demuxer, decoder and sample converter for one input file.
struct DecodeSession {
    AVFormatContext* format_ctx = nullptr;
    AVCodecContext* codec_ctx = nullptr;
    SwrContext* swr_ctx = nullptr;
    AVPacket* packet = nullptr;
    AVFrame* frame = nullptr;
    int stream_index = -1;

    DecodeSession() = default;
    DecodeSession(const DecodeSession&) = delete;
    DecodeSession& operator=(const DecodeSession&) = delete;

    ~DecodeSession() {
        av_frame_free(&frame);
        av_packet_free(&packet);
        swr_free(&swr_ctx);
        avcodec_free_context(&codec_ctx);
        if (format_ctx != nullptr) {
            avformat_close_input(&format_ctx);
        }
    }
};

// Owns a filter graph plus its scratch frame.
struct FilterSession {
    AVFilterGraph* graph = nullptr;
    AVFilterInOut* inputs = nullptr;
    AVFilterInOut* outputs = nullptr;
    AVFilterContext* source = nullptr;
    AVFilterContext* sink = nullptr;
    AVFrame* frame = nullptr;

    FilterSession() = default;
    FilterSession(const FilterSession&) = delete;
    FilterSession& operator=(const FilterSession&) = delete;

    ~FilterSession() {
        avfilter_inout_free(&inputs);
        avfilter_inout_free(&outputs);
        avfilter_graph_free(&graph);
        av_frame_free(&frame);
    }
};

// Owns the muxer and encoder used to write synthetic WAV files.
struct EncodeSession {
    AVFormatContext* output_ctx = nullptr;
    AVCodecContext* codec_ctx = nullptr;
    AVPacket* packet = nullptr;

    EncodeSession() = default;
    EncodeSession(const EncodeSession&) = delete;
    EncodeSession& operator=(const EncodeSession&) = delete;

    ~EncodeSession() {
        if (output_ctx != nullptr) {
            if (output_ctx->oformat != nullptr && !(output_ctx->oformat->flags & AVFMT_NOFILE)) {
                avio_closep(&output_ctx->pb);
            }
            avformat_free_context(output_ctx);
        }
        avcodec_free_context(&codec_ctx);
        av_packet_free(&packet);
    }
};

void OpenInputFile(DecodeSession& session, const std::filesystem::path& path) {
    Check(avformat_open_input(&session.format_ctx, path.string().c_str(), nullptr, nullptr),
          "Could not open input file " + path.string());
    Check(avformat_find_stream_info(session.format_ctx, nullptr), "Could not find stream information");

    session.stream_index = av_find_best_stream(session.format_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    Check(session.stream_index, "No audio stream found in " + path.string());

    const AVCodecParameters* params = session.format_ctx->streams[session.stream_index]->codecpar;
    const AVCodec* codec = avcodec_find_decoder(params->codec_id);
    if (codec == nullptr) {
        throw std::runtime_error("No decoder available for " + path.string());
    }
    session.codec_ctx = avcodec_alloc_context3(codec);
    if (session.codec_ctx == nullptr) {
        throw std::runtime_error("Failed to allocate input codec context");
    }
    Check(avcodec_parameters_to_context(session.codec_ctx, params), "Failed to copy codec parameters");
    Check(avcodec_open2(session.codec_ctx, codec, nullptr), "Could not open input codec");
}

SourceInfo InfoFor(const DecodeSession& session) {
    const AVStream* stream = session.format_ctx->streams[session.stream_index];
    const AVCodecContext* codec = session.codec_ctx;

    SourceInfo info;
    info.sample_rate = codec->sample_rate;
    info.channels = codec->ch_layout.nb_channels;
    if (codec->bits_per_raw_sample > 0) {
        info.bits_per_sample = codec->bits_per_raw_sample;
    } else if (stream->codecpar->bits_per_coded_sample > 0) {
        info.bits_per_sample = stream->codecpar->bits_per_coded_sample;
    } else {
        info.bits_per_sample = av_get_bytes_per_sample(codec->sample_fmt) * 8;
    }

    if (info.sample_rate > 0) {
        if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
            info.sample_count = av_rescale_q(stream->duration, stream->time_base, AVRational{1, info.sample_rate});
        } else if (session.format_ctx->duration > 0) {
            info.sample_count = av_rescale(session.format_ctx->duration, info.sample_rate, AV_TIME_BASE);
        }
    }
    return info;
}

void SetupResampler(DecodeSession& session) {
    const int channels = session.codec_ctx->ch_layout.nb_channels;
    const int rate = session.codec_ctx->sample_rate;
    if (channels <= 0 || rate <= 0) {
        throw std::runtime_error("Input stream has no usable channel layout or rate");
    }

    // Same layout and rate on both sides: only the sample format changes.
    AVChannelLayout layout{};
    av_channel_layout_default(&layout, channels);

    session.swr_ctx = swr_alloc();
    if (session.swr_ctx == nullptr) {
        av_channel_layout_uninit(&layout);
        throw std::runtime_error("Could not allocate resample context");
    }
    av_opt_set_chlayout(session.swr_ctx, "in_chlayout", &layout, 0);
    av_opt_set_chlayout(session.swr_ctx, "out_chlayout", &layout, 0);
    av_opt_set_int(session.swr_ctx, "in_sample_rate", rate, 0);
    av_opt_set_int(session.swr_ctx, "out_sample_rate", rate, 0);
    av_opt_set_sample_fmt(session.swr_ctx, "in_sample_fmt", session.codec_ctx->sample_fmt, 0);
    av_opt_set_sample_fmt(session.swr_ctx, "out_sample_fmt", AV_SAMPLE_FMT_FLT, 0);
    av_channel_layout_uninit(&layout);

    Check(swr_init(session.swr_ctx), "Could not initialize resampler");
}

void AppendConverted(SwrContext* swr, const uint8_t** input, int input_samples, LibavEngine::FloatPcm& pcm) {
    const int capacity = swr_get_out_samples(swr, input_samples);
    Check(capacity, "Could not size conversion buffer");
    if (capacity == 0) {
        return;
    }

    const std::size_t offset = pcm.samples.size();
    const std::size_t channels = static_cast<std::size_t>(pcm.channels);
    pcm.samples.resize(offset + static_cast<std::size_t>(capacity) * channels);
    uint8_t* out = reinterpret_cast<uint8_t*>(pcm.samples.data() + offset);

    const int converted = swr_convert(swr, &out, capacity, input, input_samples);
    Check(converted, "Sample format conversion failed");
    pcm.samples.resize(offset + static_cast<std::size_t>(converted) * channels);
}

void CreateGraph(FilterSession& session) {
    session.graph = avfilter_graph_alloc();
    session.inputs = avfilter_inout_alloc();
    session.outputs = avfilter_inout_alloc();
    session.frame = av_frame_alloc();
    if (session.graph == nullptr || session.inputs == nullptr || session.outputs == nullptr ||
        session.frame == nullptr) {
        throw std::runtime_error("Could not allocate filter graph");
    }
}

void ConnectSink(FilterSession& session) {
    const AVFilter* abuffersink = avfilter_get_by_name("abuffersink");
    if (abuffersink == nullptr) {
        throw std::runtime_error("abuffersink filter not available");
    }
    Check(avfilter_graph_create_filter(&session.sink, abuffersink, "out", nullptr, nullptr, session.graph),
          "Could not create audio sink");

    session.inputs->name = av_strdup("out");
    session.inputs->filter_ctx = session.sink;
    session.inputs->pad_idx = 0;
    session.inputs->next = nullptr;
}

// Pulls every frame currently available from the sink.
void DrainSink(FilterSession& session, std::vector<uint8_t>& out, int& channels, int& rate) {
    while (true) {
        const int rc = av_buffersink_get_frame(session.sink, session.frame);
        if (rc == AVERROR(EAGAIN) || rc == AVERROR_EOF) {
            return;
        }
        Check(rc, "Filter graph failed");

        const AVFrame* frame = session.frame;
        channels = frame->ch_layout.nb_channels;
        rate = frame->sample_rate;
        const std::size_t bytes = static_cast<std::size_t>(frame->nb_samples) * static_cast<std::size_t>(channels) *
                                  static_cast<std::size_t>(av_get_bytes_per_sample(static_cast<AVSampleFormat>(frame->format)));
        out.insert(out.end(), frame->data[0], frame->data[0] + bytes);
        av_frame_unref(session.frame);
    }
}

// Feeds interleaved float PCM through chain and returns the packed output bytes.
std::vector<uint8_t> RunChain(const LibavEngine::FloatPcm& input,
                              const std::string& chain,
                              int& out_channels,
                              int& out_rate) {
    FilterSession session;
    CreateGraph(session);

    const AVFilter* abuffer = avfilter_get_by_name("abuffer");
    if (abuffer == nullptr) {
        throw std::runtime_error("abuffer filter not available");
    }
    const std::string args = "time_base=1/" + std::to_string(input.sample_rate) +
                             ":sample_rate=" + std::to_string(input.sample_rate) +
                             ":sample_fmt=flt:channel_layout=" + LayoutName(input.channels);
    Check(avfilter_graph_create_filter(&session.source, abuffer, "in", args.c_str(), nullptr, session.graph),
          "Could not create audio source");
    ConnectSink(session);

    session.outputs->name = av_strdup("in");
    session.outputs->filter_ctx = session.source;
    session.outputs->pad_idx = 0;
    session.outputs->next = nullptr;

    Check(avfilter_graph_parse_ptr(session.graph, chain.c_str(), &session.inputs, &session.outputs, nullptr),
          "Could not parse filter chain '" + chain + "'");
    Check(avfilter_graph_config(session.graph, nullptr), "Could not configure filter chain '" + chain + "'");

    // Take the negotiated output format from the sink; a chain that drops every
    // frame (fully trimmed silence, empty input) still reports it.
    AVChannelLayout sink_layout{};
    Check(av_buffersink_get_ch_layout(session.sink, &sink_layout), "Could not read sink channel layout");
    out_channels = sink_layout.nb_channels;
    av_channel_layout_uninit(&sink_layout);
    out_rate = av_buffersink_get_sample_rate(session.sink);

    std::vector<uint8_t> out;

    const std::size_t channels = static_cast<std::size_t>(input.channels);
    const std::size_t total = input.samples.size() / channels;
    AVFrame* frame = av_frame_alloc();
    if (frame == nullptr) {
        throw std::runtime_error("Could not allocate input frame");
    }

    try {
        for (std::size_t offset = 0; offset < total; offset += kFrameSamples) {
            const std::size_t count = std::min<std::size_t>(kFrameSamples, total - offset);
            frame->nb_samples = static_cast<int>(count);
            frame->format = AV_SAMPLE_FMT_FLT;
            frame->sample_rate = input.sample_rate;
            av_channel_layout_default(&frame->ch_layout, input.channels);
            frame->pts = static_cast<int64_t>(offset);
            Check(av_frame_get_buffer(frame, 0), "Could not allocate input frame buffer");
            std::memcpy(frame->data[0], input.samples.data() + offset * channels, count * channels * sizeof(float));

            // Ownership of the frame's buffers passes to the graph.
            Check(av_buffersrc_add_frame_flags(session.source, frame, 0), "Could not feed filter graph");
            DrainSink(session, out, out_channels, out_rate);
        }
        Check(av_buffersrc_add_frame_flags(session.source, nullptr, 0), "Could not close filter graph input");
        DrainSink(session, out, out_channels, out_rate);
    } catch (...) {
        av_frame_free(&frame);
        throw;
    }
    av_frame_free(&frame);

    return out;
}

LibavEngine::FloatPcm RunFloatChain(const LibavEngine::FloatPcm& input, const std::vector<std::string>& filters) {
    std::vector<std::string> chain = filters;
    chain.push_back("aformat=sample_fmts=flt");

    LibavEngine::FloatPcm result;
    const std::vector<uint8_t> bytes = RunChain(input, JoinChain(chain), result.channels, result.sample_rate);
    result.samples.resize(bytes.size() / sizeof(float));
    std::memcpy(result.samples.data(), bytes.data(), result.samples.size() * sizeof(float));
    return result;
}

SampleBuffer RunQuantizingChain(const LibavEngine::FloatPcm& input, const std::vector<std::string>& filters) {
    std::vector<std::string> chain = filters;
    chain.push_back("aformat=sample_fmts=u8:channel_layouts=mono");

    int channels = 0;
    int rate = 0;
    const std::vector<uint8_t> bytes = RunChain(input, JoinChain(chain), channels, rate);
    if (channels != 1) {
        throw std::runtime_error("Filter chain produced " + std::to_string(channels) + " channels, expected mono");
    }

    // libav has no signed 8-bit format; re-bias unsigned output.
    SampleBuffer samples(bytes.size());
    std::transform(bytes.begin(), bytes.end(), samples.begin(), [](uint8_t byte) {
        return static_cast<int8_t>(static_cast<int>(byte) - 128);
    });
    return samples;
}

struct SynthFormat {
    AVCodecID codec_id;
    AVSampleFormat sample_fmt;
    const char* filter_fmt;
    int raw_bits;
};

SynthFormat SynthFormatFor(SignalSpec::SampleFormat format) {
    switch (format) {
    case SignalSpec::SampleFormat::S24:
        return SynthFormat{AV_CODEC_ID_PCM_S24LE, AV_SAMPLE_FMT_S32, "s32", 24};
    case SignalSpec::SampleFormat::F32:
        return SynthFormat{AV_CODEC_ID_PCM_F32LE, AV_SAMPLE_FMT_FLT, "flt", 32};
    case SignalSpec::SampleFormat::S16:
    default:
        return SynthFormat{AV_CODEC_ID_PCM_S16LE, AV_SAMPLE_FMT_S16, "s16", 16};
    }
}

void WritePackets(EncodeSession& session, AVStream* stream) {
    while (true) {
        const int rc = avcodec_receive_packet(session.codec_ctx, session.packet);
        if (rc == AVERROR(EAGAIN) || rc == AVERROR_EOF) {
            return;
        }
        Check(rc, "Encoder receive failed");
        av_packet_rescale_ts(session.packet, session.codec_ctx->time_base, stream->time_base);
        session.packet->stream_index = stream->index;
        const int written = av_interleaved_write_frame(session.output_ctx, session.packet);
        av_packet_unref(session.packet);
        Check(written, "Could not write packet");
    }
}

void WriteSignal(const SignalSpec& spec, const std::filesystem::path& path) {
    if (spec.sample_rate <= 0 || spec.channels <= 0 || spec.duration_s <= 0.0) {
        throw std::runtime_error("Signal needs a positive rate, channel count and duration");
    }
    const SynthFormat format = SynthFormatFor(spec.format);

    std::string expression = "0";
    if (spec.waveform == SignalSpec::Waveform::Sine) {
        const double amplitude = std::pow(10.0, spec.gain_db / 20.0);
        expression = Num(amplitude) + "*sin(2*PI*" + Num(spec.frequency_hz) + "*t)";
    }
    const std::string chain = "aevalsrc=exprs=" + expression + ":s=" + std::to_string(spec.sample_rate) +
                              ":d=" + Num(spec.duration_s) + ":c=" + LayoutName(spec.channels) +
                              ",aformat=sample_fmts=" + format.filter_fmt;

    FilterSession graph;
    CreateGraph(graph);
    ConnectSink(graph);
    // A source-only chain has no open input.
    avfilter_inout_free(&graph.outputs);
    Check(avfilter_graph_parse_ptr(graph.graph, chain.c_str(), &graph.inputs, &graph.outputs, nullptr),
          "Could not parse signal chain '" + chain + "'");
    Check(avfilter_graph_config(graph.graph, nullptr), "Could not configure signal chain");

    EncodeSession session;
    const AVCodec* codec = avcodec_find_encoder(format.codec_id);
    if (codec == nullptr) {
        throw std::runtime_error("PCM encoder not available");
    }
    session.codec_ctx = avcodec_alloc_context3(codec);
    session.packet = av_packet_alloc();
    if (session.codec_ctx == nullptr || session.packet == nullptr) {
        throw std::runtime_error("Failed to allocate output codec context");
    }
    session.codec_ctx->sample_fmt = format.sample_fmt;
    session.codec_ctx->sample_rate = spec.sample_rate;
    session.codec_ctx->time_base = AVRational{1, spec.sample_rate};
    session.codec_ctx->bits_per_raw_sample = format.raw_bits;
    av_channel_layout_default(&session.codec_ctx->ch_layout, spec.channels);
    Check(avcodec_open2(session.codec_ctx, codec, nullptr), "Could not open output codec");

    Check(avformat_alloc_output_context2(&session.output_ctx, nullptr, "wav", path.string().c_str()),
          "Could not find WAV muxer");
    AVStream* stream = avformat_new_stream(session.output_ctx, nullptr);
    if (stream == nullptr) {
        throw std::runtime_error("Could not create output stream");
    }
    stream->time_base = session.codec_ctx->time_base;
    Check(avcodec_parameters_from_context(stream->codecpar, session.codec_ctx), "Failed to copy codec parameters");
    Check(avio_open(&session.output_ctx->pb, path.string().c_str(), AVIO_FLAG_WRITE),
          "Could not open output file " + path.string());
    Check(avformat_write_header(session.output_ctx, nullptr), "Failed to write header");

    int64_t pts = 0;
    while (true) {
        const int rc = av_buffersink_get_frame(graph.sink, graph.frame);
        if (rc == AVERROR(EAGAIN) || rc == AVERROR_EOF) {
            break;
        }
        Check(rc, "Signal generation failed");
        graph.frame->pts = pts;
        pts += graph.frame->nb_samples;
        const int sent = avcodec_send_frame(session.codec_ctx, graph.frame);
        av_frame_unref(graph.frame);
        Check(sent, "Encoder send failed");
        WritePackets(session, stream);
    }

    Check(avcodec_send_frame(session.codec_ctx, nullptr), "Failed to flush encoder");
    WritePackets(session, stream);
    Check(av_write_trailer(session.output_ctx), "Failed to write trailer");
}
}

LibavEngine::LibavEngine() {
    // Keep libav diagnostics from drawing over the TUI.
    av_log_set_level(AV_LOG_ERROR);
}

std::string LibavEngine::FilterFor(const ProcessingStage& stage) {
    if (const MixToMonoStage* mix = std::get_if<MixToMonoStage>(&stage)) {
        const std::string weight = Num(1.0 / mix->channels);
        std::string filter = "pan=mono|c0=";
        for (int channel = 0; channel < mix->channels; ++channel) {
            if (channel > 0) {
                filter += "+";
            }
            filter += weight + "*c" + std::to_string(channel);
        }
        return filter;
    }
    if (const TrimSilenceStage* trim = std::get_if<TrimSilenceStage>(&stage)) {
        // silenceremove only trims leading silence; run it on the reversed stream for the tail.
        const std::string leading = "silenceremove=start_periods=1:start_duration=" + Num(trim->min_duration_s) +
                                    ":start_threshold=" + Num(trim->threshold_db) + "dB";
        return leading + ",areverse," + leading + ",areverse";
    }
    if (const GainStage* gain = std::get_if<GainStage>(&stage)) {
        return "volume=" + Num(gain->gain_db) + "dB";
    }
    if (std::holds_alternative<NormalizeStage>(stage)) {
        // Applied as a measured volume in RunPlan.
        return "anull";
    }
    if (const ResampleStage* resample = std::get_if<ResampleStage>(&stage)) {
        // swr's windowed sinc filters before decimating.
        return "aresample=" + std::to_string(resample->to_rate) + ":filter_size=64:cutoff=0.95";
    }
    if (const LowPassStage* lowpass = std::get_if<LowPassStage>(&stage)) {
        return "lowpass=f=" + Num(lowpass->cutoff_hz) + ":p=1";
    }
    if (std::holds_alternative<DitherStage>(stage)) {
        return "aresample=osf=u8:dither_method=triangular";
    }
    return "aresample=osf=u8:dither_method=0";
}

SourceDescriptor LibavEngine::Inspect(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw IOError("Input file not found: " + path.string());
    }
    try {
        DecodeSession session;
        OpenInputFile(session, path);
        return SourceDescriptor{path, InfoFor(session)};
    } catch (const std::exception& e) {
        throw EngineFailure(std::string("Cannot read input file: ") + e.what(), ConversionPlan{});
    }
}

SourceDescriptor LibavEngine::Synthesize(const SignalSpec& spec, const std::filesystem::path& path) {
    try {
        WriteSignal(spec, path);
    } catch (const std::exception& e) {
        throw EngineFailure("Could not synthesize " + path.string() + ": " + e.what(), ConversionPlan{});
    }
    return Inspect(path);
}

SampleBuffer LibavEngine::Process(const SourceDescriptor& source, const ConversionPlan& plan) {
    try {
        ReportProgress(0.0);
        const FloatPcm decoded = DecodeToFloat(source);
        SampleBuffer samples = RunPlan(decoded, plan);
        ReportProgress(1.0);
        return samples;
    } catch (const std::exception& e) {
        throw EngineFailure(e.what(), plan);
    }
}

LibavEngine::FloatPcm LibavEngine::DecodeToFloat(const SourceDescriptor& source) {
    DecodeSession session;
    OpenInputFile(session, source.path);
    SetupResampler(session);

    session.packet = av_packet_alloc();
    session.frame = av_frame_alloc();
    if (session.packet == nullptr || session.frame == nullptr) {
        throw std::runtime_error("Could not allocate decode buffers");
    }

    FloatPcm pcm;
    pcm.channels = session.codec_ctx->ch_layout.nb_channels;
    pcm.sample_rate = session.codec_ctx->sample_rate;

    const long long expected = source.info.sample_count;
    long long decoded_samples = 0;

    auto receive_frames = [&]() {
        while (true) {
            const int rc = avcodec_receive_frame(session.codec_ctx, session.frame);
            if (rc == AVERROR(EAGAIN) || rc == AVERROR_EOF) {
                return;
            }
            Check(rc, "Decoding failed");
            AppendConverted(session.swr_ctx,
                            const_cast<const uint8_t**>(session.frame->extended_data),
                            session.frame->nb_samples,
                            pcm);
            decoded_samples += session.frame->nb_samples;
            av_frame_unref(session.frame);
            // Decoding is the first half of the work.
            if (expected > 0) {
                ReportProgress(0.5 * static_cast<double>(decoded_samples) / static_cast<double>(expected));
            }
        }
    };

    int rc = 0;
    while ((rc = av_read_frame(session.format_ctx, session.packet)) >= 0) {
        if (session.packet->stream_index == session.stream_index) {
            const int sent = avcodec_send_packet(session.codec_ctx, session.packet);
            av_packet_unref(session.packet);
            Check(sent, "Failed to send packet to decoder");
            receive_frames();
        } else {
            av_packet_unref(session.packet);
        }
    }
    if (rc != AVERROR_EOF) {
        Check(rc, "Failed to read input");
    }

    Check(avcodec_send_packet(session.codec_ctx, nullptr), "Failed to flush decoder");
    receive_frames();
    AppendConverted(session.swr_ctx, nullptr, 0, pcm);

    return pcm;
}

SampleBuffer LibavEngine::RunPlan(const FloatPcm& decoded, const ConversionPlan& plan) {
    std::vector<std::string> before_normalize;
    std::vector<std::string> after_normalize;
    const NormalizeStage* normalize = nullptr;

    for (const ProcessingStage& stage : plan) {
        if (const NormalizeStage* found = std::get_if<NormalizeStage>(&stage)) {
            normalize = found;
            continue;
        }
        (normalize == nullptr ? before_normalize : after_normalize).push_back(FilterFor(stage));
    }

    if (normalize == nullptr) {
        return RunQuantizingChain(decoded, before_normalize);
    }

    // Peak normalization needs the whole conditioned signal before the gain is known.
    const FloatPcm conditioned = RunFloatChain(decoded, before_normalize);
    ReportProgress(0.75);

    float peak = 0.0f;
    for (const float sample : conditioned.samples) {
        peak = std::max(peak, std::fabs(sample));
    }
    const double gain = peak > 0.0f ? std::pow(10.0, normalize->target_dbfs / 20.0) / peak : 1.0;
    after_normalize.insert(after_normalize.begin(), "volume=" + Num(gain));

    return RunQuantizingChain(conditioned, after_normalize);
}
