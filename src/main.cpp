#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "audio/WaveWriter.h"
#include "engine/DrumSampler.h"
#include "engine/EffectsBus.h"
#include "engine/EngineContext.h"
#include "engine/EngineParams.h"
#include "engine/Pitch.h"
#include "engine/VoiceSynthesizer.h"
#include "render/OfflineRenderer.h"
#include "transport/DispatchTarget.h"
#include "transport/NoteSequence.h"
#include "transport/TransportScheduler.h"

namespace {

enum class RunMode { Offline, Transport };

struct AppConfig {
    RunMode mode = RunMode::Offline;
    std::vector<engine::NoteEvent> notes;
    std::vector<engine::DrumHit> drums;
    std::string instrument = engine::InstrumentRegistry::kDefaultInstrumentId;
    double bpm = transport::TransportScheduler::kDefaultBpm;
    engine::ArrangementConfig arrangement;
    double duration = 0.0;  // 0 = arrangement length plus tail
    bool metronome = false;
    engine::EffectSettings effects;
    float masterVolume = engine::DefaultParamValue(engine::ParamId::MasterVolume);
    std::filesystem::path output = "notelab_demo.wav";
};

void printUsage() {
    std::cout << "用法: notelab [--mode offline|transport] [--notes 60:0:4[:0.8],C5:8:4] "
                 "[--drums kick:0,snare:4,hihat:2] [--instrument piano] [--bpm 120] "
                 "[--bars 8] [--duration 0] [--metronome on|off] "
                 "[--reverb-enabled on] [--reverb-mix 0.3] [--delay-enabled on] "
                 "[--delay-time 0.3] [--delay-feedback 0.4] [--delay-mix 0.25] "
                 "[--master-volume 0.7] [--output out.wav]\n";
    std::cout << "乐器: ";
    const engine::InstrumentRegistry registry;
    for (const auto& id : registry.ids()) {
        std::cout << id << ' ';
    }
    std::cout << "\n";
}

bool parseDouble(const std::string& value, double& dest) {
    try {
        dest = std::stod(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseFloat(const std::string& value, float& dest) {
    try {
        dest = std::stof(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseInt(const std::string& value, int& dest) {
    try {
        std::size_t consumed = 0;
        dest = std::stoi(value, &consumed);
        return consumed == value.size();
    } catch (const std::exception&) {
        return false;
    }
}

std::string toLower(std::string value) {
    for (auto& ch : value) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return value;
}

bool parseSwitch(const std::string& value) {
    const auto lower = toLower(value);
    return lower == "on" || lower == "true" || lower == "1" || lower == "yes";
}

std::vector<std::string> split(const std::string& text, char separator) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string piece;
    while (std::getline(ss, piece, separator)) {
        parts.push_back(piece);
    }
    return parts;
}

// "60:0:4:0.8" or "C4:0:4"; start, duration and velocity are optional.
std::vector<engine::NoteEvent> parseNoteList(const std::string& csv) {
    std::vector<engine::NoteEvent> notes;
    for (const auto& token : split(csv, ',')) {
        const auto segments = split(token, ':');
        if (segments.empty() || segments[0].empty()) {
            continue;
        }

        engine::NoteEvent note;
        note.durationTicks = transport::TransportScheduler::kDefaultRecordDurationTicks;
        if (!parseInt(segments[0], note.pitch)) {
            note.pitch = engine::NoteNameToMidi(segments[0]);
        }
        if (segments.size() >= 2 && !segments[1].empty() &&
            !parseInt(segments[1], note.startTick)) {
            continue;
        }
        if (segments.size() >= 3 && !segments[2].empty() &&
            !parseInt(segments[2], note.durationTicks)) {
            continue;
        }
        if (segments.size() >= 4 && !segments[3].empty() &&
            !parseFloat(segments[3], note.velocity)) {
            continue;
        }
        if (note.startTick < 0 || note.durationTicks < 1) {
            continue;
        }
        note.velocity = std::clamp(note.velocity, 0.0f, 1.0f);
        notes.push_back(note);
    }
    return notes;
}

std::vector<engine::DrumHit> parseDrumList(const std::string& csv) {
    std::vector<engine::DrumHit> hits;
    for (const auto& token : split(csv, ',')) {
        const auto segments = split(token, ':');
        if (segments.size() < 2) {
            continue;
        }
        const auto type = engine::DrumTypeFromId(toLower(segments[0]));
        engine::DrumHit hit;
        if (!type || !parseInt(segments[1], hit.step) || hit.step < 0) {
            std::cerr << "忽略无效的鼓点: " << token << "\n";
            continue;
        }
        hit.type = *type;
        if (segments.size() >= 3 && !parseFloat(segments[2], hit.volume)) {
            continue;
        }
        hit.volume = std::clamp(hit.volume, 0.0f, 1.0f);
        hits.push_back(hit);
    }
    return hits;
}

void applyParam(AppConfig& config, const engine::ParamInfo& info, const std::string& value) {
    float parsed = 0.0f;
    if (info.type == engine::ParamType::Bool) {
        parsed = parseSwitch(value) ? 1.0f : 0.0f;
    } else if (!parseFloat(value, parsed)) {
        std::cerr << "参数值无效: " << info.name << "=" << value << "\n";
        return;
    }

    if (info.id == engine::ParamId::MasterVolume) {
        config.masterVolume = engine::ClampToRange(info, parsed);
        return;
    }
    engine::SetEffectParam(config.effects, info.id, parsed);
}

AppConfig parseArgs(int argc, char** argv, bool& showHelp) {
    AppConfig config;
    showHelp = false;

    std::unordered_map<std::string, std::string> kv;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            showHelp = true;
            return config;
        }
        if (arg.rfind("--", 0) == 0 && i + 1 < argc) {
            kv[arg.substr(2)] = argv[++i];
        }
    }

    if (auto it = kv.find("mode"); it != kv.end()) {
        config.mode = toLower(it->second) == "transport" ? RunMode::Transport : RunMode::Offline;
    }
    if (auto it = kv.find("notes"); it != kv.end()) {
        config.notes = parseNoteList(it->second);
    }
    if (auto it = kv.find("drums"); it != kv.end()) {
        config.drums = parseDrumList(it->second);
    }
    if (auto it = kv.find("instrument"); it != kv.end()) {
        config.instrument = toLower(it->second);
    }
    if (auto it = kv.find("bpm"); it != kv.end()) {
        parseDouble(it->second, config.bpm);
    }
    if (auto it = kv.find("bars"); it != kv.end()) {
        int bars = config.arrangement.bars;
        if (parseInt(it->second, bars) && bars > 0) {
            config.arrangement.bars = bars;
        }
    }
    if (auto it = kv.find("duration"); it != kv.end()) {
        parseDouble(it->second, config.duration);
    }
    if (auto it = kv.find("metronome"); it != kv.end()) {
        config.metronome = parseSwitch(it->second);
    }
    if (auto it = kv.find("output"); it != kv.end()) {
        config.output = it->second;
    }

    for (const auto& [key, value] : kv) {
        if (const auto* info = engine::FindParamByName(key)) {
            applyParam(config, *info, value);
        }
    }
    config.effects = engine::ClampEffectSettings(config.effects);

    return config;
}

// Fires the scheduler poll from the audio clock so transport mode renders
// faster than realtime with the same onsets.
class BlockClockTimer : public transport::SchedulerTimer {
public:
    explicit BlockClockTimer(const engine::EngineContext& context) : context_(context) {}

    void start(double periodSec, Callback callback) override {
        period_ = periodSec;
        callback_ = std::move(callback);
        nextFire_ = context_.currentTime() + period_;
        active_ = true;
    }

    void stop() override { active_ = false; }
    bool running() const override { return active_; }
    double now() const override { return context_.currentTime(); }

    void advance() {
        if (!active_ || context_.currentTime() < nextFire_) {
            return;
        }
        nextFire_ += period_;
        auto callback = callback_;
        if (callback) {
            callback();
        }
    }

private:
    const engine::EngineContext& context_;
    Callback callback_;
    double period_ = 0.1;
    double nextFire_ = 0.0;
    bool active_ = false;
};

bool renderOffline(const AppConfig& config, render::RenderedBuffer& out, std::string& errorMessage) {
    render::RenderRequest request;
    request.notes = config.notes;
    request.drumHits = config.drums;
    request.instrumentId = config.instrument;
    request.bpm = config.bpm;
    request.effects = config.effects;
    request.durationSec = config.duration > 0.0
                              ? config.duration
                              : render::ArrangementDuration(config.arrangement, config.bpm);

    render::OfflineRenderer renderer;
    return renderer.renderToBuffer(request, out, errorMessage);
}

bool renderTransport(const AppConfig& config, render::RenderedBuffer& out, std::string& errorMessage) {
    engine::EngineContext::Options options;
    options.masterGain = config.masterVolume;
    engine::EngineContext context(options);
    engine::EffectsBus effects(context, config.effects);
    const engine::InstrumentRegistry registry;
    engine::VoiceSynthesizer synth(context, registry, &effects);
    engine::DrumSampler drums(context, &effects);

    transport::NoteSequence sequence(config.arrangement, config.instrument);
    for (const auto& note : config.notes) {
        if (!sequence.insertNote(note.pitch, note.startTick, note.durationTicks, note.velocity)) {
            std::cerr << "忽略超出范围的音符: " << engine::MidiToNoteName(note.pitch) << " @"
                      << note.startTick << "\n";
        }
    }
    sequence.editDrums([&config](transport::DrumPattern& pattern) {
        for (const auto& hit : config.drums) {
            pattern.addHit(hit.type, hit.step);
        }
    });

    transport::SynthDispatchTarget target(synth, &drums);
    BlockClockTimer timer(context);
    transport::TransportScheduler scheduler(context, timer, sequence, target);
    scheduler.setBPM(config.bpm);
    scheduler.setLoop(false);
    scheduler.setMetronome(config.metronome);
    scheduler.setPlayStateCallback([](transport::PlayState state) {
        std::cout << "播放状态: " << transport::ToString(state) << "\n";
    });

    if (!scheduler.play()) {
        errorMessage = std::string("无法启动播放: ") + engine::ToString(scheduler.lastError());
        return false;
    }

    const std::size_t blockFrames = 512;
    const uint16_t channels = context.channels();
    const double limitSeconds = render::ArrangementDuration(config.arrangement, scheduler.bpm());
    const auto limitFrames = static_cast<std::size_t>(std::ceil(limitSeconds * context.sampleRate()));
    std::vector<float> samples;
    samples.reserve(limitFrames * channels);

    std::size_t rendered = 0;
    const auto tailFrames =
        static_cast<std::size_t>(render::OfflineRenderer::kTailSeconds * context.sampleRate());
    std::size_t stoppedAt = limitFrames;
    while (rendered < std::min(limitFrames, stoppedAt + tailFrames)) {
        std::vector<float> block(blockFrames * channels, 0.0f);
        context.process({block.data(), blockFrames, channels});
        samples.insert(samples.end(), block.begin(), block.end());
        rendered += blockFrames;
        timer.advance();
        if (stoppedAt == limitFrames && scheduler.playState() == transport::PlayState::Stopped) {
            stoppedAt = rendered;
        }
    }
    scheduler.stop();

    if (scheduler.driftCount() > 0) {
        std::cerr << "调度漂移次数: " << scheduler.driftCount() << "\n";
    }

    out.sampleRate = context.sampleRate();
    out.channels = channels;
    out.frames = rendered;
    out.samples = std::move(samples);
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    bool showHelp = false;
    AppConfig appConfig = parseArgs(argc, argv, showHelp);
    if (showHelp) {
        printUsage();
        return 0;
    }

    if (appConfig.notes.empty() && appConfig.drums.empty()) {
        appConfig.notes = parseNoteList("60:0:4,64:4:4,67:8:4,72:12:4");
    }

    render::RenderedBuffer buffer;
    std::string errorMessage;
    const bool ok = appConfig.mode == RunMode::Transport
                        ? renderTransport(appConfig, buffer, errorMessage)
                        : renderOffline(appConfig, buffer, errorMessage);
    if (!ok || buffer.samples.empty()) {
        std::cerr << "生成样本失败，请检查输入参数。";
        if (!errorMessage.empty()) {
            std::cerr << " (" << errorMessage << ")";
        }
        std::cerr << "\n";
        return 1;
    }

    audio::WaveFormat format;
    format.sampleRate = static_cast<uint32_t>(buffer.sampleRate);
    format.channels = buffer.channels;
    const audio::WaveWriter writer(format);
    if (!writer.write(appConfig.output, buffer.samples, errorMessage)) {
        std::cerr << errorMessage << "\n";
        return 1;
    }

    std::cout << "已生成 WAV 文件: " << std::filesystem::absolute(appConfig.output)
              << "\n";
    return 0;
}
