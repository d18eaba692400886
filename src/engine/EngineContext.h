#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_set>
#include <utility>
#include <vector>

#include "engine/EngineTypes.h"
#include "transport/AudioClock.h"

namespace engine {

enum class Bus { Dry, ReverbSend, DelaySend, Drum, Metronome };

constexpr std::size_t kBusCount = 5;

// Mono mix buffers for one render block.
class BusBuffers {
public:
    void resize(std::size_t frames);
    void clear();

    float* data(Bus bus) { return buses_[static_cast<std::size_t>(bus)].data(); }
    const float* data(Bus bus) const { return buses_[static_cast<std::size_t>(bus)].data(); }
    std::size_t frames() const { return frames_; }

private:
    std::array<std::vector<float>, kBusCount> buses_;
    std::size_t frames_ = 0;
};

// A scheduled sound owned by the context once added.
class Source {
public:
    virtual ~Source() = default;

    // Adds output for absolute frames [blockStart, blockStart + frames).
    virtual void render(std::uint64_t blockStart, std::size_t frames, BusBuffers& buses) = 0;
    // Early stop at `when` (context seconds).
    virtual void stop(double when) = 0;
    // First frame at which the source can be dropped.
    virtual std::uint64_t reclaimFrame() const = 0;
    virtual std::size_t nodeCount() const = 0;
    // Releases every node. Called exactly once, on reclaim.
    virtual void disconnect() = 0;
};

// Auxiliary effect returns mixed after the dry buses.
class SendProcessor {
public:
    virtual ~SendProcessor() = default;
    virtual void processSends(const BusBuffers& buses,
                              float* left,
                              float* right,
                              std::size_t frames) = 0;
};

// One audio graph: clock, buses, master gain and the set of live sources.
// The control side adds sources and stop commands through mutex-guarded
// queues; process() swaps them in at block start.
class EngineContext : public transport::AudioClock {
public:
    enum class State { Suspended, Running, Closed };

    struct Options {
        double sampleRate = 44100.0;
        uint16_t channels = 2;
        float masterGain = 0.7f;
        bool startRunning = false;
    };

    EngineContext();
    explicit EngineContext(const Options& options);
    ~EngineContext() override;

    EngineContext(const EngineContext&) = delete;
    EngineContext& operator=(const EngineContext&) = delete;

    double currentTime() const override;
    bool resume() override;
    void suspend();
    void close();
    State state() const;
    bool isRunning() const { return state() == State::Running; }
    // Simulates the platform refusing to start the output device.
    void setDeviceAvailable(bool available);

    double sampleRate() const { return sampleRate_; }
    uint16_t channels() const { return channels_; }
    std::uint64_t currentFrame() const;
    std::uint64_t timeToFrame(double seconds) const;

    void setMasterGain(float gain);  // clamped to [0, 1]
    float masterGain() const;
    void setBusGain(Bus bus, float gain);
    float busGain(Bus bus) const;

    std::uint64_t addSource(std::unique_ptr<Source> source);
    // No-op for ids that were already reclaimed.
    void stopSource(std::uint64_t id, double when);
    bool isSourceLive(std::uint64_t id) const;

    std::size_t liveSourceCount() const;
    std::size_t liveNodeCount() const;
    std::size_t reclaimedSourceCount() const;
    std::size_t reclaimedNodeCount() const;

    void setSendProcessor(SendProcessor* processor);

    // Realtime pull callback. Outputs silence and holds the clock while not running.
    void process(const ProcessBlock& block);

private:
    struct StopCommand {
        std::uint64_t id = 0;
        double when = 0.0;
    };

    void reclaimFinished(std::uint64_t blockEndFrame);

    const double sampleRate_;
    const uint16_t channels_;

    std::atomic<std::uint64_t> frameCursor_{0};
    std::atomic<State> state_{State::Suspended};
    std::atomic<bool> deviceAvailable_{true};

    mutable std::mutex mutex_;
    float masterGain_ = 0.7f;
    std::array<float, kBusCount> busGains_{};
    std::vector<std::pair<std::uint64_t, std::unique_ptr<Source>>> pendingSources_;
    std::vector<StopCommand> pendingStops_;
    std::unordered_set<std::uint64_t> liveIds_;
    std::uint64_t nextSourceId_ = 1;
    std::size_t liveNodes_ = 0;
    std::size_t reclaimedSources_ = 0;
    std::size_t reclaimedNodes_ = 0;

    std::mutex processorMutex_;
    SendProcessor* sendProcessor_ = nullptr;

    // Audio-thread state.
    std::vector<std::pair<std::uint64_t, std::unique_ptr<Source>>> active_;
    BusBuffers buses_;
    std::vector<float> left_;
    std::vector<float> right_;
};

}  // namespace engine
