#include "engine/EngineContext.h"

#include <algorithm>
#include <cmath>
#include <iterator>

#include "dsp/Denormals.h"

namespace engine {

namespace {
constexpr float kMetronomeBusGain = 0.3f;
}  // namespace

void BusBuffers::resize(std::size_t frames) {
    if (frames_ == frames) {
        return;
    }
    frames_ = frames;
    for (auto& bus : buses_) {
        bus.assign(frames_, 0.0f);
    }
}

void BusBuffers::clear() {
    for (auto& bus : buses_) {
        std::fill(bus.begin(), bus.end(), 0.0f);
    }
}

EngineContext::EngineContext() : EngineContext(Options{}) {}

EngineContext::EngineContext(const Options& options)
    : sampleRate_(options.sampleRate > 0.0 ? options.sampleRate : 44100.0),
      channels_(options.channels == 0 ? 2 : options.channels) {
    masterGain_ = std::clamp(options.masterGain, 0.0f, 1.0f);
    busGains_.fill(1.0f);
    busGains_[static_cast<std::size_t>(Bus::Metronome)] = kMetronomeBusGain;
    if (options.startRunning) {
        state_.store(State::Running);
    }
}

EngineContext::~EngineContext() {
    close();
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : pendingSources_) {
        entry.second->disconnect();
    }
    pendingSources_.clear();
    for (auto& entry : active_) {
        entry.second->disconnect();
    }
    active_.clear();
}

double EngineContext::currentTime() const {
    return static_cast<double>(frameCursor_.load(std::memory_order_relaxed)) / sampleRate_;
}

bool EngineContext::resume() {
    if (state_.load() == State::Closed || !deviceAvailable_.load()) {
        return false;
    }
    state_.store(State::Running);
    return true;
}

void EngineContext::suspend() {
    State expected = State::Running;
    state_.compare_exchange_strong(expected, State::Suspended);
}

void EngineContext::close() {
    state_.store(State::Closed);
}

EngineContext::State EngineContext::state() const {
    return state_.load();
}

void EngineContext::setDeviceAvailable(bool available) {
    deviceAvailable_.store(available);
    if (!available) {
        suspend();
    }
}

std::uint64_t EngineContext::currentFrame() const {
    return frameCursor_.load(std::memory_order_relaxed);
}

std::uint64_t EngineContext::timeToFrame(double seconds) const {
    if (!(seconds > 0.0)) {
        return 0;
    }
    return static_cast<std::uint64_t>(std::llround(seconds * sampleRate_));
}

void EngineContext::setMasterGain(float gain) {
    std::lock_guard<std::mutex> lock(mutex_);
    masterGain_ = std::clamp(gain, 0.0f, 1.0f);
}

float EngineContext::masterGain() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return masterGain_;
}

void EngineContext::setBusGain(Bus bus, float gain) {
    std::lock_guard<std::mutex> lock(mutex_);
    busGains_[static_cast<std::size_t>(bus)] = std::max(0.0f, gain);
}

float EngineContext::busGain(Bus bus) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return busGains_[static_cast<std::size_t>(bus)];
}

std::uint64_t EngineContext::addSource(std::unique_ptr<Source> source) {
    if (!source) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const std::uint64_t id = nextSourceId_++;
    liveNodes_ += source->nodeCount();
    liveIds_.insert(id);
    pendingSources_.emplace_back(id, std::move(source));
    return id;
}

void EngineContext::stopSource(std::uint64_t id, double when) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (liveIds_.count(id) == 0) {
        return;
    }
    pendingStops_.push_back({id, when});
}

bool EngineContext::isSourceLive(std::uint64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return liveIds_.count(id) != 0;
}

std::size_t EngineContext::liveSourceCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return liveIds_.size();
}

std::size_t EngineContext::liveNodeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return liveNodes_;
}

std::size_t EngineContext::reclaimedSourceCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reclaimedSources_;
}

std::size_t EngineContext::reclaimedNodeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reclaimedNodes_;
}

void EngineContext::setSendProcessor(SendProcessor* processor) {
    std::lock_guard<std::mutex> lock(processorMutex_);
    sendProcessor_ = processor;
}

void EngineContext::process(const ProcessBlock& block) {
    if (!block.output || block.frames == 0 || block.channels == 0) {
        return;
    }
    const std::size_t frames = block.frames;
    std::fill(block.output, block.output + frames * block.channels, 0.0f);
    if (state_.load() != State::Running) {
        return;
    }

    dsp::ScopedDenormalsDisable denormals;

    const std::uint64_t blockStartFrame = frameCursor_.load(std::memory_order_relaxed);
    const std::uint64_t blockEndFrame = blockStartFrame + frames;

    std::vector<std::pair<std::uint64_t, std::unique_ptr<Source>>> incoming;
    std::vector<StopCommand> stops;
    float masterGain = 1.0f;
    std::array<float, kBusCount> busGains{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        incoming.swap(pendingSources_);
        stops.swap(pendingStops_);
        masterGain = masterGain_;
        busGains = busGains_;
    }

    active_.insert(active_.end(), std::make_move_iterator(incoming.begin()),
                   std::make_move_iterator(incoming.end()));
    for (const auto& command : stops) {
        auto it = std::find_if(active_.begin(), active_.end(),
                               [&command](const auto& entry) { return entry.first == command.id; });
        if (it != active_.end()) {
            it->second->stop(command.when);
        }
    }

    buses_.resize(frames);
    buses_.clear();
    for (auto& entry : active_) {
        entry.second->render(blockStartFrame, frames, buses_);
    }

    left_.assign(frames, 0.0f);
    right_.assign(frames, 0.0f);
    const float* dry = buses_.data(Bus::Dry);
    const float* drum = buses_.data(Bus::Drum);
    const float* metronome = buses_.data(Bus::Metronome);
    const float dryGain = busGains[static_cast<std::size_t>(Bus::Dry)];
    const float drumGain = busGains[static_cast<std::size_t>(Bus::Drum)];
    const float metronomeGain = busGains[static_cast<std::size_t>(Bus::Metronome)];
    for (std::size_t i = 0; i < frames; ++i) {
        const float mono = dry[i] * dryGain + drum[i] * drumGain + metronome[i] * metronomeGain;
        left_[i] = mono;
        right_[i] = mono;
    }

    {
        std::lock_guard<std::mutex> lock(processorMutex_);
        if (sendProcessor_) {
            sendProcessor_->processSends(buses_, left_.data(), right_.data(), frames);
        }
    }

    for (std::size_t i = 0; i < frames; ++i) {
        const float l = left_[i] * masterGain;
        const float r = right_[i] * masterGain;
        float* frame = block.output + i * block.channels;
        if (block.channels == 1) {
            frame[0] = 0.5f * (l + r);
            continue;
        }
        frame[0] = l;
        frame[1] = r;
        for (uint16_t ch = 2; ch < block.channels; ++ch) {
            frame[ch] = 0.5f * (l + r);
        }
    }

    frameCursor_.fetch_add(frames, std::memory_order_relaxed);
    reclaimFinished(blockEndFrame);
}

void EngineContext::reclaimFinished(std::uint64_t blockEndFrame) {
    std::vector<std::uint64_t> reclaimedIds;
    std::size_t reclaimedNodes = 0;
    auto finished = std::stable_partition(
        active_.begin(), active_.end(),
        [blockEndFrame](const auto& entry) { return entry.second->reclaimFrame() > blockEndFrame; });
    for (auto it = finished; it != active_.end(); ++it) {
        reclaimedNodes += it->second->nodeCount();
        it->second->disconnect();
        reclaimedIds.push_back(it->first);
    }
    active_.erase(finished, active_.end());
    if (reclaimedIds.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto id : reclaimedIds) {
        liveIds_.erase(id);
    }
    liveNodes_ -= std::min(liveNodes_, reclaimedNodes);
    reclaimedSources_ += reclaimedIds.size();
    reclaimedNodes_ += reclaimedNodes;
}

}  // namespace engine
