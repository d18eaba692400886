#include "transport/NoteSequence.h"

#include <algorithm>
#include <utility>

namespace transport {

using engine::DrumHit;
using engine::DrumType;
using engine::NoteEvent;

namespace {
constexpr std::array<DrumType, engine::kDrumTypeCount> kLaneOrder = {
    DrumType::Kick, DrumType::Snare, DrumType::HiHat, DrumType::Clap};
}  // namespace

DrumPattern::DrumPattern(int totalSteps) : totalSteps_(std::max(0, totalSteps)) {}

bool DrumPattern::addHit(DrumType lane, int step) {
    if (step < 0 || step >= totalSteps_) {
        return false;
    }
    steps_[index(lane)].insert(step);
    return true;
}

void DrumPattern::removeHit(DrumType lane, int step) {
    steps_[index(lane)].erase(step);
}

bool DrumPattern::toggleHit(DrumType lane, int step) {
    if (step < 0 || step >= totalSteps_) {
        return false;
    }
    auto& laneSteps = steps_[index(lane)];
    if (laneSteps.erase(step) > 0) {
        return false;
    }
    laneSteps.insert(step);
    return true;
}

bool DrumPattern::hasHit(DrumType lane, int step) const {
    return steps_[index(lane)].count(step) != 0;
}

void DrumPattern::clearLane(DrumType lane) {
    steps_[index(lane)].clear();
}

void DrumPattern::clear() {
    for (auto& laneSteps : steps_) {
        laneSteps.clear();
    }
}

bool DrumPattern::toggleMute(DrumType lane) {
    auto& state = lanes_[index(lane)];
    state.muted = !state.muted;
    return state.muted;
}

bool DrumPattern::toggleSolo(DrumType lane) {
    auto& state = lanes_[index(lane)];
    state.solo = !state.solo;
    return state.solo;
}

void DrumPattern::setMuted(DrumType lane, bool muted) {
    lanes_[index(lane)].muted = muted;
}

void DrumPattern::setSolo(DrumType lane, bool solo) {
    lanes_[index(lane)].solo = solo;
}

void DrumPattern::setVolume(DrumType lane, float volume) {
    lanes_[index(lane)].volume = std::clamp(volume, 0.0f, 1.0f);
}

const DrumLaneState& DrumPattern::lane(DrumType lane) const {
    return lanes_[index(lane)];
}

bool DrumPattern::hasSoloedLane() const {
    return std::any_of(lanes_.begin(), lanes_.end(),
                       [](const DrumLaneState& state) { return state.solo; });
}

bool DrumPattern::isAudible(DrumType lane) const {
    const auto& state = lanes_[index(lane)];
    if (state.muted) {
        return false;
    }
    return !hasSoloedLane() || state.solo;
}

std::vector<DrumHit> DrumPattern::hitsAtStep(int step) const {
    std::vector<DrumHit> hits;
    for (DrumType lane : kLaneOrder) {
        if (hasHit(lane, step) && isAudible(lane)) {
            hits.push_back({lane, step, lanes_[index(lane)].volume});
        }
    }
    return hits;
}

std::vector<DrumHit> DrumPattern::audibleHits() const {
    std::vector<DrumHit> hits;
    for (DrumType lane : kLaneOrder) {
        if (!isAudible(lane)) {
            continue;
        }
        for (int step : steps_[index(lane)]) {
            hits.push_back({lane, step, lanes_[index(lane)].volume});
        }
    }
    std::stable_sort(hits.begin(), hits.end(),
                     [](const DrumHit& a, const DrumHit& b) { return a.step < b.step; });
    return hits;
}

void DrumPattern::setTotalSteps(int totalSteps) {
    totalSteps_ = std::max(0, totalSteps);
    for (auto& laneSteps : steps_) {
        laneSteps.erase(laneSteps.lower_bound(totalSteps_), laneSteps.end());
    }
}

NoteSequence::NoteSequence(engine::ArrangementConfig config, std::string instrumentId)
    : config_(config), instrumentId_(std::move(instrumentId)), drums_(config.totalTicks()) {}

std::optional<NoteEvent> NoteSequence::insertNoteUnlocked(int pitch,
                                                          int startTick,
                                                          int durationTicks,
                                                          float velocity) {
    if (pitch < kMinPitch || pitch > kMaxPitch) {
        return std::nullopt;
    }
    const int total = config_.totalTicks();
    if (startTick < 0 || startTick >= total) {
        return std::nullopt;
    }
    NoteEvent note;
    note.pitch = pitch;
    note.startTick = startTick;
    note.durationTicks = std::clamp(durationTicks, 1, total - startTick);
    note.velocity = std::clamp(velocity, 0.0f, 1.0f);
    notes_.push_back(note);
    return note;
}

std::optional<NoteEvent> NoteSequence::insertNote(int pitch,
                                                  int startTick,
                                                  int durationTicks,
                                                  float velocity) {
    std::lock_guard<std::mutex> lock(mutex_);
    return insertNoteUnlocked(pitch, startTick, durationTicks, velocity);
}

bool NoteSequence::removeNote(int pitch, int startTick) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(notes_.begin(), notes_.end(), [&](const NoteEvent& note) {
        return note.pitch == pitch && note.startTick == startTick;
    });
    if (it == notes_.end()) {
        return false;
    }
    notes_.erase(it);
    return true;
}

void NoteSequence::clearNotes() {
    std::lock_guard<std::mutex> lock(mutex_);
    notes_.clear();
}

std::size_t NoteSequence::noteCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return notes_.size();
}

void NoteSequence::setConfig(const engine::ArrangementConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    drums_.setTotalSteps(config_.totalTicks());
}

void NoteSequence::setCurrentInstrument(std::string instrumentId) {
    std::lock_guard<std::mutex> lock(mutex_);
    instrumentId_ = std::move(instrumentId);
}

DrumPattern NoteSequence::drums() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return drums_;
}

void NoteSequence::editDrums(const std::function<void(DrumPattern&)>& edit) {
    if (!edit) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    edit(drums_);
}

std::vector<NoteEvent> NoteSequence::scheduledEvents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return notes_;
}

std::vector<DrumHit> NoteSequence::scheduledDrumHits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return drums_.audibleHits();
}

engine::ArrangementConfig NoteSequence::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

std::string NoteSequence::currentInstrument() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return instrumentId_;
}

bool NoteSequence::addNote(const NoteEvent& note) {
    std::lock_guard<std::mutex> lock(mutex_);
    return insertNoteUnlocked(note.pitch, note.startTick, note.durationTicks, note.velocity)
        .has_value();
}

}  // namespace transport
