#include "transport/TransportScheduler.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace transport {

using engine::EngineError;

const char* ToString(PlayState state) {
    switch (state) {
        case PlayState::Stopped:
            return "Stopped";
        case PlayState::Playing:
            return "Playing";
        case PlayState::Paused:
            return "Paused";
    }
    return "Stopped";
}

TransportScheduler::TransportScheduler(AudioClock& clock,
                                       SchedulerTimer& timer,
                                       SequenceProvider& sequence,
                                       DispatchTarget& target)
    : clock_(clock), timer_(timer), sequence_(sequence), target_(target) {
    state_.bpm = kDefaultBpm;
    reporter_ = std::thread([this] { reportLoop(); });
}

TransportScheduler::~TransportScheduler() {
    // A tick may be running on the timer thread; it must finish before the
    // members it touches go away.
    timer_.stopAndWait();
    {
        std::lock_guard<std::mutex> lock(reportMutex_);
        reportShutdown_ = true;
    }
    reportCv_.notify_all();
    if (reporter_.joinable()) {
        reporter_.join();
    }
}

bool TransportScheduler::play() {
    Notifications notifications;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.isPlaying && !state_.isPaused) {
            return true;
        }
        if (!clock_.resume()) {
            lastError_ = EngineError::AudioContextUnavailable;
            return false;
        }
        if (state_.isPaused) {
            state_.isPaused = false;
        } else {
            state_.position = 0.0;
            lastScheduledTick_ = -1;
        }
        state_.isPlaying = true;
        lastError_ = EngineError::None;
        snapshotUnlocked();
        nextScheduleTime_ = clock_.currentTime();
        timer_.start(kPollIntervalSec, [this] { tick(); });
        notifications.playStates.push_back(PlayState::Playing);
    }
    fire(notifications);
    tick();
    return true;
}

void TransportScheduler::pause() {
    Notifications notifications;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!state_.isPlaying || state_.isPaused) {
            return;
        }
        state_.isPaused = true;
        timer_.stop();
        notifications.playStates.push_back(PlayState::Paused);
    }
    fire(notifications);
}

void TransportScheduler::stop() {
    Notifications notifications;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!state_.isPlaying) {
            return;
        }
        stopUnlocked(notifications);
    }
    fire(notifications);
}

void TransportScheduler::stopUnlocked(Notifications& notifications) {
    state_.isPlaying = false;
    state_.isPaused = false;
    state_.position = 0.0;
    lastScheduledTick_ = -1;
    timer_.stop();
    notifications.playStates.push_back(PlayState::Stopped);
    notifications.position = 0;
}

void TransportScheduler::endOfArrangementUnlocked(Notifications& notifications) {
    if (state_.loopEnabled) {
        state_.position = 0.0;
        lastScheduledTick_ = -1;
        snapshotUnlocked();
    } else {
        stopUnlocked(notifications);
    }
}

void TransportScheduler::snapshotUnlocked() {
    scheduledNotes_ = sequence_.scheduledEvents();
    scheduledDrums_ = sequence_.scheduledDrumHits();
}

void TransportScheduler::tick() {
    Notifications notifications;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!state_.isPlaying || state_.isPaused) {
            return;
        }

        const double now = clock_.currentTime();
        if (nextScheduleTime_ < now) {
            nextScheduleTime_ = now + kDriftEpsilonSec;
            ++driftCount_;
            lastError_ = EngineError::SchedulingDrift;
        }

        const engine::ArrangementConfig config = sequence_.config();
        const int totalTicks = config.totalTicks();
        if (totalTicks <= 0) {
            stopUnlocked(notifications);
        }

        while (state_.isPlaying && nextScheduleTime_ < now + kLookaheadSec) {
            // The arrangement may have shrunk under the cursor since the last pass.
            if (state_.position >= totalTicks) {
                endOfArrangementUnlocked(notifications);
                continue;
            }

            const int tick = static_cast<int>(std::floor(state_.position));
            if (tick != lastScheduledTick_) {
                dispatchTickUnlocked(tick, config);
                lastScheduledTick_ = tick;
            }

            state_.position += 1.0;
            nextScheduleTime_ += engine::SecondsPerTick(state_.bpm);

            if (state_.position >= totalTicks) {
                endOfArrangementUnlocked(notifications);
            }
        }

        if (state_.isPlaying) {
            const double wallNow = timer_.now();
            if (wallNow - lastPositionReport_ >= kPositionReportIntervalSec) {
                lastPositionReport_ = wallNow;
                notifications.position = static_cast<int>(std::floor(state_.position));
            }
        }
    }
    fire(notifications);
}

void TransportScheduler::dispatchTickUnlocked(int tick, const engine::ArrangementConfig& config) {
    const double startTime = nextScheduleTime_;
    const double secondsPerTick = engine::SecondsPerTick(state_.bpm);
    bool delivered = true;

    if (state_.metronomeEnabled && config.sixteenthsPerBeat > 0 &&
        tick % config.sixteenthsPerBeat == 0) {
        const int ticksPerBar = config.ticksPerBar();
        const bool isDownbeat = ticksPerBar > 0 && tick % ticksPerBar == 0;
        delivered = target_.dispatchMetronome(startTime, isDownbeat) && delivered;
    }

    for (const auto& note : scheduledNotes_) {
        if (note.startTick != tick) {
            continue;
        }
        const std::string instrument = sequence_.currentInstrument();
        delivered = target_.dispatchNote(instrument, note, startTime,
                                         note.durationTicks * secondsPerTick) &&
                    delivered;
    }

    for (const auto& hit : scheduledDrums_) {
        if (hit.step != tick) {
            continue;
        }
        delivered = target_.dispatchDrum(hit, startTime) && delivered;
    }

    if (!delivered) {
        lastError_ = EngineError::AudioContextUnavailable;
    }
}

void TransportScheduler::setBPM(double bpm) {
    if (!std::isfinite(bpm)) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    state_.bpm = std::clamp(bpm, kMinBpm, kMaxBpm);
}

double TransportScheduler::bpm() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.bpm;
}

double TransportScheduler::positionToSeconds(double position) const {
    return position * sixteenthDuration();
}

double TransportScheduler::secondsToPosition(double seconds) const {
    return seconds / sixteenthDuration();
}

double TransportScheduler::sixteenthDuration() const {
    return engine::SecondsPerTick(bpm());
}

bool TransportScheduler::toggleLoop() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.loopEnabled = !state_.loopEnabled;
    return state_.loopEnabled;
}

void TransportScheduler::setLoop(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.loopEnabled = enabled;
}

bool TransportScheduler::toggleMetronome() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.metronomeEnabled = !state_.metronomeEnabled;
    return state_.metronomeEnabled;
}

void TransportScheduler::setMetronome(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.metronomeEnabled = enabled;
}

bool TransportScheduler::toggleRecord() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.recordEnabled = !state_.recordEnabled;
    return state_.recordEnabled;
}

void TransportScheduler::setRecord(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.recordEnabled = enabled;
}

bool TransportScheduler::recordNote(int pitch, int durationTicks) {
    engine::NoteEvent note;
    RecordCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!isRecordingUnlocked()) {
            return false;
        }
        note.pitch = pitch;
        note.startTick = static_cast<int>(std::floor(state_.position));
        note.durationTicks = durationTicks;
        note.velocity = kRecordVelocity;
        if (!sequence_.addNote(note)) {
            return false;
        }
        snapshotUnlocked();
        callback = onRecord_;
    }
    if (callback) {
        callback(note);
    }
    return true;
}

TransportState TransportScheduler::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

PlayState TransportScheduler::playState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return playStateUnlocked();
}

PlayState TransportScheduler::playStateUnlocked() const {
    if (!state_.isPlaying) {
        return PlayState::Stopped;
    }
    return state_.isPaused ? PlayState::Paused : PlayState::Playing;
}

int TransportScheduler::position() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(std::floor(state_.position));
}

bool TransportScheduler::isPlaying() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.isPlaying && !state_.isPaused;
}

bool TransportScheduler::isRecording() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return isRecordingUnlocked();
}

bool TransportScheduler::isRecordingUnlocked() const {
    return state_.recordEnabled && state_.isPlaying && !state_.isPaused;
}

double TransportScheduler::nextScheduleTime() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nextScheduleTime_;
}

int TransportScheduler::lastScheduledTick() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastScheduledTick_;
}

std::size_t TransportScheduler::driftCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return driftCount_;
}

EngineError TransportScheduler::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

bool TransportScheduler::pollPosition(int& position) {
    std::lock_guard<std::mutex> lock(reportMutex_);
    if (polledSerial_ == reportSerial_) {
        return false;
    }
    polledSerial_ = reportSerial_;
    position = reportedPosition_;
    return true;
}

void TransportScheduler::setPositionCallback(PositionCallback callback) {
    std::lock_guard<std::mutex> lock(reportMutex_);
    onPosition_ = std::move(callback);
}

void TransportScheduler::setPlayStateCallback(PlayStateCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    onPlayState_ = std::move(callback);
}

void TransportScheduler::setRecordCallback(RecordCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    onRecord_ = std::move(callback);
}

void TransportScheduler::fire(const Notifications& notifications) {
    if (notifications.position) {
        publishPosition(*notifications.position);
    }
    if (notifications.playStates.empty()) {
        return;
    }
    PlayStateCallback onPlayState;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        onPlayState = onPlayState_;
    }
    if (onPlayState) {
        for (PlayState state : notifications.playStates) {
            onPlayState(state);
        }
    }
}

void TransportScheduler::publishPosition(int position) {
    {
        std::lock_guard<std::mutex> lock(reportMutex_);
        reportedPosition_ = position;
        ++reportSerial_;
    }
    reportCv_.notify_one();
}

void TransportScheduler::reportLoop() {
    std::uint64_t delivered = 0;
    std::unique_lock<std::mutex> lock(reportMutex_);
    while (true) {
        reportCv_.wait(lock, [this, &delivered] {
            return reportShutdown_ || reportSerial_ != delivered;
        });
        if (reportShutdown_) {
            return;
        }
        delivered = reportSerial_;
        const int position = reportedPosition_;
        PositionCallback callback = onPosition_;
        lock.unlock();
        if (callback) {
            callback(position);
        }
        lock.lock();
    }
}

}  // namespace transport
