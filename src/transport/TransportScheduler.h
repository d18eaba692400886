#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "engine/EngineTypes.h"
#include "transport/AudioClock.h"
#include "transport/DispatchTarget.h"
#include "transport/SchedulerTimer.h"
#include "transport/SequenceProvider.h"

namespace transport {

enum class PlayState { Stopped, Playing, Paused };

const char* ToString(PlayState state);

struct TransportState {
    bool isPlaying = false;
    bool isPaused = false;
    double position = 0.0;  // ticks
    double bpm = 120.0;
    bool loopEnabled = true;
    bool metronomeEnabled = false;
    bool recordEnabled = false;
};

// Lookahead scheduler. A wall-clock timer polls tick(); each tick queues every
// tick whose onset falls within the lookahead window of the audio clock.
// Onset times advance from nextScheduleTime only, so poll jitter changes how
// far ahead sounds are queued but never when they play.
class TransportScheduler {
public:
    static constexpr double kLookaheadSec = 0.1;
    static constexpr double kPollIntervalSec = 0.1;
    static constexpr double kPositionReportIntervalSec = 0.05;
    static constexpr double kDriftEpsilonSec = 0.005;
    static constexpr double kMinBpm = 20.0;
    static constexpr double kMaxBpm = 300.0;
    static constexpr double kDefaultBpm = 120.0;
    static constexpr int kDefaultRecordDurationTicks = 4;
    static constexpr float kRecordVelocity = 0.8f;

    using PositionCallback = std::function<void(int position)>;
    using PlayStateCallback = std::function<void(PlayState state)>;
    using RecordCallback = std::function<void(const engine::NoteEvent& note)>;

    TransportScheduler(AudioClock& clock,
                       SchedulerTimer& timer,
                       SequenceProvider& sequence,
                       DispatchTarget& target);
    ~TransportScheduler();

    TransportScheduler(const TransportScheduler&) = delete;
    TransportScheduler& operator=(const TransportScheduler&) = delete;

    // Returns false and sets lastError() to AudioContextUnavailable when the
    // audio clock cannot be resumed.
    bool play();
    void pause();
    void stop();

    // One scheduling pass. Safe to call any number of times.
    void tick();

    void setBPM(double bpm);
    double bpm() const;
    double positionToSeconds(double position) const;
    double secondsToPosition(double seconds) const;
    double sixteenthDuration() const;

    bool toggleLoop();
    void setLoop(bool enabled);
    bool toggleMetronome();
    void setMetronome(bool enabled);
    bool toggleRecord();
    void setRecord(bool enabled);

    // Inserts a note at floor(position) while recording. Returns true when the
    // sequence accepted it.
    bool recordNote(int pitch, int durationTicks = kDefaultRecordDurationTicks);

    TransportState state() const;
    PlayState playState() const;
    int position() const;
    bool isPlaying() const;
    bool isRecording() const;

    double nextScheduleTime() const;
    int lastScheduledTick() const;
    std::size_t driftCount() const;
    engine::EngineError lastError() const;

    // Latest reported position, if one was published since the previous call.
    bool pollPosition(int& position);

    // Runs on the scheduler's reporter thread with the newest position only;
    // intermediate reports are dropped while the callback is busy.
    void setPositionCallback(PositionCallback callback);
    void setPlayStateCallback(PlayStateCallback callback);
    void setRecordCallback(RecordCallback callback);

private:
    // Callbacks collected under the lock and fired after it is released.
    struct Notifications {
        std::vector<PlayState> playStates;
        std::optional<int> position;
    };

    void snapshotUnlocked();
    void stopUnlocked(Notifications& notifications);
    void endOfArrangementUnlocked(Notifications& notifications);
    void dispatchTickUnlocked(int tick, const engine::ArrangementConfig& config);
    bool isRecordingUnlocked() const;
    PlayState playStateUnlocked() const;
    void fire(const Notifications& notifications);
    void publishPosition(int position);
    void reportLoop();

    AudioClock& clock_;
    SchedulerTimer& timer_;
    SequenceProvider& sequence_;
    DispatchTarget& target_;

    mutable std::mutex mutex_;
    TransportState state_;
    double nextScheduleTime_ = 0.0;
    int lastScheduledTick_ = -1;
    std::vector<engine::NoteEvent> scheduledNotes_;
    std::vector<engine::DrumHit> scheduledDrums_;
    double lastPositionReport_ = -1.0e9;
    std::size_t driftCount_ = 0;
    engine::EngineError lastError_ = engine::EngineError::None;

    PlayStateCallback onPlayState_;
    RecordCallback onRecord_;

    // Position hand-off to the reporter thread, guarded by reportMutex_.
    std::mutex reportMutex_;
    std::condition_variable reportCv_;
    int reportedPosition_ = 0;
    std::uint64_t reportSerial_ = 0;
    std::uint64_t polledSerial_ = 0;
    bool reportShutdown_ = false;
    PositionCallback onPosition_;
    std::thread reporter_;
};

}  // namespace transport
