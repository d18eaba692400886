#pragma once

#include <array>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "engine/EngineTypes.h"
#include "transport/SequenceProvider.h"

namespace transport {

struct DrumLaneState {
    bool muted = false;
    bool solo = false;
    float volume = 0.8f;
};

// Step grid for the four drum lanes with mute/solo/volume per lane.
class DrumPattern {
public:
    explicit DrumPattern(int totalSteps = engine::ArrangementConfig{}.totalTicks());

    bool addHit(engine::DrumType lane, int step);
    void removeHit(engine::DrumType lane, int step);
    bool toggleHit(engine::DrumType lane, int step);
    bool hasHit(engine::DrumType lane, int step) const;
    void clearLane(engine::DrumType lane);
    void clear();

    bool toggleMute(engine::DrumType lane);
    bool toggleSolo(engine::DrumType lane);
    void setMuted(engine::DrumType lane, bool muted);
    void setSolo(engine::DrumType lane, bool solo);
    void setVolume(engine::DrumType lane, float volume);  // clamped to [0, 1]
    const DrumLaneState& lane(engine::DrumType lane) const;
    bool hasSoloedLane() const;
    bool isAudible(engine::DrumType lane) const;

    // Audible hits only, volume taken from the lane.
    std::vector<engine::DrumHit> hitsAtStep(int step) const;
    std::vector<engine::DrumHit> audibleHits() const;

    int totalSteps() const { return totalSteps_; }
    // Drops hits past the new end.
    void setTotalSteps(int totalSteps);

private:
    static std::size_t index(engine::DrumType lane) { return static_cast<std::size_t>(lane); }

    int totalSteps_;
    std::array<std::set<int>, engine::kDrumTypeCount> steps_;
    std::array<DrumLaneState, engine::kDrumTypeCount> lanes_{};
};

// In-memory arrangement: pitched notes, a drum pattern and the selected
// instrument. All members are guarded by one mutex.
class NoteSequence : public SequenceProvider {
public:
    static constexpr int kMinPitch = 12;   // C0
    static constexpr int kMaxPitch = 108;  // C8

    explicit NoteSequence(engine::ArrangementConfig config = {},
                          std::string instrumentId = "piano");

    // Rejects pitches outside [12, 108] and starts outside the arrangement;
    // the duration is clamped to the arrangement end.
    std::optional<engine::NoteEvent> insertNote(int pitch,
                                                int startTick,
                                                int durationTicks = 4,
                                                float velocity = 0.8f);
    bool removeNote(int pitch, int startTick);
    void clearNotes();
    std::size_t noteCount() const;

    void setConfig(const engine::ArrangementConfig& config);
    void setCurrentInstrument(std::string instrumentId);

    DrumPattern drums() const;
    void editDrums(const std::function<void(DrumPattern&)>& edit);

    std::vector<engine::NoteEvent> scheduledEvents() const override;
    std::vector<engine::DrumHit> scheduledDrumHits() const override;
    engine::ArrangementConfig config() const override;
    std::string currentInstrument() const override;
    bool addNote(const engine::NoteEvent& note) override;

private:
    std::optional<engine::NoteEvent> insertNoteUnlocked(int pitch,
                                                        int startTick,
                                                        int durationTicks,
                                                        float velocity);

    mutable std::mutex mutex_;
    engine::ArrangementConfig config_;
    std::string instrumentId_;
    std::vector<engine::NoteEvent> notes_;
    DrumPattern drums_;
};

}  // namespace transport
