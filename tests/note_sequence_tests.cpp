#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "transport/NoteSequence.h"

using engine::DrumType;

TEST_CASE("插入音符校验音高与起点", "[sequence]") {
    transport::NoteSequence sequence;
    REQUIRE(sequence.config().totalTicks() == 128);
    REQUIRE(sequence.currentInstrument() == "piano");

    REQUIRE(sequence.insertNote(12, 0).has_value());
    REQUIRE(sequence.insertNote(108, 127).has_value());
    REQUIRE_FALSE(sequence.insertNote(11, 0).has_value());
    REQUIRE_FALSE(sequence.insertNote(109, 0).has_value());
    REQUIRE_FALSE(sequence.insertNote(60, -1).has_value());
    REQUIRE_FALSE(sequence.insertNote(60, 128).has_value());
    REQUIRE(sequence.noteCount() == 2);
}

TEST_CASE("时值被钳制到编排结尾，力度钳制到 [0, 1]", "[sequence]") {
    transport::NoteSequence sequence;
    const auto tail = sequence.insertNote(60, 126, 8, 1.5f);
    REQUIRE(tail);
    REQUIRE(tail->durationTicks == 2);
    REQUIRE(tail->velocity == Catch::Approx(1.0f));

    const auto tiny = sequence.insertNote(62, 10, 0, -0.2f);
    REQUIRE(tiny);
    REQUIRE(tiny->durationTicks == 1);
    REQUIRE(tiny->velocity == Catch::Approx(0.0f));

    const auto events = sequence.scheduledEvents();
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].pitch == 60);
    REQUIRE(events[1].pitch == 62);
}

TEST_CASE("删除与清空音符", "[sequence]") {
    transport::NoteSequence sequence;
    sequence.insertNote(60, 0);
    sequence.insertNote(64, 4);
    REQUIRE(sequence.removeNote(60, 0));
    REQUIRE_FALSE(sequence.removeNote(60, 0));
    REQUIRE(sequence.noteCount() == 1);
    sequence.clearNotes();
    REQUIRE(sequence.scheduledEvents().empty());
}

TEST_CASE("addNote 走同样的校验", "[sequence]") {
    transport::NoteSequence sequence;
    engine::NoteEvent note;
    note.pitch = 200;
    REQUIRE_FALSE(sequence.addNote(note));
    note.pitch = 67;
    note.startTick = 3;
    note.durationTicks = 4;
    REQUIRE(sequence.addNote(note));
    REQUIRE(sequence.scheduledEvents().front().startTick == 3);
}

TEST_CASE("鼓点步进越界被拒绝，切换返回新状态", "[sequence][drums]") {
    transport::DrumPattern pattern(16);
    REQUIRE(pattern.addHit(DrumType::Kick, 0));
    REQUIRE_FALSE(pattern.addHit(DrumType::Kick, 16));
    REQUIRE_FALSE(pattern.addHit(DrumType::Kick, -1));

    REQUIRE(pattern.toggleHit(DrumType::Snare, 4));
    REQUIRE(pattern.hasHit(DrumType::Snare, 4));
    REQUIRE_FALSE(pattern.toggleHit(DrumType::Snare, 4));
    REQUIRE_FALSE(pattern.hasHit(DrumType::Snare, 4));

    pattern.addHit(DrumType::HiHat, 2);
    pattern.clearLane(DrumType::HiHat);
    REQUIRE_FALSE(pattern.hasHit(DrumType::HiHat, 2));
}

TEST_CASE("静音与独奏决定可听的鼓轨", "[sequence][drums]") {
    transport::DrumPattern pattern(16);
    pattern.addHit(DrumType::Kick, 0);
    pattern.addHit(DrumType::Snare, 0);
    pattern.addHit(DrumType::HiHat, 0);

    REQUIRE(pattern.hitsAtStep(0).size() == 3);

    REQUIRE(pattern.toggleMute(DrumType::Kick));
    REQUIRE(pattern.hitsAtStep(0).size() == 2);

    REQUIRE(pattern.toggleSolo(DrumType::HiHat));
    REQUIRE(pattern.hasSoloedLane());
    auto hits = pattern.hitsAtStep(0);
    REQUIRE(hits.size() == 1);
    REQUIRE(hits.front().type == DrumType::HiHat);

    // Mute wins over solo.
    pattern.setMuted(DrumType::HiHat, true);
    REQUIRE(pattern.hitsAtStep(0).empty());

    pattern.setMuted(DrumType::HiHat, false);
    pattern.setSolo(DrumType::HiHat, false);
    pattern.setMuted(DrumType::Kick, false);
    REQUIRE(pattern.hitsAtStep(0).size() == 3);
}

TEST_CASE("可听鼓点按步进排序并带通道音量", "[sequence][drums]") {
    transport::DrumPattern pattern(16);
    pattern.addHit(DrumType::Clap, 2);
    pattern.addHit(DrumType::Kick, 8);
    pattern.addHit(DrumType::Kick, 0);
    pattern.addHit(DrumType::Snare, 2);
    pattern.setVolume(DrumType::Clap, 2.0f);
    pattern.setVolume(DrumType::Snare, 0.25f);

    const auto hits = pattern.audibleHits();
    REQUIRE(hits.size() == 4);
    REQUIRE(hits[0].step == 0);
    REQUIRE(hits[0].volume == Catch::Approx(0.8f));
    REQUIRE(hits[1].step == 2);
    REQUIRE(hits[1].type == DrumType::Snare);
    REQUIRE(hits[1].volume == Catch::Approx(0.25f));
    REQUIRE(hits[2].type == DrumType::Clap);
    REQUIRE(hits[2].volume == Catch::Approx(1.0f));
    REQUIRE(hits[3].step == 8);
}

TEST_CASE("修改编排长度会截断超出的鼓点", "[sequence][drums]") {
    transport::NoteSequence sequence;
    sequence.editDrums([](transport::DrumPattern& pattern) {
        pattern.addHit(DrumType::Kick, 0);
        pattern.addHit(DrumType::Kick, 20);
        pattern.addHit(DrumType::Snare, 100);
    });
    REQUIRE(sequence.scheduledDrumHits().size() == 3);

    engine::ArrangementConfig shorter;
    shorter.bars = 1;
    sequence.setConfig(shorter);
    REQUIRE(sequence.drums().totalSteps() == 16);
    const auto hits = sequence.scheduledDrumHits();
    REQUIRE(hits.size() == 1);
    REQUIRE(hits.front().step == 0);

    REQUIRE_FALSE(sequence.insertNote(60, 16).has_value());
}

TEST_CASE("切换当前乐器", "[sequence]") {
    transport::NoteSequence sequence({}, "pad");
    REQUIRE(sequence.currentInstrument() == "pad");
    sequence.setCurrentInstrument("bass");
    REQUIRE(sequence.currentInstrument() == "bass");
}
