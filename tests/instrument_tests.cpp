#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>

#include "engine/EngineTypes.h"
#include "engine/InstrumentRegistry.h"
#include "engine/Pitch.h"

TEST_CASE("MIDI 音高换算频率", "[engine][pitch]") {
    REQUIRE(engine::MidiNoteToFrequency(69) == 440.0);
    REQUIRE(engine::MidiNoteToFrequency(81) == Catch::Approx(880.0));
    REQUIRE(engine::MidiNoteToFrequency(60) == Catch::Approx(261.6256).epsilon(1e-6));
    for (int pitch = 0; pitch < 127; ++pitch) {
        REQUIRE(engine::MidiNoteToFrequency(pitch + 1) > engine::MidiNoteToFrequency(pitch));
    }
    REQUIRE(engine::DetuneRatio(1200.0) == Catch::Approx(2.0));
    REQUIRE(engine::DetuneRatio(0.0) == Catch::Approx(1.0));
}

TEST_CASE("音名与 MIDI 编号互相转换", "[engine][pitch]") {
    REQUIRE(engine::MidiToNoteName(60) == "C4");
    REQUIRE(engine::MidiToNoteName(61) == "C#4");
    REQUIRE(engine::MidiToNoteName(21) == "A0");
    REQUIRE(engine::MidiToNoteName(108) == "C8");

    REQUIRE(engine::NoteNameToMidi("C4") == 60);
    REQUIRE(engine::NoteNameToMidi("F#3") == 54);
    REQUIRE(engine::NoteNameToMidi("Bb2") == 46);
    REQUIRE(engine::NoteNameToMidi("A4") == 69);

    REQUIRE(engine::NoteNameToMidi("") == 60);
    REQUIRE(engine::NoteNameToMidi("H2") == 60);
    REQUIRE(engine::NoteNameToMidi("C#") == 60);
    REQUIRE(engine::NoteNameToMidi("Cx4") == 60);
}

TEST_CASE("乐器注册表包含内置乐器并回退到钢琴", "[engine][registry]") {
    const engine::InstrumentRegistry registry;
    const auto ids = registry.ids();
    for (const char* id : {"piano", "pluck", "saw", "pad", "bass", "bell", "fuzz"}) {
        INFO(id);
        REQUIRE(registry.contains(id));
        REQUIRE(std::find(ids.begin(), ids.end(), id) != ids.end());
    }
    REQUIRE(registry.size() == ids.size());

    REQUIRE_FALSE(registry.contains("theremin"));
    REQUIRE(registry.find("theremin").id == "piano");
    REQUIRE(registry.defaultInstrument().id == "piano");

    const auto& piano = registry.find("piano");
    REQUIRE(piano.oscillators.size() == 2);
    REQUIRE(piano.envelope.attackSec == Catch::Approx(0.005));
    REQUIRE(piano.envelope.sustainLevel == Catch::Approx(0.4f));
    REQUIRE_FALSE(piano.filter.has_value());

    const auto& fuzz = registry.find("fuzz");
    REQUIRE(fuzz.distortion);
    REQUIRE(fuzz.filter.has_value());

    const auto distorted = std::count_if(
        engine::BuiltInInstruments().begin(), engine::BuiltInInstruments().end(),
        [](const engine::InstrumentDefinition& def) { return def.distortion; });
    REQUIRE(distorted == 1);
}

TEST_CASE("内置乐器定义有效", "[engine][registry]") {
    for (const auto& def : engine::BuiltInInstruments()) {
        INFO(def.id);
        REQUIRE_FALSE(def.oscillators.empty());
        REQUIRE(def.envelope.sustainLevel >= 0.0f);
        REQUIRE(def.envelope.sustainLevel <= 1.0f);
        REQUIRE(def.envelope.releaseSec > 0.0);
        float gain = 0.0f;
        for (const auto& osc : def.oscillators) {
            gain += osc.relativeGain;
        }
        REQUIRE(gain <= 1.0f + 1e-6f);
    }
}

TEST_CASE("自定义注册表的默认乐器", "[engine][registry]") {
    engine::InstrumentDefinition organ;
    organ.id = "organ";
    organ.name = "Organ";
    organ.oscillators.push_back({});
    engine::InstrumentRegistry registry({organ}, "organ");
    REQUIRE(registry.find("piano").id == "organ");

    engine::InstrumentRegistry fallback({}, "organ");
    REQUIRE(fallback.defaultInstrument().id == "piano");
}

TEST_CASE("节拍与鼓类型辅助函数", "[engine][types]") {
    REQUIRE(engine::SecondsPerTick(120.0) == Catch::Approx(0.125));
    REQUIRE(engine::SecondsPerTick(0.0) == Catch::Approx(0.0));

    const engine::ArrangementConfig config;
    REQUIRE(config.totalTicks() == 128);
    REQUIRE(config.ticksPerBar() == 16);

    REQUIRE(engine::DrumTypeFromId("hihat") == engine::DrumType::HiHat);
    REQUIRE_FALSE(engine::DrumTypeFromId("cowbell").has_value());
    REQUIRE(std::string(engine::ToString(engine::DrumType::Clap)) == "clap");
    REQUIRE(std::string(engine::ToString(engine::EngineError::SchedulingDrift)) == "SchedulingDrift");
}
