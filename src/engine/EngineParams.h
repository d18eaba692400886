#pragma once

#include <optional>
#include <string_view>
#include <vector>

namespace engine {

enum class ParamId {
    ReverbEnabled,
    ReverbMix,
    DelayEnabled,
    DelayTime,
    DelayFeedback,
    DelayMix,
    MasterVolume,
};

enum class ParamType { Float, Bool };

struct ParamInfo {
    ParamId id;
    const char* name;
    ParamType type;
    float minValue;
    float maxValue;
    float defaultValue;
};

const std::vector<ParamInfo>& GetParamInfoList();
const ParamInfo* GetParamInfo(ParamId id);
// Case-insensitive; '-' and '_' are ignored so "reverb-mix" finds "reverbMix".
const ParamInfo* FindParamByName(std::string_view name);
float ClampToRange(const ParamInfo& info, float value);
float DefaultParamValue(ParamId id);

struct ReverbSettings {
    bool enabled = false;
    float mix = 0.3f;
};

struct DelaySettings {
    bool enabled = false;
    float mix = 0.25f;
    float timeSec = 0.3f;
    float feedback = 0.4f;
};

struct EffectSettings {
    ReverbSettings reverb;
    DelaySettings delay;
};

enum class EffectKind { Reverb, Delay };

// Partial update; unset fields keep their current value.
// timeSec and feedback only apply to the delay.
struct EffectPatch {
    std::optional<bool> enabled;
    std::optional<float> mix;
    std::optional<float> timeSec;
    std::optional<float> feedback;
};

EffectSettings MergeEffectPatch(const EffectSettings& current,
                                EffectKind kind,
                                const EffectPatch& patch);

// Every field clamped against the parameter table.
EffectSettings ClampEffectSettings(const EffectSettings& settings);

// Reads or writes one table parameter on a settings struct. MasterVolume is
// not part of EffectSettings and is rejected.
std::optional<float> GetEffectParam(const EffectSettings& settings, ParamId id);
bool SetEffectParam(EffectSettings& settings, ParamId id, float value);

float ReverbWetGain(const EffectSettings& settings);
float DelayWetGain(const EffectSettings& settings);

}  // namespace engine
