#include "engine/EngineParams.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace engine {

namespace {

std::string NormalizeName(std::string_view value) {
    std::string lowered;
    lowered.reserve(value.size());
    for (char ch : value) {
        if (ch == '-' || ch == '_') {
            continue;
        }
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return lowered;
}

float Clamped(ParamId id, float value) {
    if (const auto* info = GetParamInfo(id)) {
        return ClampToRange(*info, value);
    }
    return value;
}

}  // namespace

const std::vector<ParamInfo>& GetParamInfoList() {
    static const std::vector<ParamInfo> kParams = {
        {ParamId::ReverbEnabled, "reverbEnabled", ParamType::Bool, 0.0f, 1.0f, 0.0f},
        {ParamId::ReverbMix, "reverbMix", ParamType::Float, 0.0f, 1.0f, 0.3f},
        {ParamId::DelayEnabled, "delayEnabled", ParamType::Bool, 0.0f, 1.0f, 0.0f},
        // DelayNode max delay time.
        {ParamId::DelayTime, "delayTime", ParamType::Float, 0.01f, 2.0f, 0.3f},
        {ParamId::DelayFeedback, "delayFeedback", ParamType::Float, 0.0f, 0.95f, 0.4f},
        {ParamId::DelayMix, "delayMix", ParamType::Float, 0.0f, 1.0f, 0.25f},
        {ParamId::MasterVolume, "masterVolume", ParamType::Float, 0.0f, 1.0f, 0.7f},
    };
    return kParams;
}

const ParamInfo* GetParamInfo(ParamId id) {
    const auto& params = GetParamInfoList();
    auto it = std::find_if(params.begin(), params.end(),
                           [id](const ParamInfo& info) { return info.id == id; });
    if (it == params.end()) {
        return nullptr;
    }
    return &(*it);
}

const ParamInfo* FindParamByName(std::string_view name) {
    const auto wanted = NormalizeName(name);
    const auto& params = GetParamInfoList();
    auto it = std::find_if(params.begin(), params.end(),
                           [&wanted](const ParamInfo& info) {
                               return wanted == NormalizeName(info.name);
                           });
    if (it == params.end()) {
        return nullptr;
    }
    return &(*it);
}

float ClampToRange(const ParamInfo& info, float value) {
    return std::max(info.minValue, std::min(info.maxValue, value));
}

float DefaultParamValue(ParamId id) {
    const auto* info = GetParamInfo(id);
    return info ? info->defaultValue : 0.0f;
}

EffectSettings MergeEffectPatch(const EffectSettings& current,
                                EffectKind kind,
                                const EffectPatch& patch) {
    EffectSettings merged = current;
    switch (kind) {
        case EffectKind::Reverb:
            if (patch.enabled) {
                merged.reverb.enabled = *patch.enabled;
            }
            if (patch.mix) {
                merged.reverb.mix = Clamped(ParamId::ReverbMix, *patch.mix);
            }
            break;
        case EffectKind::Delay:
            if (patch.enabled) {
                merged.delay.enabled = *patch.enabled;
            }
            if (patch.mix) {
                merged.delay.mix = Clamped(ParamId::DelayMix, *patch.mix);
            }
            if (patch.timeSec) {
                merged.delay.timeSec = Clamped(ParamId::DelayTime, *patch.timeSec);
            }
            if (patch.feedback) {
                merged.delay.feedback = Clamped(ParamId::DelayFeedback, *patch.feedback);
            }
            break;
    }
    return merged;
}

EffectSettings ClampEffectSettings(const EffectSettings& settings) {
    EffectSettings clamped = settings;
    clamped.reverb.mix = Clamped(ParamId::ReverbMix, settings.reverb.mix);
    clamped.delay.mix = Clamped(ParamId::DelayMix, settings.delay.mix);
    clamped.delay.timeSec = Clamped(ParamId::DelayTime, settings.delay.timeSec);
    clamped.delay.feedback = Clamped(ParamId::DelayFeedback, settings.delay.feedback);
    return clamped;
}

std::optional<float> GetEffectParam(const EffectSettings& settings, ParamId id) {
    switch (id) {
        case ParamId::ReverbEnabled:
            return settings.reverb.enabled ? 1.0f : 0.0f;
        case ParamId::ReverbMix:
            return settings.reverb.mix;
        case ParamId::DelayEnabled:
            return settings.delay.enabled ? 1.0f : 0.0f;
        case ParamId::DelayTime:
            return settings.delay.timeSec;
        case ParamId::DelayFeedback:
            return settings.delay.feedback;
        case ParamId::DelayMix:
            return settings.delay.mix;
        case ParamId::MasterVolume:
            return std::nullopt;
    }
    return std::nullopt;
}

bool SetEffectParam(EffectSettings& settings, ParamId id, float value) {
    EffectPatch patch;
    EffectKind kind = EffectKind::Reverb;
    switch (id) {
        case ParamId::ReverbEnabled:
            patch.enabled = value >= 0.5f;
            break;
        case ParamId::ReverbMix:
            patch.mix = value;
            break;
        case ParamId::DelayEnabled:
            kind = EffectKind::Delay;
            patch.enabled = value >= 0.5f;
            break;
        case ParamId::DelayTime:
            kind = EffectKind::Delay;
            patch.timeSec = value;
            break;
        case ParamId::DelayFeedback:
            kind = EffectKind::Delay;
            patch.feedback = value;
            break;
        case ParamId::DelayMix:
            kind = EffectKind::Delay;
            patch.mix = value;
            break;
        case ParamId::MasterVolume:
            return false;
    }
    settings = MergeEffectPatch(settings, kind, patch);
    return true;
}

float ReverbWetGain(const EffectSettings& settings) {
    return settings.reverb.enabled ? settings.reverb.mix : 0.0f;
}

float DelayWetGain(const EffectSettings& settings) {
    return settings.delay.enabled ? settings.delay.mix : 0.0f;
}

}  // namespace engine
