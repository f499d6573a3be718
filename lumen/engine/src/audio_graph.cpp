/**
 * @file audio_graph.cpp
 * @brief Track buses, clip sources and block rendering
 */

#include <lumen/engine/audio_graph.hpp>

#include <lumen/core/logger.hpp>

#include <algorithm>
#include <cmath>
#include <numbers>

namespace lumen::engine {

// ============================================================================
// Schedules
// ============================================================================

double evaluateAutomation(const std::vector<model::AutomationPoint>& points,
                          Timestamp localTime, double fallback) {
    if (points.empty()) {
        return fallback;
    }
    if (localTime <= points.front().time) {
        return points.front().value;
    }
    if (localTime >= points.back().time) {
        return points.back().value;
    }

    auto next = std::upper_bound(points.begin(), points.end(), localTime,
        [](Timestamp t, const model::AutomationPoint& p) { return t < p.time; });
    const auto& b = *next;
    const auto& a = *std::prev(next);
    double span = static_cast<double>(b.time - a.time);
    if (span <= 0.0) {
        return b.value;
    }
    double u = static_cast<double>(localTime - a.time) / span;
    return a.value + (b.value - a.value) * u;
}

double AudioClipSchedule::gainAt(Timestamp t) const {
    const Timestamp local = t - clipStart;
    return volume * evaluateAutomation(volumeAutomation, local, 1.0)
         * model::fadeFactor(fade, local, clipDuration);
}

double AudioClipSchedule::panAt(Timestamp t) const {
    return std::clamp(evaluateAutomation(panAutomation, t - clipStart, pan), -1.0, 1.0);
}

bool sameEffects(const std::vector<model::Effect>& a, const std::vector<model::Effect>& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i].id != b[i].id || a[i].type != b[i].type || a[i].enabled != b[i].enabled
            || a[i].params != b[i].params) {
            return false;
        }
    }
    return true;
}

namespace {

bool samePoints(const std::vector<model::AutomationPoint>& a, const std::vector<model::AutomationPoint>& b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                      [](const auto& x, const auto& y) { return x.time == y.time && x.value == y.value; });
}

} // namespace

bool samePlayback(const AudioClipSchedule& a, const AudioClipSchedule& b) {
    constexpr double kMappingTolerance = 1000.0;   // us

    if (a.clipId != b.clipId || a.trackId != b.trackId || a.buffer != b.buffer) {
        return false;
    }
    if (a.endTime != b.endTime || a.rate != b.rate || a.volume != b.volume || a.pan != b.pan
        || a.clipStart != b.clipStart || a.clipDuration != b.clipDuration
        || a.fade.fadeIn != b.fade.fadeIn || a.fade.fadeOut != b.fade.fadeOut) {
        return false;
    }
    if (!samePoints(a.volumeAutomation, b.volumeAutomation) || !samePoints(a.panAutomation, b.panAutomation)
        || !sameEffects(a.effects, b.effects)) {
        return false;
    }

    const Timestamp at = std::max(a.startTime, b.startTime);
    auto mediaAt = [at](const AudioClipSchedule& s) {
        return static_cast<double>(s.mediaOffset) + static_cast<double>(at - s.startTime) * s.rate;
    };
    return std::abs(mediaAt(a) - mediaAt(b)) <= kMappingTolerance;
}

void panStereoFrame(float& left, float& right, double pan) {
    pan = std::clamp(pan, -1.0, 1.0);
    const float l = left;
    const float r = right;

    if (pan <= 0.0) {
        double x = (pan + 1.0) * std::numbers::pi / 2.0;
        left = l + r * static_cast<float>(std::cos(x));
        right = r * static_cast<float>(std::sin(x));
    } else {
        double x = pan * std::numbers::pi / 2.0;
        left = l * static_cast<float>(std::cos(x));
        right = r + l * static_cast<float>(std::sin(x));
    }
}

// ============================================================================
// AudioGraph
// ============================================================================

AudioGraph::AudioGraph(int sampleRate, int channels)
    : m_sampleRate(sampleRate > 0 ? sampleRate : 48000)
    , m_channels(channels > 0 ? channels : 2)
    , m_busScratch(kMaxBlockFrames * static_cast<size_t>(m_channels), 0.0f) {}

AudioGraph::~AudioGraph() = default;

AudioGraph::Bus& AudioGraph::ensureBus(const std::string& trackId) {
    auto it = m_buses.find(trackId);
    if (it == m_buses.end()) {
        Bus bus;
        bus.config.trackId = trackId;
        it = m_buses.emplace(trackId, std::move(bus)).first;
        LUMEN_LOG_DEBUG("Audio bus created for track {}", trackId);
    }
    return it->second;
}

void AudioGraph::configureTrack(const TrackBusConfig& config) {
    std::lock_guard lock(m_mutex);
    Bus& bus = ensureBus(config.trackId);
    bus.config = config;
    bus.config.volume = std::clamp(config.volume, 0.0, kMaxVolume);
    bus.config.pan = std::clamp(config.pan, -1.0, 1.0);
    updateSoloState();
}

void AudioGraph::removeTrack(const std::string& trackId) {
    std::lock_guard lock(m_mutex);
    m_buses.erase(trackId);
    updateSoloState();
}

void AudioGraph::updateTrackVolume(const std::string& trackId, double volume) {
    std::lock_guard lock(m_mutex);
    auto it = m_buses.find(trackId);
    if (it != m_buses.end()) {
        it->second.config.volume = std::clamp(volume, 0.0, kMaxVolume);
    }
}

void AudioGraph::updateTrackPan(const std::string& trackId, double pan) {
    std::lock_guard lock(m_mutex);
    auto it = m_buses.find(trackId);
    if (it != m_buses.end()) {
        it->second.config.pan = std::clamp(pan, -1.0, 1.0);
    }
}

void AudioGraph::setTrackMuted(const std::string& trackId, bool muted) {
    std::lock_guard lock(m_mutex);
    auto it = m_buses.find(trackId);
    if (it != m_buses.end()) {
        it->second.config.muted = muted;
    }
}

void AudioGraph::setTrackSolo(const std::string& trackId, bool solo) {
    std::lock_guard lock(m_mutex);
    auto it = m_buses.find(trackId);
    if (it != m_buses.end()) {
        it->second.config.solo = solo;
        updateSoloState();
    }
}

void AudioGraph::updateTrackEffects(const std::string& trackId,
                                    const std::vector<model::Effect>& effects) {
    std::lock_guard lock(m_mutex);
    auto it = m_buses.find(trackId);
    if (it == m_buses.end() || sameEffects(it->second.effects, effects)) {
        return;
    }
    it->second.effects = effects;
    it->second.chain = EffectChain(effects, m_sampleRate, m_channels);
}

bool AudioGraph::hasTrack(const std::string& trackId) const {
    std::lock_guard lock(m_mutex);
    return m_buses.count(trackId) > 0;
}

std::vector<std::string> AudioGraph::trackEffectTypes(const std::string& trackId) const {
    std::lock_guard lock(m_mutex);
    auto it = m_buses.find(trackId);
    return it != m_buses.end() ? it->second.chain.types() : std::vector<std::string>{};
}

bool AudioGraph::isTrackAudible(const std::string& trackId) const {
    std::lock_guard lock(m_mutex);
    auto it = m_buses.find(trackId);
    return it != m_buses.end() && audible(it->second);
}

bool AudioGraph::audible(const Bus& bus) const {
    if (bus.config.muted) {
        return false;
    }
    return !m_hasSolo || bus.config.solo;
}

void AudioGraph::updateSoloState() {
    m_hasSolo = std::any_of(m_buses.begin(), m_buses.end(),
                            [](const auto& entry) { return entry.second.config.solo; });
}

void AudioGraph::setMasterVolume(double volume) {
    m_masterVolume.store(std::clamp(volume, 0.0, kMaxVolume));
}

// ========== Clips ==========

void AudioGraph::scheduleClip(AudioClipSchedule schedule) {
    if (!schedule.buffer || schedule.endTime <= schedule.startTime) {
        return;
    }

    std::lock_guard lock(m_mutex);
    Bus& bus = ensureBus(schedule.trackId);

    if (!sameEffects(bus.effects, schedule.effects)) {
        bus.effects = schedule.effects;
        bus.chain = EffectChain(schedule.effects, m_sampleRate, m_channels);
    }

    auto& sources = bus.sources;
    sources.erase(std::remove_if(sources.begin(), sources.end(),
                                 [&](const Source& s) {
                                     return s.finished || s.schedule->clipId == schedule.clipId;
                                 }),
                  sources.end());

    LUMEN_LOG_TRACE("Audio clip {} scheduled on {} at {}us (offset {}us, rate {})",
                    schedule.clipId, schedule.trackId, schedule.startTime,
                    schedule.mediaOffset, schedule.rate);
    sources.push_back({std::make_shared<AudioClipSchedule>(std::move(schedule)), false});
}

void AudioGraph::scheduleClips(std::vector<AudioClipSchedule> schedules) {
    for (auto& s : schedules) {
        scheduleClip(std::move(s));
    }
}

void AudioGraph::stopClip(const std::string& clipId) {
    std::lock_guard lock(m_mutex);
    for (auto& [id, bus] : m_buses) {
        auto& sources = bus.sources;
        sources.erase(std::remove_if(sources.begin(), sources.end(),
                                     [&](const Source& s) { return s.finished || s.schedule->clipId == clipId; }),
                      sources.end());
    }
}

void AudioGraph::stopAllClips() {
    std::lock_guard lock(m_mutex);
    for (auto& [id, bus] : m_buses) {
        bus.sources.clear();
        bus.chain.reset();
    }
}

bool AudioGraph::isClipScheduled(const std::string& clipId) const {
    return scheduledClip(clipId).has_value();
}

std::optional<AudioClipSchedule> AudioGraph::scheduledClip(const std::string& clipId) const {
    std::lock_guard lock(m_mutex);
    for (const auto& [id, bus] : m_buses) {
        for (const auto& s : bus.sources) {
            if (!s.finished && s.schedule->clipId == clipId) {
                return *s.schedule;
            }
        }
    }
    return std::nullopt;
}

size_t AudioGraph::scheduledCount() const {
    std::lock_guard lock(m_mutex);
    size_t n = 0;
    for (const auto& [id, bus] : m_buses) {
        n += static_cast<size_t>(std::count_if(bus.sources.begin(), bus.sources.end(),
                                               [](const Source& s) { return !s.finished; }));
    }
    return n;
}

void AudioGraph::collectFinished() {
    std::lock_guard lock(m_mutex);
    for (auto& [id, bus] : m_buses) {
        eraseFinished(bus);
    }
}

void AudioGraph::eraseFinished(Bus& bus) {
    auto& sources = bus.sources;
    sources.erase(std::remove_if(sources.begin(), sources.end(), [](const Source& s) { return s.finished; }),
                  sources.end());
}

// ========== Rendering ==========

void AudioGraph::mixSource(const AudioClipSchedule& source, float* bus, size_t frames,
                           Timestamp timelineStart, double timePerFrame) const {
    const media::AudioBuffer& buffer = *source.buffer;
    if (buffer.channels <= 0 || buffer.sampleRate <= 0) {
        return;
    }
    const double framesPerUs = static_cast<double>(buffer.sampleRate) / kTimeBaseUs;
    const bool stereo = m_channels == 2;

    for (size_t f = 0; f < frames; ++f) {
        auto t = timelineStart + static_cast<Timestamp>(std::llround(timePerFrame * static_cast<double>(f)));
        if (t < source.startTime || t >= source.endTime) {
            continue;
        }

        double mediaUs = static_cast<double>(source.mediaOffset)
                       + static_cast<double>(t - source.startTime) * source.rate;
        double pos = mediaUs * framesPerUs;
        if (pos < 0.0) {
            continue;
        }
        auto i0 = static_cast<int64_t>(std::floor(pos));
        auto frac = static_cast<float>(pos - static_cast<double>(i0));
        auto gain = static_cast<float>(source.gainAt(t));

        float* out = bus + f * static_cast<size_t>(m_channels);
        auto sampleAt = [&](int c) {
            int src = std::min(c, buffer.channels - 1);
            float s0 = buffer.sample(i0, src);
            float s1 = buffer.sample(i0 + 1, src);
            return (s0 + (s1 - s0) * frac) * gain;
        };

        if (stereo) {
            float l = sampleAt(0);
            float r = sampleAt(1);
            if (source.pan != 0.0 || !source.panAutomation.empty()) {
                panStereoFrame(l, r, source.panAt(t));
            }
            out[0] += l;
            out[1] += r;
        } else {
            for (int c = 0; c < m_channels; ++c) {
                out[c] += sampleAt(c);
            }
        }
    }
}

void AudioGraph::render(float* out, size_t frames, Timestamp timelineStart, double timelineRate) {
    const size_t total = frames * static_cast<size_t>(m_channels);
    std::fill(out, out + total, 0.0f);

    std::unique_lock lock(m_mutex, std::try_to_lock);
    if (!lock.owns_lock()) {
        m_contended.fetch_add(1);
        return;
    }

    const double timePerFrame = static_cast<double>(kTimeBaseUs) * timelineRate / m_sampleRate;
    for (size_t done = 0; done < frames; done += kMaxBlockFrames) {
        const size_t block = std::min(kMaxBlockFrames, frames - done);
        const auto start = timelineStart + static_cast<Timestamp>(std::llround(timePerFrame * static_cast<double>(done)));
        renderBlock(out + done * static_cast<size_t>(m_channels), block, start, timePerFrame);
    }

    const float master = m_muted.load() ? 0.0f : static_cast<float>(m_masterVolume.load());
    if (master != 1.0f) {
        for (size_t i = 0; i < total; ++i) {
            out[i] *= master;
        }
    }
}

void AudioGraph::renderBlock(float* out, size_t frames, Timestamp timelineStart, double timePerFrame) {
    const size_t total = frames * static_cast<size_t>(m_channels);
    const auto blockEnd = timelineStart + static_cast<Timestamp>(std::llround(timePerFrame * static_cast<double>(frames)));
    const bool stereo = m_channels == 2;

    for (auto& [id, bus] : m_buses) {
        bool live = false;
        for (const auto& source : bus.sources) {
            live = live || !source.finished;
        }
        if (!live) {
            continue;
        }

        float* scratch = m_busScratch.data();
        std::fill(scratch, scratch + total, 0.0f);
        for (const auto& source : bus.sources) {
            if (!source.finished) {
                mixSource(*source.schedule, scratch, frames, timelineStart, timePerFrame);
            }
        }

        bus.chain.process(scratch, frames, m_channels);

        const float gain = audible(bus) ? static_cast<float>(bus.config.volume) : 0.0f;
        for (size_t f = 0; f < frames; ++f) {
            float* in = scratch + f * static_cast<size_t>(m_channels);
            float* dst = out + f * static_cast<size_t>(m_channels);
            if (stereo) {
                float l = in[0] * gain;
                float r = in[1] * gain;
                panStereoFrame(l, r, bus.config.pan);
                dst[0] += l;
                dst[1] += r;
            } else {
                for (int c = 0; c < m_channels; ++c) {
                    dst[c] += in[c] * gain;
                }
            }
        }

        for (auto& source : bus.sources) {
            if (source.schedule->endTime <= blockEnd) {
                source.finished = true;
            }
        }
    }
}

} // namespace lumen::engine
