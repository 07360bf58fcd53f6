#include "OscillatorPipeline.h"

#include "SpectralTransform.h"

#include <cerrno>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <sstream>
#include <utility>

namespace phinet {

namespace {

static inline std::uint32_t fnv1a32_update(std::uint32_t h, const void* data, std::size_t len) {
    const std::uint8_t* p = reinterpret_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<std::uint32_t>(p[i]);
        h *= 16777619u;
    }
    return h;
}

static inline std::uint32_t fnv1a32_begin() { return 2166136261u; }

static inline std::uint32_t fnv1a32_add_i32(std::uint32_t h, std::int32_t v) {
    return fnv1a32_update(h, &v, sizeof(v));
}

static inline std::uint32_t fnv1a32_add_f64(std::uint32_t h, double v) {
    std::uint64_t bits = 0;
    static_assert(sizeof(bits) == sizeof(v), "unexpected double size");
    std::memcpy(&bits, &v, sizeof(v));
    return fnv1a32_update(h, &bits, sizeof(bits));
}

static std::uint32_t fnv1a32_add_values(std::uint32_t h, const std::vector<double>& values) {
    h = fnv1a32_add_i32(h, static_cast<std::int32_t>(values.size()));
    for (double v : values) {
        h = fnv1a32_add_f64(h, v);
    }
    return h;
}

static std::uint32_t fnv1a32_add_matrix(std::uint32_t h, const SignalMatrix& m) {
    h = fnv1a32_add_i32(h, m.rows);
    h = fnv1a32_add_i32(h, m.cols);
    return fnv1a32_add_values(h, m.values);
}

std::uint32_t hashConfig(const PipelineConfig& cfg) {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_i32(h, cfg.node_count);
    h = fnv1a32_add_i32(h, cfg.sample_count);
    h = fnv1a32_add_f64(h, cfg.t_start_s);
    h = fnv1a32_add_f64(h, cfg.t_end_s);
    h = fnv1a32_add_i32(h, static_cast<std::int32_t>(cfg.harmonics.size()));
    for (int m : cfg.harmonics) {
        h = fnv1a32_add_i32(h, m);
    }
    h = fnv1a32_add_f64(h, cfg.freq_min_hz);
    h = fnv1a32_add_f64(h, cfg.freq_max_hz);
    h = fnv1a32_add_f64(h, cfg.feedback_threshold);
    h = fnv1a32_add_f64(h, cfg.noise_amplitude);
    return h;
}

std::uint32_t digestOutputs(const PipelineResult& r) {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_matrix(h, r.harmonic);
    h = fnv1a32_add_matrix(h, r.adjusted);
    h = fnv1a32_add_values(h, r.energy_loss);
    h = fnv1a32_add_values(h, r.final_phase);
    h = fnv1a32_add_matrix(h, r.spectral);
    return h;
}

} // namespace

bool validateConfig(const PipelineConfig& cfg, std::string* reason) {
    auto reject = [reason](const char* why) {
        if (reason) {
            *reason = why;
        }
        return false;
    };

    if (cfg.node_count < 1) return reject("node_count must be >= 1");
    if (cfg.sample_count < 1) return reject("sample_count must be >= 1");
    if (!std::isfinite(cfg.t_start_s) || !std::isfinite(cfg.t_end_s)) {
        return reject("time span must be finite");
    }
    if (cfg.t_end_s < cfg.t_start_s) return reject("t_end_s must be >= t_start_s");
    for (int h : cfg.harmonics) {
        if (h <= 0) return reject("harmonic multipliers must be positive");
    }
    // Largest pre-normalization row: phi^(N-1) times every harmonic at full swing.
    const double harmonic_terms = cfg.harmonics.empty() ? 1.0 : static_cast<double>(cfg.harmonics.size());
    if (!std::isfinite(std::pow(kGoldenRatio, static_cast<double>(cfg.node_count - 1)) * harmonic_terms)) {
        return reject("node_count too large: phi^(N-1) overflows");
    }
    if (!std::isfinite(cfg.freq_min_hz) || !std::isfinite(cfg.freq_max_hz)) {
        return reject("frequency range must be finite");
    }
    // [min, max) must be non-empty.
    if (!(cfg.freq_max_hz > cfg.freq_min_hz)) return reject("freq_max_hz must be > freq_min_hz");
    if (!std::isfinite(cfg.feedback_threshold)) return reject("feedback_threshold must be finite");
    if (!std::isfinite(cfg.noise_amplitude) || cfg.noise_amplitude < 0.0) {
        return reject("noise_amplitude must be finite and >= 0");
    }
    return true;
}

std::string describeConfig(const PipelineConfig& cfg) {
    std::ostringstream os;
    os << "node_count = " << cfg.node_count << "\n"
       << "sample_count = " << cfg.sample_count << "\n"
       << "time_span_s = [" << cfg.t_start_s << ", " << cfg.t_end_s << "]\n"
       << "harmonics = {";
    for (std::size_t i = 0; i < cfg.harmonics.size(); ++i) {
        os << (i ? ", " : "") << cfg.harmonics[i];
    }
    os << "}\n"
       << "base_freq_hz = [" << cfg.freq_min_hz << ", " << cfg.freq_max_hz << ")\n"
       << "feedback_threshold = " << cfg.feedback_threshold << "\n"
       << "noise_range = [" << -cfg.noise_amplitude << ", " << cfg.noise_amplitude << "]\n";
    return os.str();
}

bool parseSeed(const std::string& text, std::uint32_t* seed) {
    if (text.empty() || text.size() > 10u) {
        return false;
    }
    for (char ch : text) {
        if (ch < '0' || ch > '9') {
            return false;
        }
    }

    errno = 0;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(text.c_str(), &end, 10);
    if (errno == ERANGE || end != text.c_str() + text.size() ||
        v > static_cast<unsigned long long>(std::numeric_limits<std::uint32_t>::max())) {
        return false;
    }
    if (seed) {
        *seed = static_cast<std::uint32_t>(v);
    }
    return true;
}

OscillatorPipeline::OscillatorPipeline() = default;

OscillatorPipeline::OscillatorPipeline(const PipelineConfig& cfg) : cfg_(cfg) {}

void OscillatorPipeline::setConfig(const PipelineConfig& cfg) {
    cfg_ = cfg;
}

PipelineResult OscillatorPipeline::run(std::mt19937& rng) const {
    PipelineResult r;
    if (!validateConfig(cfg_, &r.error)) {
        return r;
    }

    // 1) generator
    r.time_grid = makeTimeGrid(cfg_.sample_count, cfg_.t_start_s, cfg_.t_end_s);
    r.nodes = drawNodeParameters(cfg_.node_count, cfg_.freq_min_hz, cfg_.freq_max_hz, rng);
    r.harmonic = synthesizeHarmonics(r.nodes, r.time_grid, cfg_.harmonics);

    // 2) feedback stabilizer
    StabilizerConfig sc;
    sc.feedback_threshold = cfg_.feedback_threshold;
    sc.noise_amplitude = cfg_.noise_amplitude;
    StabilizedSignals stab = stabilize(r.harmonic, sc, rng);
    const int perturbed_count = stab.perturbedCount();
    r.adjusted = std::move(stab.adjusted);
    r.perturbed = std::move(stab.perturbed);

    // 3) statistics
    NodeSummary summary = computeSummary(r.adjusted);
    r.energy_loss = std::move(summary.energy_loss);
    r.final_phase = std::move(summary.final_phase);

    // 4) spectrum
    r.spectral = computeSpectralMagnitude(r.adjusted);
    r.dominant_bin = dominantBins(r.spectral);
    const double span_s = cfg_.t_end_s - cfg_.t_start_s;
    r.dominant_freq_hz.reserve(r.dominant_bin.size());
    for (int bin : r.dominant_bin) {
        r.dominant_freq_hz.push_back(binFrequencyHz(bin, cfg_.sample_count, span_s));
    }

    r.metrics.mean_energy_loss = mean(r.energy_loss);
    r.metrics.mean_final_phase = mean(r.final_phase);
    r.metrics.perturbed_fraction =
        static_cast<double>(perturbed_count) / static_cast<double>(cfg_.node_count);
    r.metrics.mean_dominant_freq_hz = mean(r.dominant_freq_hz);

    r.signatures.config_hash_u32 = hashConfig(cfg_);
    r.signatures.output_digest_u32 = digestOutputs(r);
    r.ok = true;
    return r;
}

PipelineResult OscillatorPipeline::run(std::uint32_t seed) const {
    std::mt19937 rng(seed);
    return run(rng);
}

} // namespace phinet
