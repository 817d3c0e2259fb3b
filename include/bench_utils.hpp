#ifndef CENTRIX_BENCH_UTILS_HPP
#define CENTRIX_BENCH_UTILS_HPP

#include "distance.hpp"
#include "vectorizer.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

#include <sys/resource.h>

namespace centrix {

// Integer from the environment, or `fallback` when unset or unparsable.
inline long env_long(const char* name, long fallback) {
    const char* v = std::getenv(name);
    if (!v || !*v) return fallback;
    char* end = nullptr;
    long parsed = std::strtol(v, &end, 10);
    return (end && *end == '\0') ? parsed : fallback;
}

// Comma-separated training sizes, e.g. CENTRIX_BENCH_N=1000,10000.
inline std::vector<size_t> env_sizes(const char* name) {
    std::vector<size_t> out;
    const char* v = std::getenv(name);
    if (!v) return out;
    std::string s(v);
    size_t pos = 0;
    while (pos < s.size()) {
        size_t end = s.find(',', pos);
        if (end == std::string::npos) end = s.size();
        out.push_back(static_cast<size_t>(std::stoul(s.substr(pos, end - pos))));
        pos = end + 1;
    }
    return out;
}

// Benchmark knobs, all overridable through CENTRIX_BENCH_* variables.
struct BenchConfig {
    ImageShape shape{32, 32, 3};
    int classes = 3;
    size_t test_n = 10000;
    float noise = 60.0f;
    std::vector<size_t> train_sizes{1000, 10000, 50000};

    static BenchConfig from_env() {
        BenchConfig cfg;
        cfg.shape.height = static_cast<int>(env_long("CENTRIX_BENCH_SIDE", 32));
        cfg.shape.width = cfg.shape.height;
        cfg.shape.channels = static_cast<int>(env_long("CENTRIX_BENCH_CHANNELS", 3));
        cfg.classes = static_cast<int>(env_long("CENTRIX_BENCH_K", 3));
        cfg.test_n = static_cast<size_t>(env_long("CENTRIX_BENCH_TEST_N", 10000));
        cfg.noise = static_cast<float>(env_long("CENTRIX_BENCH_NOISE", 60));
        std::vector<size_t> sizes = env_sizes("CENTRIX_BENCH_N");
        if (!sizes.empty()) cfg.train_sizes = sizes;
        return cfg;
    }
};

// Mean wall-clock milliseconds of `runs` calls to fn().
template <typename Fn>
double mean_ms(int runs, Fn&& fn) {
    double total = 0.0;
    for (int r = 0; r < runs; ++r) {
        auto t0 = std::chrono::steady_clock::now();
        fn();
        total += std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - t0).count();
    }
    return total / runs;
}

// ru_maxrss is in kilobytes on Linux.
inline double peak_rss_mb() {
    struct rusage ru;
    if (getrusage(RUSAGE_SELF, &ru) != 0) return 0.0;
    return static_cast<double>(ru.ru_maxrss) / 1024.0;
}

// One timed (training size, metric, backend) combination.
struct BenchResult {
    size_t n = 0;
    Metric metric = Metric::Euclidean;
    std::string backend;
    double fit_ms = 0.0;
    double predict_ms = 0.0;
    float accuracy = 0.0f;
    size_t test_n = 0;

    double mvecs_per_sec() const {
        return predict_ms > 0.0
                   ? (static_cast<double>(test_n) / 1e6) / (predict_ms / 1000.0)
                   : 0.0;
    }
};

class ResultsCsv {
public:
    explicit ResultsCsv(const std::string& path) : out_(path) {
        if (out_)
            out_ << "n,metric,backend,fit_ms,predict_ms,accuracy,"
                    "throughput_mvecs_per_sec,memory_mb\n";
    }
    bool is_open() const { return out_.is_open(); }

    void append(const BenchResult& r) {
        if (!out_) return;
        out_ << r.n << ',' << metric_name(r.metric) << ',' << r.backend << ','
             << r.fit_ms << ',' << r.predict_ms << ',' << r.accuracy << ','
             << r.mvecs_per_sec() << ',' << peak_rss_mb() << '\n';
        out_.flush();
    }

private:
    std::ofstream out_;
};

}  // namespace centrix

#endif  // CENTRIX_BENCH_UTILS_HPP
