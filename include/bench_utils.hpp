#ifndef FRNN_BENCH_UTILS_HPP
#define FRNN_BENCH_UTILS_HPP

#include <cstdio>
#include <fstream>
#include <string>
#include <sstream>
#include <vector>

#include <sys/resource.h>

namespace frnn {

// Peak resident set size in MB (Linux reports ru_maxrss in kB).
inline double get_peak_rss_mb() {
    struct rusage ru;
    if (getrusage(RUSAGE_SELF, &ru) != 0) return 0.0;
    return static_cast<double>(ru.ru_maxrss) / 1024.0;
}

// Warn when the CPU governor would make timings noisy.
inline void check_cpu_governor() {
    std::ifstream f("/sys/devices/system/cpu/cpu0/cpufreq/scaling_governor");
    if (!f.is_open()) return;
    std::string gov;
    std::getline(f, gov);
    if (gov != "performance") {
        std::fprintf(stderr,
            "WARNING: CPU governor is '%s', not 'performance'. "
            "Results may be noisy.\n", gov.c_str());
    }
}

// Per-run result rows. The header goes out when the file is opened; each
// row is formatted in full before it is written.
class CsvWriter {
public:
    CsvWriter(const std::string& path, const std::vector<std::string>& columns)
        : out_(path) {
        if (!out_.is_open()) return;
        std::string header;
        for (const auto& c : columns) header += (header.empty() ? "" : ",") + c;
        out_ << header << '\n';
    }

    bool is_open() const { return out_.is_open(); }

    template <typename... Cells>
    void write_row(const Cells&... cells) {
        std::ostringstream line;
        const char* sep = "";
        ((line << sep << cells, sep = ","), ...);
        out_ << line.str() << '\n';
    }

    void flush() { out_.flush(); }

private:
    std::ofstream out_;
};

}  // namespace frnn

#endif  // FRNN_BENCH_UTILS_HPP
