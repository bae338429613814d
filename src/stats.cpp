#include "stats.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

namespace tollgate {

// ──────────────────────────────────────────────────────────────────────────────
// ANSI color codes
// ──────────────────────────────────────────────────────────────────────────────
static const char* C_GREY   = "\033[90m";       // box outline
static const char* C_CYAN   = "\033[36m";       // connectors (╟─ ╙─)
static const char* C_GREEN  = "\033[92m";       // label names
static const char* C_PINK   = "\033[38;5;205m"; // values
static const char* C_RED    = "\033[31m";       // table outline
static const char* C_RESET  = "\033[0m";

static const int BOX_WIDTH   = 64;
static const int LABEL_WIDTH = 26;
static const int CELL_WIDTH  = 18;

// Display columns of a UTF-8 string. Box-drawing chars are 3 bytes, 1 column.
static int disp_w(const std::string& s) {
    int w = 0;
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = (unsigned char)s[i];
        if      (c < 0x80)             { w++;    i += 1; }
        else if ((c & 0xE0) == 0xC0)   { w++;    i += 2; }
        else if ((c & 0xF0) == 0xE0)   { w++;    i += 3; }
        else if ((c & 0xF8) == 0xF0)   { w += 2; i += 4; }
        else                           {          i += 1; }
    }
    return w;
}

static std::string repeat(const std::string& piece, int count) {
    std::string out;
    for (int i = 0; i < count; ++i) out += piece;
    return out;
}

static std::string center(const std::string& s, int width) {
    int pad = width - disp_w(s);
    if (pad <= 0) return s;
    int left = pad / 2;
    return std::string(left, ' ') + s + std::string(pad - left, ' ');
}

static double percentile(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) return 0.0;
    size_t idx = static_cast<size_t>(std::lround(p * (sorted.size() - 1)));
    return sorted[std::min(idx, sorted.size() - 1)];
}

void to_json(nlohmann::json& j, const RequestMetrics& m) {
    j = nlohmann::json{
        {"total_requests", m.total_requests},
        {"network_requests", m.network_requests},
        {"cached_responses", m.cached_responses},
        {"batched_requests", m.batched_requests},
        {"deduplicated_requests", m.deduplicated_requests},
        {"slow_requests", m.slow_requests},
        {"total_errors", m.total_errors},
        {"bytes_received", m.bytes_received},
        {"cache_hit_ratio", m.cache_hit_ratio},
        {"timing", {
            {"total_seconds", m.total_response_time_seconds},
            {"avg_seconds", m.avg_response_time_seconds},
            {"fastest_seconds", m.fastest_request_seconds},
            {"slowest_seconds", m.slowest_request_seconds},
            {"p50_seconds", m.p50_seconds},
            {"p90_seconds", m.p90_seconds},
            {"p99_seconds", m.p99_seconds}
        }},
        {"errors", m.error_counts}
    };
}

// ──────────────────────────────────────────────────────────────────────────────
void Statistics::record_response(Seconds elapsed, size_t bytes_received) {
    std::lock_guard<std::mutex> lock(mutex_);
    double s = elapsed.count();

    metrics_.total_requests++;
    metrics_.network_requests++;
    metrics_.bytes_received += bytes_received;
    metrics_.total_response_time_seconds += s;
    if (fastest_ < 0.0 || s < fastest_) fastest_ = s;
    metrics_.slowest_request_seconds = std::max(metrics_.slowest_request_seconds, s);

    samples_.push_back(s);
    if (samples_.size() > MAX_TIMING_SAMPLES) samples_.pop_front();
}

void Statistics::record_cache_hit() {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_.total_requests++;
    metrics_.cached_responses++;
}

void Statistics::record_deduplicated() {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_.deduplicated_requests++;
}

void Statistics::record_batched(size_t items) {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_.batched_requests += items;
}

void Statistics::record_slow_request() {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_.slow_requests++;
}

void Statistics::record_error(const std::string& error_type) {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_.total_errors++;
    metrics_.error_counts[error_type]++;
}

RequestMetrics Statistics::snapshot() const {
    std::vector<double> sorted;
    RequestMetrics m;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        m = metrics_;
        m.fastest_request_seconds = fastest_ < 0.0 ? 0.0 : fastest_;
        sorted.assign(samples_.begin(), samples_.end());
    }

    if (m.network_requests > 0) {
        m.avg_response_time_seconds = m.total_response_time_seconds / m.network_requests;
    }
    if (m.total_requests > 0) {
        m.cache_hit_ratio = static_cast<double>(m.cached_responses) / m.total_requests;
    }

    std::sort(sorted.begin(), sorted.end());
    m.p50_seconds = percentile(sorted, 0.50);
    m.p90_seconds = percentile(sorted, 0.90);
    m.p99_seconds = percentile(sorted, 0.99);
    return m;
}

void Statistics::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_ = RequestMetrics();
    fastest_ = -1.0;
    samples_.clear();
}

// ──────────────────────────────────────────────────────────────────────────────
ReportPrinter::ReportPrinter(std::ostream& out, bool colored)
    : out_(out), colored_(colored) {}

std::string ReportPrinter::paint(const char* color, const std::string& text) const {
    if (!colored_) return text;
    return std::string(color) + text + C_RESET;
}

// uncolored is used for the width, colored is what gets written
void ReportPrinter::box_line(const std::string& uncolored, const std::string& colored) {
    int spaces = BOX_WIDTH - disp_w(uncolored) - 1;
    if (spaces < 0) spaces = 0;

    out_ << colored << std::string(spaces, ' ') << paint(C_GREY, "║") << "\n";
}

void ReportPrinter::title(const std::string& text) {
    out_ << paint(C_GREY, "╔" + repeat("═", BOX_WIDTH - 2) + "╗") << "\n";
    std::string centered = center(text, BOX_WIDTH - 2);
    box_line("║" + centered, paint(C_GREY, "║") + paint(C_GREEN, centered));
    out_ << paint(C_GREY, "╚" + repeat("═", BOX_WIDTH - 2) + "╝") << "\n";
}

void ReportPrinter::begin_section(const std::string& name) {
    std::string head = "╔═ " + name + " ";
    int fill = BOX_WIDTH - disp_w(head) - 1;
    out_ << paint(C_GREY, "╔═ ") << paint(C_GREEN, name) << " "
         << paint(C_GREY, repeat("═", fill > 0 ? fill : 0) + "╗") << "\n";
}

void ReportPrinter::line(const std::string& label, const std::string& value, bool last) {
    std::string connector = last ? "╙─" : "╟─";
    std::string padded = label;
    int pad = LABEL_WIDTH - disp_w(label);
    if (pad > 0) padded += std::string(pad, ' ');

    std::string unc = "║  " + connector + " " + padded + value;
    std::string col = paint(C_GREY, "║") + "  " +
                      paint(C_CYAN, connector) + " " +
                      paint(C_GREEN, padded) +
                      paint(C_PINK, value);
    box_line(unc, col);
}

void ReportPrinter::table(const std::vector<std::string>& headers,
                          const std::vector<std::string>& values) {
    std::string top = "┌", mid = "├", bottom = "└";
    for (size_t i = 0; i < headers.size(); ++i) {
        bool final_cell = i + 1 == headers.size();
        top    += repeat("─", CELL_WIDTH) + (final_cell ? "┐" : "┬");
        mid    += repeat("─", CELL_WIDTH) + (final_cell ? "┤" : "┼");
        bottom += repeat("─", CELL_WIDTH) + (final_cell ? "┘" : "┴");
    }

    auto row = [&](const std::vector<std::string>& cells, const char* color) {
        std::string unc = "║  │";
        std::string col = paint(C_GREY, "║") + "  " + paint(C_RED, "│");
        for (size_t i = 0; i < headers.size(); ++i) {
            std::string cell = center(i < cells.size() ? cells[i] : "", CELL_WIDTH);
            unc += cell + "│";
            col += paint(color, cell) + paint(C_RED, "│");
        }
        box_line(unc, col);
    };

    box_line("║  " + top, paint(C_GREY, "║") + "  " + paint(C_RED, top));
    row(headers, C_GREEN);
    box_line("║  " + mid, paint(C_GREY, "║") + "  " + paint(C_RED, mid));
    row(values, C_PINK);
    box_line("║  " + bottom, paint(C_GREY, "║") + "  " + paint(C_RED, bottom));
}

void ReportPrinter::end_section() {
    out_ << paint(C_GREY, "╚" + repeat("═", BOX_WIDTH - 2) + "╝") << "\n";
}

std::string ReportPrinter::fixed(double value, int precision, const std::string& suffix) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value << suffix;
    return ss.str();
}

} // namespace tollgate
