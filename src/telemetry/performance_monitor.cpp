/**
 * @file performance_monitor.cpp
 * @brief PerformanceMonitor implementation.
 */

#include "telemetry/performance_monitor.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace hybrid_router {

namespace {

constexpr std::array<Route, kRouteCount> kRoutes{Route::Local, Route::Remote, Route::Cache, Route::Queue};
constexpr std::array<Tier, 3> kTiers{Tier::Simple, Tier::Medium, Tier::Complex};

Json optional_ms(const std::optional<Timestamp>& ts) {
    return ts ? Json(to_epoch_ms(*ts)) : Json(nullptr);
}

/// Quotes a CSV field when it contains a separator, quote or newline.
std::string csv_field(std::string_view text) {
    if (text.find_first_of(",\"\n") == std::string_view::npos) {
        return std::string{text};
    }
    std::string out = "\"";
    for (char c : text) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

/// Tool names and error messages arrive unvalidated; invalid UTF-8 becomes U+FFFD.
Result<std::string> render_json(const MetricsSnapshot& snap) {
    try {
        return snapshot_to_json(snap).dump(2, ' ', false, Json::error_handler_t::replace);
    } catch (const Json::exception& e) {
        return Error{ErrorKind::ExportError, std::string("Cannot serialize metrics: ") + e.what()};
    }
}

}  // namespace

bool parse_export_format(std::string_view text, ExportFormat& out) noexcept {
    if (text == "json") { out = ExportFormat::Json; return true; }
    if (text == "csv")  { out = ExportFormat::Csv;  return true; }
    return false;
}

// ─────────────────────────────────────────────
// Export
// ─────────────────────────────────────────────

Json snapshot_to_json(const MetricsSnapshot& snap) {
    Json routes = Json::object();
    for (auto r : kRoutes) {
        const auto& s = snap.route(r);
        routes[std::string{to_string(r)}] = {
            {"count", s.count},
            {"success_count", s.success_count},
            {"failure_count", s.failure_count},
            {"total_latency_us", s.total_latency.count()},
            {"min_latency_us", s.min_latency.count()},
            {"max_latency_us", s.max_latency.count()},
            {"avg_latency_us", s.average_latency().count()},
            {"success_rate", s.success_rate()}
        };
    }

    Json tiers = Json::object();
    for (auto t : kTiers) {
        const auto& s = snap.tier(t);
        tiers[std::string{to_string(t)}] = {
            {"count", s.count},
            {"errors", s.errors},
            {"total_latency_us", s.total_latency.count()}
        };
    }

    Json tools = Json::object();
    for (const auto& [name, s] : snap.tools) {
        tools[name] = {
            {"count", s.count},
            {"errors", s.errors},
            {"total_latency_us", s.total_latency.count()},
            {"last_execution_ms", optional_ms(s.last_execution)}
        };
    }

    Json errors = Json::object();
    for (const auto& [kind, count] : snap.errors_by_kind) {
        errors[std::string{to_string(kind)}] = count;
    }

    Json recent = Json::array();
    for (const auto& e : snap.recent_errors) {
        recent.push_back({
            {"at_ms", to_epoch_ms(e.at)},
            {"tool", e.tool},
            {"kind", std::string{to_string(e.kind)}},
            {"message", e.message}
        });
    }

    return {
        {"session_start_ms", to_epoch_ms(snap.session_start)},
        {"routes", routes},
        {"cache", {
            {"hits", snap.cache_hit_count},
            {"misses", snap.cache_miss_count},
            {"hit_rate", snap.cache_hit_rate()}
        }},
        {"queue", {
            {"depth", snap.queue_depth},
            {"last_sync_ms", optional_ms(snap.last_sync_time)},
            {"jobs_completed", snap.jobs_completed},
            {"jobs_failed", snap.jobs_failed}
        }},
        {"tiers", tiers},
        {"tools", tools},
        {"errors_by_kind", errors},
        {"recent_errors", recent}
    };
}

std::string snapshot_to_csv(const MetricsSnapshot& snap) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(4);

    out << "section,name,count,success_count,failure_count,total_latency_us,"
           "min_latency_us,max_latency_us,avg_latency_us\n";
    for (auto r : kRoutes) {
        const auto& s = snap.route(r);
        out << "route," << to_string(r) << ',' << s.count << ',' << s.success_count << ','
            << s.failure_count << ',' << s.total_latency.count() << ',' << s.min_latency.count()
            << ',' << s.max_latency.count() << ',' << s.average_latency().count() << '\n';
    }
    for (auto t : kTiers) {
        const auto& s = snap.tier(t);
        auto avg = s.count == 0 ? 0 : s.total_latency.count() / static_cast<int64_t>(s.count);
        out << "tier," << to_string(t) << ',' << s.count << ',' << (s.count - s.errors) << ','
            << s.errors << ',' << s.total_latency.count() << ",,," << avg << '\n';
    }
    for (const auto& [name, s] : snap.tools) {
        auto avg = s.count == 0 ? 0 : s.total_latency.count() / static_cast<int64_t>(s.count);
        out << "tool," << csv_field(name) << ',' << s.count << ',' << (s.count - s.errors) << ','
            << s.errors << ',' << s.total_latency.count() << ",,," << avg << '\n';
    }

    out << "\nmetric,value\n";
    out << "cache_hits," << snap.cache_hit_count << '\n';
    out << "cache_misses," << snap.cache_miss_count << '\n';
    out << "cache_hit_rate," << snap.cache_hit_rate() << '\n';
    out << "queue_depth," << snap.queue_depth << '\n';
    out << "last_sync_ms," << (snap.last_sync_time ? std::to_string(to_epoch_ms(*snap.last_sync_time)) : "") << '\n';
    out << "jobs_completed," << snap.jobs_completed << '\n';
    out << "jobs_failed," << snap.jobs_failed << '\n';
    out << "session_start_ms," << to_epoch_ms(snap.session_start) << '\n';
    for (const auto& [kind, count] : snap.errors_by_kind) {
        out << "errors." << to_string(kind) << ',' << count << '\n';
    }
    return out.str();
}

// ─────────────────────────────────────────────
// PerformanceMonitor
// ─────────────────────────────────────────────

PerformanceMonitor::PerformanceMonitor(Logger& logger, size_t max_recent_errors)
    : logger_(logger), max_recent_errors_(max_recent_errors) {
    data_.session_start = std::chrono::system_clock::now();
}

PerformanceMonitor::~PerformanceMonitor() {
    stop_persistence();
}

void PerformanceMonitor::record(Route route, const ToolName& tool, Tier tier, Duration latency,
                                bool success, std::optional<ErrorKind> error,
                                std::string_view message) {
    auto now = std::chrono::system_clock::now();
    std::lock_guard lock(mutex_);

    auto& r = data_.routes[static_cast<size_t>(route)];
    if (r.count == 0 || latency < r.min_latency) r.min_latency = latency;
    if (latency > r.max_latency) r.max_latency = latency;
    r.count += 1;
    r.total_latency += latency;
    (success ? r.success_count : r.failure_count) += 1;

    auto& t = data_.tools[tool];
    t.count += 1;
    t.total_latency += latency;
    t.last_execution = now;
    if (!success) t.errors += 1;

    auto& ts = data_.tiers[static_cast<size_t>(tier)];
    ts.count += 1;
    ts.total_latency += latency;
    if (!success) ts.errors += 1;

    if (error) record_error_locked(tool, *error, message);
}

void PerformanceMonitor::record_cache(bool hit) {
    std::lock_guard lock(mutex_);
    (hit ? data_.cache_hit_count : data_.cache_miss_count) += 1;
}

void PerformanceMonitor::record_job_outcome(const ToolName& tool, bool success, std::string_view error) {
    std::lock_guard lock(mutex_);
    if (success) {
        data_.jobs_completed += 1;
    } else {
        data_.jobs_failed += 1;
        record_error_locked(tool, ErrorKind::QueueExhausted, error);
    }
}

void PerformanceMonitor::set_queue_state(size_t depth, std::optional<Timestamp> last_sync) {
    std::lock_guard lock(mutex_);
    data_.queue_depth = depth;
    if (last_sync) data_.last_sync_time = last_sync;
}

void PerformanceMonitor::record_error_locked(const ToolName& tool, ErrorKind kind,
                                             std::string_view message) {
    data_.errors_by_kind[kind] += 1;
    if (max_recent_errors_ == 0) return;
    if (data_.recent_errors.size() >= max_recent_errors_) {
        data_.recent_errors.erase(data_.recent_errors.begin());
    }
    data_.recent_errors.push_back(ErrorRecord{
        .at = std::chrono::system_clock::now(),
        .tool = tool,
        .kind = kind,
        .message = std::string{message}
    });
}

MetricsSnapshot PerformanceMonitor::snapshot() const {
    std::lock_guard lock(mutex_);
    return data_;
}

Result<std::string> PerformanceMonitor::export_metrics(ExportFormat format) const {
    auto snap = snapshot();
    switch (format) {
        case ExportFormat::Json: return render_json(snap);
        case ExportFormat::Csv:  return snapshot_to_csv(snap);
    }
    return Error{ErrorKind::ExportError, "Unsupported export format"};
}

void PerformanceMonitor::reset() {
    std::lock_guard lock(mutex_);
    // The queue gauge mirrors live queue state, so it survives a reset.
    auto depth = data_.queue_depth;
    auto last_sync = data_.last_sync_time;
    data_ = MetricsSnapshot{};
    data_.queue_depth = depth;
    data_.last_sync_time = last_sync;
    data_.session_start = std::chrono::system_clock::now();
    logger_.info("monitor", "Metrics reset");
}

// ─────────────────────────────────────────────
// Persistence
// ─────────────────────────────────────────────

Result<void> PerformanceMonitor::persist_now(const std::filesystem::path& path) const {
    auto body = render_json(snapshot());
    if (!body) {
        return body.error();
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return Error{ErrorKind::ExportError, "Cannot open " + tmp.string()};
        }
        out << *body;
        if (!out.flush()) {
            return Error{ErrorKind::ExportError, "Cannot write " + tmp.string()};
        }
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        return Error{ErrorKind::ExportError, "Cannot rename to " + path.string() + ": " + ec.message()};
    }
    return Result<void>{};
}

void PerformanceMonitor::start_persistence(const std::filesystem::path& path,
                                           std::chrono::milliseconds interval) {
    if (path.empty() || persist_thread_.joinable()) return;
    persist_thread_ = std::jthread([this, path, interval](std::stop_token stop) {
        persist_loop(stop, path, interval);
    });
    logger_.info("monitor", "Persisting metrics to " + path.string());
}

void PerformanceMonitor::stop_persistence() {
    if (!persist_thread_.joinable()) return;
    persist_thread_.request_stop();
    persist_cv_.notify_all();
    persist_thread_.join();
}

void PerformanceMonitor::persist_loop(std::stop_token stop, std::filesystem::path path,
                                      std::chrono::milliseconds interval) {
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(persist_mutex_);
            persist_cv_.wait_for(lock, stop, interval, [] { return false; });
        }
        // Runs once more on shutdown so the final counters reach disk.
        if (auto saved = persist_now(path); !saved) {
            logger_.warn("monitor", "Metrics persistence failed: " + saved.error().message);
        }
    }
}

}  // namespace hybrid_router
