#include <loopsim/io/metrics.hpp>
#include <loopsim/io/error.hpp>

#include <loopsim/core/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>
#include <unordered_map>

namespace loopsim::io {

namespace {

using namespace loopsim::core;

const uint64_t* get_uint(const TraceRecord& record, const std::string& key) {
    auto it = record.fields.find(key);
    if (it == record.fields.end()) {
        return nullptr;
    }
    return std::get_if<uint64_t>(&it->second);
}

const std::string* get_string(const TraceRecord& record, const std::string& key) {
    auto it = record.fields.find(key);
    if (it == record.fields.end()) {
        return nullptr;
    }
    return std::get_if<std::string>(&it->second);
}

} // anonymous namespace

LoopMetrics compute_metrics(const std::vector<TraceRecord>& traces) {
    LoopMetrics metrics;

    std::unordered_map<uint64_t, int64_t> submit_ticks;
    uint64_t running = 0;
    uint64_t started = 0;
    uint64_t total_delay = 0;

    for (const auto& record : traces) {
        metrics.final_tick = std::max(metrics.final_tick, record.tick);

        if (record.type == "callback_executed") {
            if (const auto* queue = get_string(record, "queue")) {
                ++metrics.executed_per_queue[static_cast<std::size_t>(
                    queue_kind_from_string(*queue))];
            }
            ++metrics.total_executed;
        } else if (record.type == "callback_cancelled") {
            ++metrics.callbacks_cancelled;
        } else if (record.type == "uncaught_exception") {
            ++metrics.uncaught_exceptions;
        } else if (record.type == "job_submitted") {
            ++metrics.jobs_submitted;
            if (const auto* job_id = get_uint(record, "job_id")) {
                submit_ticks[*job_id] = record.tick;
            }
        } else if (record.type == "job_started") {
            ++running;
            metrics.peak_running_jobs = std::max(metrics.peak_running_jobs, running);
            if (const auto* job_id = get_uint(record, "job_id")) {
                auto it = submit_ticks.find(*job_id);
                if (it != submit_ticks.end()) {
                    auto delay = static_cast<uint64_t>(record.tick - it->second);
                    total_delay += delay;
                    metrics.max_queueing_delay = std::max(metrics.max_queueing_delay, delay);
                    ++started;
                }
            }
        } else if (record.type == "job_completed") {
            ++metrics.jobs_completed;
            if (running > 0) {
                --running;
            }
        } else if (record.type == "worker_released") {
            if (running > 0) {
                --running;
            }
        } else if (record.type == "job_cancelled") {
            ++metrics.jobs_cancelled;
        } else if (record.type == "clock_advanced") {
            ++metrics.clock_advances;
        }
    }

    if (started > 0) {
        metrics.mean_queueing_delay =
            static_cast<double>(total_delay) / static_cast<double>(started);
    }
    return metrics;
}

LoopMetrics compute_metrics_from_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    std::string json = oss.str();

    rapidjson::Document doc;
    doc.Parse(json.c_str());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsArray()) {
        throw LoaderError("trace file must be a JSON array", path.string());
    }

    std::vector<TraceRecord> traces;
    traces.reserve(doc.Size());

    for (rapidjson::SizeType idx = 0; idx < doc.Size(); ++idx) {
        const auto& obj = doc[idx];
        if (!obj.IsObject()) {
            throw LoaderError("record must be an object", "[" + std::to_string(idx) + "]");
        }
        TraceRecord record;

        if (obj.HasMember("tick") && obj["tick"].IsInt64()) {
            record.tick = obj["tick"].GetInt64();
        }
        if (obj.HasMember("type") && obj["type"].IsString()) {
            record.type = obj["type"].GetString();
        }

        for (auto iter = obj.MemberBegin(); iter != obj.MemberEnd(); ++iter) {
            std::string key = iter->name.GetString();
            if (key == "tick" || key == "type") {
                continue;
            }
            if (iter->value.IsUint64()) {
                record.fields[key] = iter->value.GetUint64();
            } else if (iter->value.IsString()) {
                record.fields[key] = std::string(iter->value.GetString());
            }
        }

        traces.push_back(std::move(record));
    }

    try {
        return compute_metrics(traces);
    } catch (const InvalidQueueError& e) {
        throw LoaderError(e.what(), path.string());
    }
}

void write_metrics_summary(const LoopMetrics& metrics, std::ostream& out) {
    out << "Executed callbacks: " << metrics.total_executed << "\n";
    for (QueueKind kind : {QueueKind::Immediate, QueueKind::Microtask, QueueKind::TimerPhase,
                           QueueKind::IOPhase, QueueKind::CheckPhase}) {
        out << "  " << std::left << std::setw(10) << to_string(kind) << std::right
            << metrics.executed(kind) << "\n";
    }
    out << "Cancelled callbacks: " << metrics.callbacks_cancelled << "\n"
        << "Uncaught exceptions: " << metrics.uncaught_exceptions << "\n"
        << "Jobs: " << metrics.jobs_submitted << " submitted, "
        << metrics.jobs_completed << " completed, "
        << metrics.jobs_cancelled << " cancelled\n"
        << "Peak running jobs: " << metrics.peak_running_jobs << "\n"
        << "Queueing delay: mean " << std::fixed << std::setprecision(2)
        << metrics.mean_queueing_delay << std::defaultfloat
        << ", max " << metrics.max_queueing_delay << " ticks\n"
        << "Clock advances: " << metrics.clock_advances << "\n"
        << "Final tick: " << metrics.final_tick << "\n";
}

} // namespace loopsim::io
