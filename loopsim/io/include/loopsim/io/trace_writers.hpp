#pragma once

/// @file trace_writers.hpp
/// @brief Sinks for the event records a Scheduler emits.
/// @ingroup io_writers

#include <loopsim/core/trace_writer.hpp>

#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/writer.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace loopsim::io {

/// @brief Trace writer that discards every event.
/// @ingroup io_writers
class NullTraceWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint /*time*/) override {}
    void type(std::string_view /*name*/) override {}
    void field(std::string_view /*key*/, uint64_t /*value*/) override {}
    void field(std::string_view /*key*/, std::string_view /*value*/) override {}
    void end() override {}
};

/// @brief Streams trace events as a JSON array, one object per line.
///
/// Each record is serialised by a RapidJSON writer that is reset for
/// every event, e.g. `{"tick":5,"type":"job_completed","job_id":1}`.
/// The array is closed by @ref finalize, or by the destructor.
///
/// @ingroup io_writers
/// @see core::TraceWriter, MemoryTraceWriter, TextualTraceWriter
class JsonTraceWriter : public core::TraceWriter {
public:
    /// @param output  Destination stream (must outlive this writer).
    explicit JsonTraceWriter(std::ostream& output);
    ~JsonTraceWriter() override;

    JsonTraceWriter(const JsonTraceWriter&) = delete;
    JsonTraceWriter& operator=(const JsonTraceWriter&) = delete;
    JsonTraceWriter(JsonTraceWriter&&) = delete;
    JsonTraceWriter& operator=(JsonTraceWriter&&) = delete;

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    /// @brief Close the JSON array and flush. Later calls do nothing.
    void finalize();

    [[nodiscard]] uint64_t records_written() const noexcept { return records_written_; }

private:
    void key(std::string_view name);

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    rapidjson::OStreamWrapper stream_;
    rapidjson::Writer<rapidjson::OStreamWrapper> writer_;
    uint64_t records_written_{0};
    bool finalized_{false};
};

/// @brief One scheduler event captured by MemoryTraceWriter.
/// @ingroup io_writers
struct TraceRecord {
    int64_t tick{0};
    std::string type;   ///< e.g. "callback_executed"
    std::unordered_map<std::string, std::variant<uint64_t, std::string>> fields;
};

/// @brief Keeps every event in memory; input of compute_metrics().
/// @ingroup io_writers
class MemoryTraceWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;

    void end() override;

    [[nodiscard]] const std::vector<TraceRecord>& records() const { return records_; }

    /// @brief Number of buffered records of the given event type.
    [[nodiscard]] std::size_t count(std::string_view type) const;

    void clear() { records_.clear(); }

private:
    std::vector<TraceRecord> records_;
    TraceRecord current_;
};

/// @brief One aligned line per event, for terminals and logs.
///
/// @code
/// [     5] +5     callback_executed      callback_id=4 queue=io job_id=1
/// [     5]        job_started            job_id=2 completion_time=10
/// @endcode
///
/// The tick delta is printed only when the tick changes. With colour
/// enabled, failures are red and clock advances are dimmed.
///
/// @ingroup io_writers
class TextualTraceWriter : public core::TraceWriter {
public:
    /// @param output         Destination stream (must outlive this writer).
    /// @param color_enabled  If true, emit ANSI escape codes for colour.
    explicit TextualTraceWriter(std::ostream& output, bool color_enabled = true);

    TextualTraceWriter(const TextualTraceWriter&) = delete;
    TextualTraceWriter& operator=(const TextualTraceWriter&) = delete;
    TextualTraceWriter(TextualTraceWriter&&) = delete;
    TextualTraceWriter& operator=(TextualTraceWriter&&) = delete;

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;

    void end() override;

private:
    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool color_enabled_;
    int64_t tick_{0};
    std::optional<int64_t> last_tick_;
    std::string type_;
    std::string fields_;
};

} // namespace loopsim::io
