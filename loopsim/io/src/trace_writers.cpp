#include <loopsim/io/trace_writers.hpp>

#include <algorithm>
#include <iomanip>
#include <utility>

namespace loopsim::io {

namespace {

constexpr const char* COLOR_FAILURE = "\033[31m";
constexpr const char* COLOR_CLOCK = "\033[2m";
constexpr const char* COLOR_RESET = "\033[0m";

const char* color_for(std::string_view type) {
    if (type == "uncaught_exception" || type == "uncaught_handler_failed" || type == "livelock") {
        return COLOR_FAILURE;
    }
    if (type == "clock_advanced") {
        return COLOR_CLOCK;
    }
    return nullptr;
}

rapidjson::SizeType json_length(std::string_view text) {
    return static_cast<rapidjson::SizeType>(text.size());
}

} // anonymous namespace

// =============================================================================
// JsonTraceWriter
// =============================================================================

JsonTraceWriter::JsonTraceWriter(std::ostream& output)
    : output_(output)
    , stream_(output)
    , writer_(stream_) {
    output_ << '[';
}

JsonTraceWriter::~JsonTraceWriter() {
    finalize();
}

void JsonTraceWriter::begin(core::TimePoint time) {
    output_ << (records_written_ == 0 ? "\n" : ",\n");
    writer_.Reset(stream_);
    writer_.StartObject();
    key("tick");
    writer_.Int64(core::time_to_ticks(time));
}

void JsonTraceWriter::key(std::string_view name) {
    writer_.Key(name.data(), json_length(name));
}

void JsonTraceWriter::type(std::string_view name) {
    key("type");
    writer_.String(name.data(), json_length(name));
}

void JsonTraceWriter::field(std::string_view key_name, uint64_t value) {
    key(key_name);
    writer_.Uint64(value);
}

void JsonTraceWriter::field(std::string_view key_name, std::string_view value) {
    key(key_name);
    writer_.String(value.data(), json_length(value));
}

void JsonTraceWriter::end() {
    writer_.EndObject();
    ++records_written_;
}

void JsonTraceWriter::finalize() {
    if (finalized_) {
        return;
    }
    finalized_ = true;
    output_ << "\n]\n";
    output_.flush();
}

// =============================================================================
// MemoryTraceWriter
// =============================================================================

void MemoryTraceWriter::begin(core::TimePoint time) {
    current_ = TraceRecord{};
    current_.tick = core::time_to_ticks(time);
}

void MemoryTraceWriter::type(std::string_view name) {
    current_.type.assign(name);
}

void MemoryTraceWriter::field(std::string_view key, uint64_t value) {
    current_.fields.insert_or_assign(std::string(key), value);
}

void MemoryTraceWriter::field(std::string_view key, std::string_view value) {
    current_.fields.insert_or_assign(std::string(key), std::string(value));
}

void MemoryTraceWriter::end() {
    records_.push_back(std::exchange(current_, TraceRecord{}));
}

std::size_t MemoryTraceWriter::count(std::string_view type) const {
    return static_cast<std::size_t>(std::count_if(
        records_.begin(), records_.end(),
        [type](const TraceRecord& record) { return record.type == type; }));
}

// =============================================================================
// TextualTraceWriter
// =============================================================================

TextualTraceWriter::TextualTraceWriter(std::ostream& output, bool color_enabled)
    : output_(output)
    , color_enabled_(color_enabled) {}

void TextualTraceWriter::begin(core::TimePoint time) {
    tick_ = core::time_to_ticks(time);
    type_.clear();
    fields_.clear();
}

void TextualTraceWriter::type(std::string_view name) {
    type_.assign(name);
}

void TextualTraceWriter::field(std::string_view key, uint64_t value) {
    field(key, std::to_string(value));
}

void TextualTraceWriter::field(std::string_view key, std::string_view value) {
    fields_ += ' ';
    fields_.append(key);
    fields_ += '=';
    fields_.append(value);
}

void TextualTraceWriter::end() {
    output_ << '[' << std::setw(6) << tick_ << "] ";

    std::string delta;
    if (last_tick_ && *last_tick_ != tick_) {
        delta = "+" + std::to_string(tick_ - *last_tick_);
    }
    output_ << std::left << std::setw(7) << delta;

    const char* color = color_enabled_ ? color_for(type_) : nullptr;
    if (color != nullptr) {
        output_ << color;
    }
    output_ << std::setw(24) << type_ << std::right;
    if (color != nullptr) {
        output_ << COLOR_RESET;
    }

    output_ << fields_ << '\n';
    last_tick_ = tick_;
}

} // namespace loopsim::io
