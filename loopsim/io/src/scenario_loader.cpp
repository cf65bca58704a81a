#include <loopsim/io/scenario_loader.hpp>
#include <loopsim/io/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <array>
#include <fstream>
#include <optional>
#include <sstream>
#include <utility>

namespace loopsim::io {

namespace {

using namespace loopsim::core;

struct KindName {
    SubmissionKind kind;
    std::string_view name;
};

constexpr std::array<KindName, 7> KIND_NAMES{{
    {SubmissionKind::Immediate, "immediate"},
    {SubmissionKind::Microtask, "microtask"},
    {SubmissionKind::Timer, "timer"},
    {SubmissionKind::IO, "io"},
    {SubmissionKind::Check, "check"},
    {SubmissionKind::Interval, "interval"},
    {SubmissionKind::WorkerJob, "worker_job"},
}};

std::optional<SubmissionKind> lookup_kind(std::string_view name) {
    for (const auto& entry : KIND_NAMES) {
        if (entry.name == name) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

const rapidjson::Value& get_member(const rapidjson::Value& obj, const char* name,
                                   const std::string& context) {
    if (!obj.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", context);
    }
    return obj[name];
}

int64_t get_ticks(const rapidjson::Value& obj, const char* name, const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsInt64()) {
        throw LoaderError(std::string("field '") + name + "' must be an integer tick count",
                          context);
    }
    return member.GetInt64();
}

int64_t get_ticks_or(const rapidjson::Value& obj, const char* name, int64_t default_val,
                     const std::string& context) {
    if (!obj.HasMember(name)) {
        return default_val;
    }
    return get_ticks(obj, name, context);
}

uint64_t get_positive_uint64(const rapidjson::Value& obj, const char* name,
                             const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsUint64() || member.GetUint64() == 0) {
        throw LoaderError(std::string("field '") + name + "' must be a positive integer",
                          context);
    }
    return member.GetUint64();
}

Submission parse_submission(const rapidjson::Value& obj, std::size_t index,
                            const std::string& context);

std::vector<Submission> parse_submissions(const rapidjson::Value& array,
                                          const std::string& context) {
    if (!array.IsArray()) {
        throw LoaderError("must be an array", context);
    }
    std::vector<Submission> result;
    result.reserve(array.Size());
    for (rapidjson::SizeType idx = 0; idx < array.Size(); ++idx) {
        std::string ctx = context + "[" + std::to_string(idx) + "]";
        result.push_back(parse_submission(array[idx], idx, ctx));
    }
    return result;
}

Submission parse_submission(const rapidjson::Value& obj, std::size_t index,
                            const std::string& context) {
    if (!obj.IsObject()) {
        throw LoaderError("submission must be an object", context);
    }

    const auto& kind_value = get_member(obj, "kind", context);
    if (!kind_value.IsString()) {
        throw LoaderError("field 'kind' must be a string", context);
    }

    auto kind = lookup_kind(kind_value.GetString());
    if (!kind) {
        throw LoaderError(std::string("unknown kind '") + kind_value.GetString() + "'", context);
    }

    Submission sub;
    sub.kind = *kind;

    if (obj.HasMember("label")) {
        if (!obj["label"].IsString()) {
            throw LoaderError("field 'label' must be a string", context);
        }
        sub.label = obj["label"].GetString();
    } else {
        sub.label = std::string(to_string(sub.kind)) + "#" + std::to_string(index);
    }

    switch (sub.kind) {
        case SubmissionKind::Timer: {
            int64_t delay = get_ticks_or(obj, "delay", 0, context);
            if (delay < 0) {
                throw LoaderError("field 'delay' must not be negative", context);
            }
            sub.delay = duration_from_ticks(delay);
            break;
        }
        case SubmissionKind::WorkerJob: {
            int64_t duration = get_ticks(obj, "duration", context);
            if (duration <= 0) {
                throw LoaderError("field 'duration' must be positive", context);
            }
            sub.duration = duration_from_ticks(duration);
            break;
        }
        case SubmissionKind::Interval: {
            int64_t period = get_ticks(obj, "period", context);
            if (period <= 0) {
                throw LoaderError("field 'period' must be positive", context);
            }
            sub.period = duration_from_ticks(period);
            if (obj.HasMember("repeat")) {
                sub.repeat = get_positive_uint64(obj, "repeat", context);
            }
            break;
        }
        case SubmissionKind::Immediate:
        case SubmissionKind::Microtask:
        case SubmissionKind::IO:
        case SubmissionKind::Check:
            break;
    }

    if (obj.HasMember("throws")) {
        if (!obj["throws"].IsBool()) {
            throw LoaderError("field 'throws' must be a boolean", context);
        }
        sub.throws = obj["throws"].GetBool();
    }

    if (obj.HasMember("then")) {
        sub.then = parse_submissions(obj["then"], context + ".then");
    }
    return sub;
}

void parse_options(ScenarioOptions& options, const rapidjson::Value& obj) {
    if (!obj.IsObject()) {
        throw LoaderError("must be an object", "options");
    }
    if (obj.HasMember("worker_pool_capacity")) {
        options.worker_pool_capacity = get_positive_uint64(obj, "worker_pool_capacity", "options");
    }
    if (obj.HasMember("livelock_guard")) {
        options.livelock_guard = get_positive_uint64(obj, "livelock_guard", "options");
    }
}

bool any_unbounded(const std::vector<Submission>& subs) {
    for (const auto& sub : subs) {
        if (sub.kind == SubmissionKind::Interval && !sub.repeat) {
            return true;
        }
        if (any_unbounded(sub.then)) {
            return true;
        }
    }
    return false;
}

void write_submissions(rapidjson::Writer<rapidjson::StringBuffer>& writer,
                       const std::vector<Submission>& subs) {
    writer.StartArray();
    for (const auto& sub : subs) {
        writer.StartObject();

        std::string_view kind = to_string(sub.kind);
        writer.Key("kind");
        writer.String(kind.data(), static_cast<rapidjson::SizeType>(kind.size()));

        writer.Key("label");
        writer.String(sub.label.c_str(), static_cast<rapidjson::SizeType>(sub.label.size()));

        switch (sub.kind) {
            case SubmissionKind::Timer:
                writer.Key("delay");
                writer.Int64(duration_to_ticks(sub.delay));
                break;
            case SubmissionKind::WorkerJob:
                writer.Key("duration");
                writer.Int64(duration_to_ticks(sub.duration));
                break;
            case SubmissionKind::Interval:
                writer.Key("period");
                writer.Int64(duration_to_ticks(sub.period));
                if (sub.repeat) {
                    writer.Key("repeat");
                    writer.Uint64(*sub.repeat);
                }
                break;
            case SubmissionKind::Immediate:
            case SubmissionKind::Microtask:
            case SubmissionKind::IO:
            case SubmissionKind::Check:
                break;
        }

        if (sub.throws) {
            writer.Key("throws");
            writer.Bool(true);
        }
        if (!sub.then.empty()) {
            writer.Key("then");
            write_submissions(writer, sub.then);
        }

        writer.EndObject();
    }
    writer.EndArray();
}

} // anonymous namespace

std::string_view to_string(SubmissionKind kind) {
    for (const auto& entry : KIND_NAMES) {
        if (entry.kind == kind) {
            return entry.name;
        }
    }
    throw LoaderError("unknown submission kind " + std::to_string(static_cast<int>(kind)),
                      "kind");
}

SubmissionKind submission_kind_from_string(std::string_view name) {
    if (auto kind = lookup_kind(name)) {
        return *kind;
    }
    throw LoaderError("unknown submission kind '" + std::string(name) + "'", "kind");
}

bool has_unbounded_interval(const ScenarioData& scenario) {
    return any_unbounded(scenario.submissions);
}

ScenarioData load_scenario(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_scenario_from_string(oss.str());
}

ScenarioData load_scenario_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "scenario");
    }

    ScenarioData result;
    if (doc.HasMember("options")) {
        parse_options(result.options, doc["options"]);
    }
    if (doc.HasMember("submissions")) {
        result.submissions = parse_submissions(doc["submissions"], "submissions");
    }
    return result;
}

void write_scenario_to_stream(const ScenarioData& scenario, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();

    const auto& options = scenario.options;
    if (options.worker_pool_capacity || options.livelock_guard) {
        writer.Key("options");
        writer.StartObject();
        if (options.worker_pool_capacity) {
            writer.Key("worker_pool_capacity");
            writer.Uint64(*options.worker_pool_capacity);
        }
        if (options.livelock_guard) {
            writer.Key("livelock_guard");
            writer.Uint64(*options.livelock_guard);
        }
        writer.EndObject();
    }

    writer.Key("submissions");
    write_submissions(writer, scenario.submissions);

    writer.EndObject();

    out << buffer.GetString();
}

void write_scenario(const ScenarioData& scenario, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    write_scenario_to_stream(scenario, file);
}

} // namespace loopsim::io
