#include <loopsim/io/trace_export.hpp>
#include <loopsim/io/error.hpp>

#include <loopsim/core/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>

namespace loopsim::io {

namespace {

using namespace loopsim::core;

uint64_t get_uint64(const rapidjson::Value& obj, const char* name, const std::string& context) {
    if (!obj.HasMember(name) || !obj[name].IsUint64()) {
        throw LoaderError(std::string("field '") + name + "' must be a non-negative integer",
                          context);
    }
    return obj[name].GetUint64();
}

} // anonymous namespace

void write_execution_trace(const ExecutionTrace& trace, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartArray();
    for (const auto& entry : trace) {
        writer.StartObject();

        writer.Key("tick");
        writer.Int64(time_to_ticks(entry.time));

        std::string_view queue = to_string(entry.queue);
        writer.Key("queue");
        writer.String(queue.data(), static_cast<rapidjson::SizeType>(queue.size()));

        writer.Key("callback_id");
        writer.Uint64(entry.callback_id);

        if (entry.job_id != 0) {
            writer.Key("job_id");
            writer.Uint64(entry.job_id);
        }

        writer.EndObject();
    }
    writer.EndArray();

    out << buffer.GetString() << "\n";
}

ExecutionTrace load_execution_trace(const std::filesystem::path& path) {
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
        throw LoaderError("execution trace must be a JSON array", path.string());
    }

    ExecutionTrace trace;
    trace.reserve(doc.Size());
    for (rapidjson::SizeType idx = 0; idx < doc.Size(); ++idx) {
        const auto& obj = doc[idx];
        std::string ctx = "[" + std::to_string(idx) + "]";
        if (!obj.IsObject()) {
            throw LoaderError("entry must be an object", ctx);
        }
        if (!obj.HasMember("queue") || !obj["queue"].IsString()) {
            throw LoaderError("field 'queue' must be a string", ctx);
        }

        TraceEntry entry;
        entry.time = time_from_ticks(static_cast<int64_t>(get_uint64(obj, "tick", ctx)));
        try {
            entry.queue = queue_kind_from_string(obj["queue"].GetString());
        } catch (const InvalidQueueError& e) {
            throw LoaderError(e.what(), ctx);
        }
        entry.callback_id = get_uint64(obj, "callback_id", ctx);
        if (obj.HasMember("job_id")) {
            entry.job_id = get_uint64(obj, "job_id", ctx);
        }
        trace.push_back(entry);
    }
    return trace;
}

void write_label_log(const LabelLog& labels, std::ostream& out) {
    for (const auto& entry : labels) {
        out << std::setw(6) << time_to_ticks(entry.time) << " "
            << std::left << std::setw(9) << to_string(entry.queue) << std::right << " "
            << entry.label << "\n";
    }
}

} // namespace loopsim::io
