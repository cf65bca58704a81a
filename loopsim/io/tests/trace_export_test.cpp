#include <loopsim/core/scheduler.hpp>
#include <loopsim/io/error.hpp>
#include <loopsim/io/trace_export.hpp>

#include <gtest/gtest.h>
#include <rapidjson/document.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace loopsim::io;
using namespace loopsim::core;

class TraceExportTest : public ::testing::Test {
protected:
    std::filesystem::path tmp_path(const char* name) {
        return std::filesystem::temp_directory_path() / name;
    }
};

TEST_F(TraceExportTest, EmptyTrace) {
    std::ostringstream oss;
    write_execution_trace({}, oss);

    EXPECT_EQ(oss.str(), "[]\n");
}

TEST_F(TraceExportTest, EntriesCarryTickQueueAndIds) {
    Scheduler sched;
    sched.submit_microtask([] {});
    sched.submit_worker_job(duration_from_ticks(3), [] {});
    ExecutionTrace trace = sched.run();

    std::ostringstream oss;
    write_execution_trace(trace, oss);

    rapidjson::Document doc;
    doc.Parse(oss.str().c_str());
    ASSERT_FALSE(doc.HasParseError());
    ASSERT_TRUE(doc.IsArray());
    ASSERT_EQ(doc.Size(), 2u);

    EXPECT_EQ(doc[0]["tick"].GetInt64(), 0);
    EXPECT_STREQ(doc[0]["queue"].GetString(), "microtask");
    EXPECT_EQ(doc[0]["callback_id"].GetUint64(), trace[0].callback_id);
    EXPECT_FALSE(doc[0].HasMember("job_id"));

    EXPECT_EQ(doc[1]["tick"].GetInt64(), 3);
    EXPECT_STREQ(doc[1]["queue"].GetString(), "io");
    EXPECT_EQ(doc[1]["job_id"].GetUint64(), 1u);
}

TEST_F(TraceExportTest, LoadReadsWrittenTrace) {
    Scheduler sched;
    sched.submit_timer([] {}, duration_from_ticks(4));
    sched.submit_check([] {});
    sched.submit_worker_job(duration_from_ticks(2), [] {});
    ExecutionTrace trace = sched.run();

    auto path = tmp_path("loopsim_test_execution.json");
    {
        std::ofstream out(path);
        write_execution_trace(trace, out);
    }
    ExecutionTrace loaded = load_execution_trace(path);
    std::filesystem::remove(path);

    EXPECT_EQ(loaded, trace);
}

TEST_F(TraceExportTest, LoadRejectsMalformedEntries) {
    auto path = tmp_path("loopsim_test_bad_execution.json");
    {
        std::ofstream out(path);
        out << R"([{"tick": 1, "queue": "poll", "callback_id": 1}])";
    }
    EXPECT_THROW(load_execution_trace(path), LoaderError);

    {
        std::ofstream out(path);
        out << R"([{"tick": 1, "queue": "io"}])";
    }
    EXPECT_THROW(load_execution_trace(path), LoaderError);

    {
        std::ofstream out(path);
        out << R"({"tick": 1})";
    }
    EXPECT_THROW(load_execution_trace(path), LoaderError);
    std::filesystem::remove(path);

    EXPECT_THROW(load_execution_trace("/nonexistent/loopsim_trace.json"), LoaderError);
}

TEST_F(TraceExportTest, LabelLogLines) {
    LabelLog labels{
        {time_from_ticks(0), QueueKind::Immediate, "A"},
        {time_from_ticks(12), QueueKind::IOPhase, "job1"},
    };

    std::ostringstream oss;
    write_label_log(labels, oss);

    EXPECT_EQ(oss.str(),
              "     0 immediate A\n"
              "    12 io        job1\n");
}
