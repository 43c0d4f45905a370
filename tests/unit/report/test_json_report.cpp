#include <gtest/gtest.h>
#include "hqa/report/json_report.hpp"

#include <filesystem>
#include <fstream>

using namespace hqa;
using namespace hqa::report;
using json = nlohmann::json;
namespace fs = std::filesystem;

class JsonReportTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "hqa_json_report_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    static Violation make_violation() {
        Violation v;
        v.principle = Principle::DIP;
        v.severity = ViolationSeverity::Medium;
        v.file = "service.js";
        v.line = 3;
        v.class_name = "Service";
        v.description = "Class 'Service' instantiates 3 concrete dependencies";
        v.explanation = "x";
        v.impact = "y";
        v.suggestion = "z";
        ViolationMetrics m;
        m.dependencies = 3;
        v.metrics = m;
        return v;
    }

    fs::path temp_dir;
};

TEST_F(JsonReportTest, Finding) {
    Finding finding;
    finding.type = FindingType::WeakEquality;
    finding.message = "Expected '===' and instead saw '=='";
    finding.severity = Severity::Warning;
    finding.line = 4;
    finding.column = 7;
    finding.rule = "eqeqeq";
    finding.suggestion = "Use ===";

    const json j = finding;

    EXPECT_EQ(j["type"], "weak-equality");
    EXPECT_EQ(j["severity"], "warning");
    EXPECT_EQ(j["line"], 4);
    EXPECT_EQ(j["column"], 7);
    EXPECT_EQ(j["rule"], "eqeqeq");
}

TEST_F(JsonReportTest, ViolationWithOptionalFields) {
    const json j = make_violation();

    EXPECT_EQ(j["principle"], "DIP");
    EXPECT_EQ(j["severity"], "medium");
    EXPECT_EQ(j["line"], 3);
    EXPECT_EQ(j["class"], "Service");
    EXPECT_FALSE(j.contains("method"));
    EXPECT_EQ(j["metrics"]["dependencies"], 3);
}

TEST_F(JsonReportTest, ViolationOmitsUnsetFields) {
    Violation v;
    v.file = "a.js";

    const json j = v;

    EXPECT_FALSE(j.contains("line"));
    EXPECT_FALSE(j.contains("class"));
    EXPECT_FALSE(j.contains("metrics"));
    EXPECT_EQ(j["principle"], "SRP");
}

TEST_F(JsonReportTest, ProjectReport) {
    analysis::ProjectReport report;
    report.files_discovered = 3;
    report.files_analyzed = 2;
    report.skipped.push_back({"big.js", "file-too-large"});
    report.file_scores.push_back({"service.js", 97.0, 1});
    report.file_scores.push_back({"util.js", 100.0, 0});
    report.violations.push_back(make_violation());
    analysis::compute_scores(report, {Principle::SRP, Principle::DIP});
    report.metrics.files_analyzed = 2;

    const auto j = build_project_report(report);

    EXPECT_EQ(j["tool"], "hqa");
    EXPECT_EQ(j["version"], "0.4.0");
    EXPECT_TRUE(j["generated_at"].is_string());
    EXPECT_EQ(j["summary"]["files_discovered"], 3);
    EXPECT_EQ(j["summary"]["files_analyzed"], 2);
    EXPECT_EQ(j["summary"]["files_skipped"], 1);
    EXPECT_EQ(j["summary"]["violations"], 1);
    EXPECT_DOUBLE_EQ(j["summary"]["overall_score"].get<double>(), 98.5);
    EXPECT_EQ(j["principles"]["SRP"]["violations"], 0);
    EXPECT_DOUBLE_EQ(j["principles"]["DIP"]["score"].get<double>(), 95.0);
    ASSERT_EQ(j["files"].size(), 2u);
    EXPECT_EQ(j["files"][0]["file"], "service.js");
    EXPECT_EQ(j["skipped"][0]["reason"], "file-too-large");
    ASSERT_EQ(j["violations"].size(), 1u);
    EXPECT_EQ(j["metrics"]["files_analyzed"], 2);
}

TEST_F(JsonReportTest, FileReport) {
    Finding finding;
    finding.type = FindingType::DebugStatement;

    const auto j = build_file_report("app.js", {finding, finding});

    EXPECT_EQ(j["file"], "app.js");
    EXPECT_EQ(j["count"], 2);
    EXPECT_EQ(j["findings"][1]["type"], "debug-statement");
}

TEST_F(JsonReportTest, WriteReport) {
    const auto path = temp_dir / "out" / "report.json";

    ASSERT_TRUE(write_json_report(path, build_file_report("a.js", {})).is_ok());

    std::ifstream file(path);
    const auto parsed = json::parse(file);
    EXPECT_EQ(parsed["count"], 0);
    EXPECT_TRUE(parsed["findings"].is_array());
}
