#include <gtest/gtest.h>
#include "hqa/analysis/coordinator.hpp"
#include "hqa/core/config.hpp"
#include "hqa/core/logging.hpp"
#include "hqa/report/json_report.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using namespace hqa;
using namespace hqa::analysis;

class FullAnalysisWorkflowTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "hqa_analysis_workflow_test";
        fs::create_directories(temp_dir);
        previous_logger = spdlog::default_logger();
    }

    void TearDown() override {
        spdlog::set_default_logger(previous_logger);
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    void create_file(const fs::path& relative, const std::string& content) const {
        const auto path = temp_dir / relative;
        fs::create_directories(path.parent_path());
        std::ofstream file(path);
        file << content;
    }

    void create_project() const {
        create_file("project/src/services/order_service.js",
            "import db from 'database';\n"
            "import axios from 'axios';\n"
            "import fs from 'fs';\n"
            "class OrderService {\n"
            "  constructor() {\n"
            "    this.db = new Database();\n"
            "    this.http = new HttpClient();\n"
            "    this.mailer = new Mailer();\n"
            "  }\n"
            "  place(order) {\n"
            "    return this.db.save(order);\n"
            "  }\n"
            "}\n");

        create_file("project/src/utils/math.ts",
            "export function add(a: number, b: number): number {\n"
            "  return a + b;\n"
            "}\n");

        create_file("project/src/generated.js", std::string(1'000'001, ' '));

        create_file("project/node_modules/lib/index.js",
            "class Vendor {\n"
            "  constructor() {\n"
            "    this.a = new Alpha();\n"
            "    this.b = new Beta();\n"
            "    this.c = new Gamma();\n"
            "  }\n"
            "}\n");

        create_file("project/README.md", "# project\n");
    }

    [[nodiscard]] core::Config load_config() const {
        create_file("hqa.toml",
            "[project]\n"
            "ignore_dirs = [\"node_modules\", \"dist\"]\n"
            "\n"
            "[logging]\n"
            "level = \"info\"\n"
            "console = false\n"
            "file = \"" + (temp_dir / "hqa.log").generic_string() + "\"\n");

        auto config = core::Config::load_from_file(temp_dir / "hqa.toml");
        EXPECT_TRUE(config.is_ok());
        return config.value();
    }

    fs::path temp_dir;
    std::shared_ptr<spdlog::logger> previous_logger;
};

TEST_F(FullAnalysisWorkflowTest, ProjectRunProducesScoredReport) {
    create_project();
    const auto config = load_config();
    ASSERT_TRUE(core::configure_logging(config.logging).is_ok());

    const AnalysisCoordinator coordinator(config);
    const auto report = coordinator.analyze_project(temp_dir / "project");

    EXPECT_EQ(report.files_discovered, 3u);
    EXPECT_EQ(report.files_analyzed, 2u);
    ASSERT_EQ(report.skipped.size(), 1u);
    EXPECT_EQ(report.skipped[0].file, "generated.js");
    EXPECT_EQ(report.skipped[0].reason, "file-too-large");

    ASSERT_EQ(report.violations.size(), 2u);
    EXPECT_TRUE(std::ranges::all_of(report.violations, [](const Violation& v) {
        return v.file == "order_service.js" && v.class_name == "OrderService" &&
               v.severity == ViolationSeverity::Medium;
    }));

    ASSERT_EQ(report.file_scores.size(), 2u);
    EXPECT_EQ(report.file_scores[0].file, "order_service.js");
    EXPECT_EQ(report.file_scores[0].score, 94.0);
    EXPECT_EQ(report.file_scores[1].file, "math.ts");
    EXPECT_EQ(report.file_scores[1].score, 100.0);
    EXPECT_DOUBLE_EQ(report.overall_score, 97.0);
    EXPECT_EQ(report.principles.at(Principle::SRP).score, 95.0);
    EXPECT_EQ(report.principles.at(Principle::DIP).score, 95.0);

    EXPECT_EQ(report.metrics.files_analyzed, 2u);
    EXPECT_EQ(report.metrics.security_rejections, 1u);
}

TEST_F(FullAnalysisWorkflowTest, ReportWrittenAsJson) {
    create_project();
    const auto config = load_config();
    ASSERT_TRUE(core::configure_logging(config.logging).is_ok());

    const AnalysisCoordinator coordinator(config);
    const auto report = coordinator.analyze_project(temp_dir / "project", "javascript");
    const auto output = temp_dir / "reports" / "hqa-report.json";

    ASSERT_TRUE(report::write_json_report(output, report::build_project_report(report)).is_ok());

    std::ifstream file(output);
    const auto json = nlohmann::json::parse(file);
    EXPECT_EQ(json["tool"], "hqa");
    EXPECT_EQ(json["summary"]["files_discovered"], 2);
    EXPECT_EQ(json["summary"]["files_analyzed"], 1);
    EXPECT_EQ(json["summary"]["violations"], 2);
    EXPECT_EQ(json["principles"]["DIP"]["violations"], 1);
    EXPECT_EQ(json["skipped"][0]["reason"], "file-too-large");

    const auto& violations = json["violations"];
    ASSERT_EQ(violations.size(), 2u);
    EXPECT_EQ(violations[0]["principle"], "SRP");
    EXPECT_EQ(violations[1]["principle"], "DIP");
    EXPECT_EQ(violations[1]["metrics"]["dependencies"], 3);
    EXPECT_EQ(violations[1]["description"], "Class 'OrderService' instantiates 3 concrete dependencies");

    spdlog::default_logger()->flush();
    std::ifstream log(temp_dir / "hqa.log");
    std::stringstream buffer;
    buffer << log.rdbuf();
    EXPECT_NE(buffer.str().find("Project analysis complete"), std::string::npos);
    EXPECT_EQ(buffer.str().find(temp_dir.string()), std::string::npos);
}

TEST_F(FullAnalysisWorkflowTest, FindingsAndPrinciplesOverSameFile) {
    create_project();
    const AnalysisCoordinator coordinator;
    const auto path = temp_dir / "project" / "src" / "services" / "order_service.js";

    const auto findings = coordinator.analyze_file(path, "js");
    const auto report = coordinator.analyze_files({path});

    EXPECT_TRUE(findings.empty());
    EXPECT_EQ(report.violations.size(), 2u);
    EXPECT_EQ(coordinator.get_metrics().files_analyzed, 2u);
}
