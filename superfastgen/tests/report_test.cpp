#include "report/run_report.hpp"

#include <gtest/gtest.h>
#include <sstream>

using namespace sfg;
using namespace sfg::report;

class RunReportTest : public ::testing::Test {
protected:
    static auto diag(DiagnosticKind kind, std::string message) -> Diagnostic {
        return Diagnostic{.kind = kind,
                          .path = "lib/user.dart",
                          .declaration = "User",
                          .message = std::move(message),
                          .line = 7,
                          .column = 3};
    }
};

TEST_F(RunReportTest, SeverityRouting) {
    RunReport report;
    report.add(diag(DiagnosticKind::Extraction, "missing part directive"));
    report.add(diag(DiagnosticKind::UnsupportedType, "Function types"));
    report.add(diag(DiagnosticKind::Parse, "expected '}'"));
    EXPECT_EQ(report.warnings.size(), 2u);
    EXPECT_EQ(report.errors.size(), 1u);
    EXPECT_FALSE(report.fatal);
    EXPECT_TRUE(report.has_errors());

    report.add(diag(DiagnosticKind::Config, "bad key"));
    EXPECT_TRUE(report.fatal);
    EXPECT_EQ(severity_of(DiagnosticKind::Watch), Severity::Fatal);
    EXPECT_EQ(kind_name(DiagnosticKind::UnsupportedType), "unsupported-type");
}

TEST_F(RunReportTest, Merge) {
    RunReport a;
    a.files_processed = 2;
    a.files_written = 1;
    a.declarations_emitted_by_variant = {1, 0, 2};
    a.companions_by_variant = {1, 0, 1};
    RunReport b;
    b.files_processed = 1;
    b.files_unchanged = 1;
    b.files_removed = 3;
    b.declarations_emitted_by_variant = {0, 1, 0};
    b.add(diag(DiagnosticKind::Write, "rename failed"));

    a.merge(b);
    EXPECT_EQ(a.files_processed, 3u);
    EXPECT_EQ(a.files_unchanged, 1u);
    EXPECT_EQ(a.files_removed, 3u);
    EXPECT_EQ(a.emitted(model::VariantTag::JsonCodec), 1u);
    EXPECT_EQ(a.emitted(model::VariantTag::Provider), 2u);
    EXPECT_EQ(a.errors.size(), 1u);
}

TEST_F(RunReportTest, Summary) {
    RunReport report;
    report.files_processed = 3;
    report.files_written = 2;
    report.files_unchanged = 1;
    report.companions_by_variant = {1, 0, 2};
    report.add(diag(DiagnosticKind::Conflict, "@freezed and @riverpod"));

    std::ostringstream out;
    report.write_summary(out);
    auto text = out.str();
    EXPECT_NE(text.find("Generated 1 companion files for variant freezed\n"), std::string::npos);
    EXPECT_NE(text.find("Generated 2 companion files for variant riverpod\n"), std::string::npos);
    EXPECT_EQ(text.find("variant json"), std::string::npos);
    EXPECT_NE(text.find("3 files processed, 2 written, 1 unchanged, 0 warning(s), 1 error(s)\n"),
              std::string::npos);
    EXPECT_NE(text.find("  error[conflict] lib/user.dart:7:3 (User): @freezed and @riverpod\n"),
              std::string::npos);
}

TEST_F(RunReportTest, Json) {
    RunReport report;
    report.files_processed = 1;
    report.files_written = 1;
    report.declarations_emitted_by_variant = {1, 1, 0};
    report.add(diag(DiagnosticKind::UnsupportedType, "onTap: void Function(): \"Function\""));

    std::ostringstream out;
    report.write_json(out);
    auto json = out.str();
    EXPECT_EQ(json.rfind("{\"files_processed\":1,\"files_written\":1,", 0), 0u);
    EXPECT_NE(json.find("\"declarations_emitted_by_variant\":{\"freezed\":1,\"json\":1,"
                        "\"riverpod\":0}"),
              std::string::npos);
    EXPECT_NE(json.find("{\"kind\":\"unsupported-type\",\"path\":\"lib/user.dart\","
                        "\"declaration\":\"User\",\"message\":\"onTap: void Function(): "
                        "\\\"Function\\\"\",\"line\":7,\"column\":3}"),
              std::string::npos);
    EXPECT_NE(json.find("\"errors\":[],\"fatal\":false}\n"), std::string::npos);
}
