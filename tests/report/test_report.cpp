/**
 * @file test_report.cpp
 * @brief Verification report document, summary and canonical output
 */

#include "evmverify/report.hpp"

#include "evmverify/inputs.hpp"

#include "../support/temp_dir.hpp"

#include <cstdio>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace evmverify;
using evmverify::report::VerificationReport;
using evmverify::test::read_file;
using evmverify::test::TempDir;

namespace {

VerificationOutcome outcome(const std::string& name,
                            const std::string& address,
                            std::optional<ErrorKind> kind,
                            std::optional<std::string> error)
{
    return VerificationOutcome{.identity = ContractIdentity{.logical_name = name, .address = address},
                               .verified = !kind,
                               .error_kind = kind,
                               .error = std::move(error),
                               .details = nlohmann::json{{"repo", "euler-xyz/euler-vault-kit"}}};
}

VerificationReport sample_report()
{
    VerificationReport report;
    report.verified.push_back(
        outcome("EVault", "0x1111111111111111111111111111111111111111", std::nullopt, std::nullopt));
    report.failed.push_back(outcome("GenericFactory", "0x2222222222222222222222222222222222222222",
                                    ErrorKind::kBytecodeMismatch, "Bytecode mismatch"));
    report.failed.push_back(outcome("Unknown", "0x3333333333333333333333333333333333333333",
                                    ErrorKind::kUnresolved, "No mapping"));
    report.skipped.push_back("Skipped");
    return report;
}

std::string captured(void (*print)(const VerificationReport&, std::FILE*), const VerificationReport& report)
{
    std::FILE* out = std::tmpfile();
    print(report, out);
    std::fflush(out);
    std::rewind(out);
    std::string text;
    char buffer[256];
    while (std::fgets(buffer, sizeof(buffer), out) != nullptr) {
        text += buffer;
    }
    std::fclose(out);
    return text;
}

}  // namespace

TEST(VerificationReport, Summary)
{
    const auto report = sample_report();
    EXPECT_EQ(report.total(), 4U);
    EXPECT_FALSE(report.passed());
    EXPECT_TRUE(VerificationReport{}.passed());

    const auto j = report::to_json(report);
    EXPECT_EQ(j.at("schema_version"), "verification_report.v1");
    EXPECT_EQ(j.at("summary").at("total"), 4);
    EXPECT_EQ(j.at("summary").at("verified"), 1);
    EXPECT_EQ(j.at("summary").at("failed"), 2);
    EXPECT_EQ(j.at("summary").at("skipped"), 1);
    EXPECT_EQ(j.at("skipped"), nlohmann::json::array({"Skipped"}));
}

TEST(VerificationReport, OutcomeFields)
{
    const auto j = report::to_json(sample_report());
    const auto& verified = j.at("verified").at(0);
    EXPECT_EQ(verified.at("name"), "EVault");
    EXPECT_EQ(verified.at("verified"), true);
    EXPECT_TRUE(verified.at("error").is_null());
    EXPECT_TRUE(verified.at("error_kind").is_null());

    const auto& mismatch = j.at("failed").at(0);
    EXPECT_EQ(mismatch.at("error"), "Bytecode mismatch");
    EXPECT_EQ(mismatch.at("error_kind"), "bytecode_mismatch");
    EXPECT_EQ(mismatch.at("details").at("repo"), "euler-xyz/euler-vault-kit");
    EXPECT_EQ(j.at("failed").at(1).at("error_kind"), "unresolved");
}

TEST(VerificationReport, ErrorKindNames)
{
    EXPECT_EQ(to_string(ErrorKind::kUnresolved), "unresolved");
    EXPECT_EQ(to_string(ErrorKind::kBuildFailure), "build_failure");
    EXPECT_EQ(to_string(ErrorKind::kFetchUnavailable), "fetch_unavailable");
    EXPECT_EQ(to_string(ErrorKind::kArtifactNotFound), "artifact_not_found");
    EXPECT_EQ(to_string(ErrorKind::kBytecodeMismatch), "bytecode_mismatch");
}

TEST(VerificationReport, WriteIsCanonical)
{
    TempDir dir("report_write");
    const auto path = dir.path() / "nested/report.json";
    const auto report = sample_report();

    ASSERT_TRUE(report::write_report(path, report, EVMVERIFY_SCHEMA_DIR));
    const std::string first = read_file(path);
    EXPECT_TRUE(first.ends_with("\n"));
    // Keys sorted
    EXPECT_LT(first.find("\"failed\""), first.find("\"schema_version\""));
    EXPECT_LT(first.find("\"schema_version\""), first.find("\"verified\""));

    ASSERT_TRUE(report::write_report(path, report, EVMVERIFY_SCHEMA_DIR));
    EXPECT_EQ(read_file(path), first);

    auto reread = inputs::read_json_file(path);
    ASSERT_TRUE(reread);
    EXPECT_EQ(*reread, report::to_json(report));
}

TEST(VerificationReport, WriteRejectsInvalidDocument)
{
    TempDir dir("report_invalid");
    VerificationReport report;
    // Addresses in reports are canonical lowercase
    report.verified.push_back(
        outcome("EVault", "0x111111111111111111111111111111111111111A", std::nullopt, std::nullopt));

    auto written = report::write_report(dir.path() / "report.json", report, EVMVERIFY_SCHEMA_DIR);
    ASSERT_FALSE(written);
    EXPECT_EQ(written.error().code, "SchemaValidationFailed");
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "report.json"));
}

TEST(VerificationReport, PrintSummary)
{
    const std::string text = captured(&report::print_summary, sample_report());
    EXPECT_NE(text.find("VERIFICATION SUMMARY"), std::string::npos);
    EXPECT_NE(text.find("  Verified: 1\n"), std::string::npos);
    EXPECT_NE(text.find("  Failed:   2\n"), std::string::npos);
    EXPECT_NE(text.find("  Skipped:  1\n"), std::string::npos);
    EXPECT_NE(text.find("  Total:    4\n"), std::string::npos);
    EXPECT_NE(text.find("  - GenericFactory: Bytecode mismatch\n"), std::string::npos);
    EXPECT_NE(text.find("  - Unknown: No mapping\n"), std::string::npos);

    const std::string clean = captured(&report::print_summary, VerificationReport{});
    EXPECT_EQ(clean.find("Skipped"), std::string::npos);
    EXPECT_EQ(clean.find("Failed contracts"), std::string::npos);
}
