#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/JSONWriter.h"
#include "TestModules.h"
#include <nlohmann/json.hpp>
#include <chrono>

using hostdiag::testing_support::make_module;

namespace hostdiag {

class JSONWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        report.run_dir = "/var/tmp/hostdiag/2024-01-01T00_00_00.000000";
        report.started = std::chrono::system_clock::from_time_t(1700000000);
        report.finished = std::chrono::system_clock::from_time_t(1700000060);
        report.facts.distro = "ubuntu";
        report.facts.net_driver = "ena";
        report.facts.virt_type = "xen";
    }

    RunReport report;
    JSONWriter writer;
};

TEST_F(JSONWriterTest, EmptyReport) {
    std::string json_output = writer.write(report);
    ASSERT_FALSE(json_output.empty());

    nlohmann::json parsed;
    EXPECT_NO_THROW(parsed = nlohmann::json::parse(json_output));
    EXPECT_TRUE(parsed.contains("meta"));
    EXPECT_TRUE(parsed.contains("summary"));
    EXPECT_TRUE(parsed["results"].is_array());
    EXPECT_TRUE(parsed["results"].empty());
    EXPECT_TRUE(parsed["skipped"].empty());
    EXPECT_EQ(parsed["summary"]["modules_run"], 0);
}

TEST_F(JSONWriterTest, MetaCarriesHostFacts) {
    auto parsed = nlohmann::json::parse(writer.write(report));
    const auto& meta = parsed["meta"];
    EXPECT_EQ(meta["tool"], "hostdiag");
    EXPECT_EQ(meta["distro"], "ubuntu");
    EXPECT_EQ(meta["root"], false);
    EXPECT_EQ(meta["instance"], true);
    EXPECT_EQ(meta["net_driver"], "ena");
    EXPECT_EQ(meta["virt_type"], "xen");
    EXPECT_EQ(meta["run_dir"], report.run_dir);
    EXPECT_EQ(meta["started_at"], "2023-11-14T22:13:20Z");
    EXPECT_EQ(meta["finished_at"], "2023-11-14T22:14:20Z");
    EXPECT_FALSE(meta["tool_version"].get<std::string>().empty());
}

TEST_F(JSONWriterTest, ResultsInPlacementOrder) {
    auto pre = make_module("ec2", {{"class", "diagnose"}}, "echo ok\n", "prediagnostic");
    pre->parse_output("[SUCCESS] on ec2");
    auto mtu = make_module("mtu", {{"domain", "net os"}});
    mtu->parse_output("[WARN] jumbo \"frames\"\n-- eth0: 9001\n-- eth1: 1500");
    mtu->set_digest("abc123");
    auto collect = make_module("dmesg", {{"class", "collect"}});
    auto post = make_module("cleanup", {}, "echo ok\n", "postdiagnostic");
    post->parse_output("[SUCCESS] cleaned");

    ModuleRegistry executed;
    executed.append(mtu);
    executed.append(collect);
    report.executed = executed.modules();
    report.prediagnostic = {pre};
    report.postdiagnostic = {post};
    report.summary = RunSummary::build(executed, {});

    auto parsed = nlohmann::json::parse(writer.write(report, true));
    const auto& results = parsed["results"];
    ASSERT_EQ(results.size(), 4u);
    EXPECT_EQ(results[0]["name"], "ec2");
    EXPECT_EQ(results[0]["placement"], "prediagnostic");
    EXPECT_EQ(results[1]["name"], "mtu");
    EXPECT_EQ(results[1]["verdict"], "WARN");
    EXPECT_EQ(results[1]["summary"], "[WARN] jumbo \"frames\"");
    EXPECT_EQ(results[1]["details"], nlohmann::json::array({"-- eth0: 9001", "-- eth1: 1500"}));
    EXPECT_EQ(results[1]["domains"], nlohmann::json::array({"net", "os"}));
    EXPECT_EQ(results[1]["language"], "bash");
    EXPECT_EQ(results[1]["sha256"], "abc123");
    EXPECT_EQ(results[2]["verdict"], "NOT_RUN");
    EXPECT_FALSE(results[2].contains("sha256"));
    EXPECT_EQ(results[3]["placement"], "postdiagnostic");

    const auto& summary = parsed["summary"];
    EXPECT_EQ(summary["modules_run"], 2);
    EXPECT_EQ(summary["classes"]["diagnose"], 1);
    EXPECT_EQ(summary["classes"]["collect"], 1);
    EXPECT_EQ(summary["diagnose"]["warnings"], 1);
    EXPECT_EQ(summary["diagnose"]["successes"], 0);
}

TEST_F(JSONWriterTest, SkippedModulesWithReasons) {
    auto sudo = make_module("tcpdump", {{"sudo", "True"}});
    sudo->mark_not_applicable("Requires sudo");
    auto scoped = make_module("arpcache");
    scoped->mark_not_applicable("Module not selected");
    report.pruned = {sudo, scoped};
    report.summary.skips = {{SkipReason::RequiresSudo, 1}};

    auto parsed = nlohmann::json::parse(writer.write(report));
    ASSERT_EQ(parsed["skipped"].size(), 2u);
    EXPECT_EQ(parsed["skipped"][0]["name"], "tcpdump");
    EXPECT_EQ(parsed["skipped"][0]["placement"], "run");
    EXPECT_EQ(parsed["skipped"][0]["reason"], "Requires sudo");
    EXPECT_EQ(parsed["skipped"][1]["reason"], "Module not selected");
    EXPECT_EQ(parsed["summary"]["skipped"]["sudo"], 1);
    EXPECT_EQ(parsed["summary"]["skipped"]["perf_impact"], 0);
}

TEST_F(JSONWriterTest, PrettyAndCompactAgree) {
    auto mod = make_module("mtu");
    mod->parse_output("[SUCCESS] ok\n-- tab\there");
    report.executed = {mod};
    std::string compact = writer.write(report, false);
    std::string pretty = writer.write(report, true);
    EXPECT_EQ(compact.find('\n'), std::string::npos);
    EXPECT_NE(pretty.find("\n  \"meta\": {"), std::string::npos);
    EXPECT_EQ(nlohmann::json::parse(compact), nlohmann::json::parse(pretty));
    EXPECT_EQ(nlohmann::json::parse(compact)["results"][0]["details"][0], "-- tab\there");
}

} // namespace hostdiag

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
