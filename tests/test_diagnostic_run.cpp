#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/DiagnosticRun.h"
#include "../src/core/Errors.h"
#include "../src/core/Utils.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;
using ::testing::HasSubstr;

namespace hostdiag {

namespace {

std::string module_yaml(const std::string& name, const std::string& placement, const std::string& script,
                        const std::string& cls = "diagnose", const std::string& sudo = "False",
                        const std::string& required = "") {
    std::ostringstream os;
    os << "--- !hostdiag.module\n"
       << "name: " << name << "\n"
       << "path:\n"
       << "version: 1.0\n"
       << "title: " << name << " check\n"
       << "helptext: |\n  Checks " << name << "\n"
       << "placement: " << placement << "\n"
       << "package:\n  -\n"
       << "language: bash\n"
       << "content: |\n  #!/bin/bash\n";
    std::istringstream lines(script);
    for(std::string line; std::getline(lines, line);) os << "  " << line << "\n";
    os << "constraint:\n"
       << "  requires_ec2: False\n"
       << "  domain: net\n"
       << "  class: " << cls << "\n"
       << "  distro: alami ubuntu rhel suse\n"
       << "  required: " << required << "\n"
       << "  optional:\n"
       << "  software:\n"
       << "  sudo: " << sudo << "\n"
       << "  perfimpact: False\n"
       << "  parallelexclusive:\n";
    return os.str();
}

} // namespace

class DiagnosticRunTest : public ::testing::Test {
protected:
    void SetUp() override {
        base = fs::temp_directory_path() / ("hostdiag_run_test_" + std::to_string(::getpid()));
        root = base / "modules";
        fs::create_directories(root / "pre.d");
        fs::create_directories(root / "mod.d");
        fs::create_directories(root / "post.d");

        add("pre.d", module_yaml("ec2check", "prediagnostic", "echo \"[SUCCESS] host reachable\""));
        add("mod.d", module_yaml("alpha", "run",
            "echo \"$HOSTDIAG_DISTRO $HOSTDIAG_SUDO\" > \"$HOSTDIAG_GATHEREDDIR/alpha.txt\"\n"
            "echo \"[SUCCESS] alpha fine\""));
        add("mod.d", module_yaml("beta", "run", "echo \"[WARN] beta degraded\"\necho \"-- eth0 errors\""));
        add("mod.d", module_yaml("gamma", "run", "echo collected", "collect"));
        add("mod.d", module_yaml("rootonly", "run", "echo \"[SUCCESS] root\"", "diagnose", "True"));
        add("mod.d", module_yaml("tuned", "run", "echo \"[SUCCESS] tuned\"", "diagnose", "False", "threshold"));
        add("post.d", module_yaml("cleanup", "postdiagnostic", "echo \"[FAILURE] cleanup incomplete\""));

        cfg.subcommand = "run";
        cfg.workdir = (base / "work").string();
        cfg.module_root = root.string();
        cfg.output_file = (base / "report.json").string();
        cfg.concurrency = 2;

        facts.distro = "ubuntu";
        facts.root = false;
        facts.instance = false;
        facts.net_driver = "ena";
        facts.virt_type = "non-virtualized";
        facts.is_executable = [](const std::string&){ return true; };
    }
    void TearDown() override { fs::remove_all(base); }

    void add(const std::string& dir, const std::string& yaml) {
        static int seq = 0;
        std::ofstream(root / dir / ("m" + std::to_string(seq++) + ".yaml")) << yaml;
    }

    fs::path base, root;
    Config cfg;
    HostFacts facts;
    std::ostringstream console;
};

TEST_F(DiagnosticRunTest, FullRun) {
    std::string rundir;
    {
        DiagnosticRun run(cfg, facts, console);
        EXPECT_EQ(run.execute(), 3u);
        rundir = run.paths().rundir;

        EXPECT_EQ(run.modules().size(), 3u);
        EXPECT_EQ(run.modules().find("alpha")->verdict(), Verdict::Success);
        EXPECT_EQ(run.modules().find("beta")->verdict(), Verdict::Warn);
        EXPECT_EQ(run.modules().find("gamma")->verdict(), Verdict::Unknown);
        EXPECT_EQ(run.prediagnostics().find("ec2check")->verdict(), Verdict::Success);
        EXPECT_EQ(run.postdiagnostics().find("cleanup")->verdict(), Verdict::Failure);

        ASSERT_NE(run.pruning(), nullptr);
        EXPECT_EQ(run.pruning()->pruned().size(), 2u);
        EXPECT_EQ(run.pruning()->histogram().at(SkipReason::RequiresSudo), 1u);
        EXPECT_EQ(run.pruning()->histogram().at(SkipReason::MissingArgument), 1u);
    }

    EXPECT_EQ(fs::path(rundir).parent_path(), fs::path(cfg.workdir));
    EXPECT_TRUE(fs::is_directory(fs::path(rundir) / "mod_out" / "prediagnostic"));
    EXPECT_TRUE(fs::is_directory(fs::path(rundir) / "mod_out" / "postdiagnostic"));
    EXPECT_TRUE(fs::is_directory(fs::path(rundir) / "gathered_out"));
    EXPECT_TRUE(fs::exists(fs::path(rundir) / "Main.log"));
    EXPECT_TRUE(fs::exists(fs::path(rundir) / "RunConfig.ini"));

    auto beta_log = utils::read_file((fs::path(rundir) / "mod_out" / "run" / "beta.log").string());
    ASSERT_TRUE(beta_log.has_value());
    EXPECT_THAT(*beta_log, HasSubstr("[WARN] beta degraded"));

    auto gathered = utils::read_file((fs::path(rundir) / "gathered_out" / "alpha.txt").string());
    ASSERT_TRUE(gathered.has_value());
    EXPECT_EQ(utils::trim(*gathered), "ubuntu False");

    std::string out = console.str();
    EXPECT_THAT(out, HasSubstr("The output logs are located in:\n" + rundir + "\n"));
    EXPECT_THAT(out, HasSubstr("Running Modules:\n"));
    EXPECT_THAT(out, HasSubstr("Total modules run:"));
    EXPECT_THAT(out, HasSubstr("module run/beta"));
    EXPECT_THAT(out, HasSubstr("Please review its contents!"));
    EXPECT_LT(out.find("[Module Run]"), out.find("[Run  Stats]"));

    auto report = utils::read_file(cfg.output_file);
    ASSERT_TRUE(report.has_value());
    auto parsed = nlohmann::json::parse(*report);
    EXPECT_EQ(parsed["meta"]["run_dir"], rundir);
    EXPECT_EQ(parsed["summary"]["modules_run"], 3);
    EXPECT_EQ(parsed["results"].size(), 5u);
    EXPECT_EQ(parsed["results"][0]["name"], "ec2check");
    EXPECT_EQ(parsed["results"][4]["verdict"], "FAILURE");
    EXPECT_EQ(parsed["skipped"].size(), 2u);
}

TEST_F(DiagnosticRunTest, SelectionLimitsModules) {
    cfg.only_modules = {"alpha"};
    cfg.output_file.clear();
    DiagnosticRun run(cfg, facts, console);
    EXPECT_EQ(run.execute(), 1u);
    EXPECT_TRUE(run.modules().contains("alpha"));
    EXPECT_FALSE(fs::exists(base / "report.json"));
}

TEST_F(DiagnosticRunTest, ArgumentEnablesModule) {
    cfg.options.per_module_args["tuned"]["threshold"] = "5";
    DiagnosticRun run(cfg, facts, console);
    run.execute();
    ASSERT_TRUE(run.modules().contains("tuned"));
    EXPECT_EQ(run.modules().find("tuned")->verdict(), Verdict::Success);
    EXPECT_EQ(run.pruning()->histogram().count(SkipReason::MissingArgument), 0u);
}

TEST_F(DiagnosticRunTest, FailingPrediagnosticAborts) {
    add("pre.d", module_yaml("gate", "prediagnostic", "echo \"[FAILURE] not on ec2\""));
    DiagnosticRun run(cfg, facts, console);
    try {
        run.execute();
        FAIL() << "expected PrediagnosticFailure";
    } catch(const PrediagnosticFailure& e) {
        EXPECT_EQ(std::string(e.what()), "Failed prediagnostic check: [FAILURE] not on ec2");
    }
    EXPECT_EQ(run.modules().find("alpha")->verdict(), Verdict::None);
    EXPECT_FALSE(fs::exists(base / "report.json"));
}

TEST_F(DiagnosticRunTest, MissingRunDirectory) {
    fs::remove_all(root / "mod.d");
    DiagnosticRun run(cfg, facts, console);
    EXPECT_THROW(run.execute(), RegistryError);
}

TEST_F(DiagnosticRunTest, OptionalStageDirectories) {
    fs::remove_all(root / "pre.d");
    fs::remove_all(root / "post.d");
    DiagnosticRun run(cfg, facts, console);
    EXPECT_EQ(run.execute(), 3u);
    EXPECT_TRUE(run.prediagnostics().empty());
    EXPECT_TRUE(run.postdiagnostics().empty());
}

TEST_F(DiagnosticRunTest, HostEnvironment) {
    facts.root = true;
    facts.perfimpact = true;
    DiagnosticRun run(cfg, facts, console);
    run.setup_directories();
    run.load_modules();
    Environment env = run.host_environment();
    EXPECT_EQ(env.at("HOSTDIAG_WORKDIR"), cfg.workdir);
    EXPECT_EQ(env.at("HOSTDIAG_RUNDIR"), run.paths().rundir);
    EXPECT_EQ(env.at("HOSTDIAG_LOGDIR"), (fs::path(run.paths().rundir) / "mod_out").string());
    EXPECT_EQ(env.at("HOSTDIAG_CALLPATH"), root.string());
    EXPECT_EQ(env.at("HOSTDIAG_DISTRO"), "ubuntu");
    EXPECT_EQ(env.at("HOSTDIAG_NET_DRIVER"), "ena");
    EXPECT_EQ(env.at("HOSTDIAG_SUDO"), "True");
    EXPECT_EQ(env.at("HOSTDIAG_PERFIMPACT"), "True");
    EXPECT_FALSE(env.at("PATH").empty());
}

TEST_F(DiagnosticRunTest, UnwritableWorkdir) {
    std::ofstream(base / "blocker") << "file";
    cfg.workdir = (base / "blocker").string();
    DiagnosticRun run(cfg, facts, console);
    EXPECT_THROW(run.setup_directories(), RunDirectoryError);
}

} // namespace hostdiag

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
