#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/PruningPipeline.h"
#include "TestModules.h"
#include <set>

using ::testing::ElementsAre;
using hostdiag::testing_support::make_module;

namespace hostdiag {

class PruningTest : public ::testing::Test {
protected:
    void SetUp() override {
        facts.distro = "ubuntu";
        facts.root = true;
        facts.instance = true;
        facts.perfimpact = false;
        facts.is_executable = [this](const std::string& p){ return available.count(p) != 0; };
    }

    PruningPipeline pipeline(Selection sel = {}) {
        sel.resolve(reg);
        return PruningPipeline(std::move(sel), facts);
    }

    size_t count(const PruningPipeline& p, SkipReason r) {
        auto it = p.histogram().find(r);
        return it == p.histogram().end() ? 0 : it->second;
    }

    std::vector<std::string> names() const {
        std::vector<std::string> out;
        for(const auto& m : reg) out.push_back(m->name());
        return out;
    }

    HostFacts facts;
    std::set<std::string> available{"ping", "ip"};
    ModuleRegistry reg;
    Options options;
};

TEST_F(PruningTest, SudoModuleSkippedWhenNotRoot) {
    facts.root = false;
    auto m = make_module("needsroot", {{"sudo", "True"}});
    reg.append(m);
    reg.append(make_module("plain"));

    auto p = pipeline();
    EXPECT_EQ(p.apply_host_facts(reg), 1u);
    EXPECT_FALSE(m->applicable());
    EXPECT_EQ(m->skip_reason(), "Requires sudo access, but not executing as root.");
    EXPECT_EQ(count(p, SkipReason::RequiresSudo), 1u);
    EXPECT_THAT(names(), ElementsAre("plain"));
    ASSERT_EQ(p.pruned().size(), 1u);
    EXPECT_EQ(p.pruned().front(), m);
}

TEST_F(PruningTest, InstanceCheckedBeforeDistro) {
    facts.instance = false;
    auto m = make_module("ec2only", {{"requires_ec2", "True"}, {"distro", "rhel"}, {"sudo", "True"}});
    reg.append(m);
    auto p = pipeline();
    p.apply_host_facts(reg);
    EXPECT_EQ(m->skip_reason(), "Module requires system be an EC2 instance.");
    EXPECT_TRUE(p.histogram().empty());
}

TEST_F(PruningTest, DistroCheckedBeforePerfimpactAndSudo) {
    facts.root = false;
    auto m = make_module("rhelonly", {{"distro", "rhel"}, {"perfimpact", "True"}, {"sudo", "True"}});
    auto n = make_module("heavy", {{"perfimpact", "True"}, {"sudo", "True"}});
    reg.append(m);
    reg.append(n);
    auto p = pipeline();
    EXPECT_EQ(p.apply_host_facts(reg), 2u);
    EXPECT_EQ(m->skip_reason(), "Not applicable to this distro.");
    EXPECT_EQ(n->skip_reason(), "Requires performance impact okay, but not given.");
    EXPECT_EQ(count(p, SkipReason::PerformanceImpact), 1u);
    EXPECT_EQ(count(p, SkipReason::RequiresSudo), 0u);
    EXPECT_TRUE(reg.empty());
}

TEST_F(PruningTest, PerfimpactAllowedByFacts) {
    facts.perfimpact = true;
    reg.append(make_module("heavy", {{"perfimpact", "True"}}));
    auto p = pipeline();
    EXPECT_EQ(p.apply_host_facts(reg), 0u);
    EXPECT_EQ(reg.size(), 1u);
}

TEST_F(PruningTest, LastMissingSoftwareWins) {
    auto m = make_module("tools", {{"software", "ping tcpdump ethtool"}});
    reg.append(m);
    auto p = pipeline();
    p.apply_host_facts(reg);
    EXPECT_EQ(m->skip_reason(), "Requires missing/non-executable software 'ethtool'.");
    EXPECT_EQ(count(p, SkipReason::MissingSoftware), 1u);
}

TEST_F(PruningTest, AvailableSoftwareKeepsModule) {
    reg.append(make_module("tools", {{"software", "ping ip"}}));
    auto p = pipeline();
    EXPECT_EQ(p.apply_host_facts(reg), 0u);
}

TEST_F(PruningTest, SelectionReasons) {
    auto a = make_module("alpha", {{"domain", "net"}, {"class", "diagnose"}});
    auto b = make_module("bravo", {{"domain", "os"}, {"class", "diagnose"}});
    auto c = make_module("charlie", {{"domain", "net"}, {"class", "collect"}});
    reg.append(a);
    reg.append(b);
    reg.append(c);

    Selection sel;
    sel.domains = {"net"};
    sel.classes = {"diagnose"};
    auto p = pipeline(sel);
    EXPECT_EQ(p.apply_host_facts(reg), 2u);
    EXPECT_EQ(b->skip_reason(), "Not in specified domain to run.");
    EXPECT_EQ(c->skip_reason(), "Not in specified class to run.");
    EXPECT_TRUE(p.histogram().empty());
    EXPECT_THAT(names(), ElementsAre("alpha"));
}

TEST_F(PruningTest, OnlyModulesSelection) {
    auto a = make_module("alpha");
    auto b = make_module("bravo");
    reg.append(a);
    reg.append(b);
    Selection sel;
    sel.modules = {"bravo"};
    auto p = pipeline(sel);
    p.apply_host_facts(reg);
    EXPECT_EQ(a->skip_reason(), "Not specified to run.");
    EXPECT_THAT(names(), ElementsAre("bravo"));
}

TEST_F(PruningTest, ResolveFillsEmptyScopes) {
    reg.append(make_module("alpha", {{"domain", "os net"}, {"class", "gather"}}));
    Selection sel;
    sel.resolve(reg);
    EXPECT_THAT(sel.domains, ElementsAre("net", "os"));
    EXPECT_THAT(sel.classes, ElementsAre("gather"));
    EXPECT_TRUE(sel.modules.empty());
}

TEST_F(PruningTest, ReconcileMissingArgument) {
    auto m = make_module("mtu", {{"required", "mtu"}});
    reg.append(m);
    auto p = pipeline();
    p.reconcile_arguments(reg, options, combined_constraint(reg));
    EXPECT_FALSE(m->applicable());
    EXPECT_EQ(m->skip_reason(), "missing required argument 'mtu'.");

    EXPECT_EQ(p.apply_host_facts(reg), 1u);
    EXPECT_EQ(m->skip_reason(), "missing required argument 'mtu'.");
    EXPECT_EQ(count(p, SkipReason::MissingArgument), 1u);
}

TEST_F(PruningTest, ReconcileEmptyValue) {
    auto m = make_module("mtu", {{"required", "mtu"}});
    reg.append(m);
    options.global_args["mtu"] = "";
    auto p = pipeline();
    p.reconcile_arguments(reg, options, combined_constraint(reg));
    EXPECT_EQ(m->skip_reason(), "missing value for required argument 'mtu'.");
    p.apply_host_facts(reg);
    EXPECT_EQ(count(p, SkipReason::MissingArgument), 1u);
}

TEST_F(PruningTest, ReconcileArgumentSources) {
    auto g = make_module("global", {{"required", "mtu"}});
    auto l = make_module("local", {{"required", "port"}});
    auto o = make_module("optional", {{"optional", "verbose"}});
    reg.append(g);
    reg.append(l);
    reg.append(o);
    options.global_args["mtu"] = "9001";
    options.per_module_args["local"]["port"] = "22";

    auto p = pipeline();
    p.reconcile_arguments(reg, options, combined_constraint(reg));
    EXPECT_TRUE(g->applicable());
    EXPECT_TRUE(l->applicable());
    EXPECT_TRUE(o->applicable());
    EXPECT_EQ(p.apply_host_facts(reg), 0u);
}

TEST_F(PruningTest, ReconcileExplicitExclusion) {
    auto m = make_module("alpha");
    reg.append(m);
    options.global_args["alpha"] = "False";
    auto p = pipeline();
    p.reconcile_arguments(reg, options, combined_constraint(reg));
    EXPECT_FALSE(m->applicable());
    EXPECT_EQ(m->skip_reason(), "explicitly excluded with '--no=alpha'.");
    p.apply_host_facts(reg);
    EXPECT_TRUE(reg.empty());
    EXPECT_TRUE(p.histogram().empty());
}

TEST_F(PruningTest, ArgumentReasonPrecedesHostFacts) {
    facts.root = false;
    auto m = make_module("both", {{"required", "mtu"}, {"sudo", "True"}});
    reg.append(m);
    auto p = pipeline();
    p.reconcile_arguments(reg, options, combined_constraint(reg));
    p.apply_host_facts(reg);
    EXPECT_EQ(m->skip_reason(), "missing required argument 'mtu'.");
    EXPECT_EQ(count(p, SkipReason::RequiresSudo), 0u);
}

TEST_F(PruningTest, CombinedConstraintUnion) {
    reg.append(make_module("a", {{"domain", "net"}, {"software", "ping"}, {"required", "x"}}));
    reg.append(make_module("b", {{"domain", "os"}, {"class", "collect"}}));
    Constraint c = combined_constraint(reg);
    EXPECT_THAT(c.get("domain"), ElementsAre("net", "os"));
    EXPECT_THAT(c.get("class"), ElementsAre("diagnose", "collect"));
    EXPECT_THAT(c.get("software"), ElementsAre("ping"));
    EXPECT_FALSE(c.has("required"));
}

TEST_F(PruningTest, ClassifyReasons) {
    EXPECT_EQ(PruningPipeline::classify("Requires sudo access, but not executing as root."), SkipReason::RequiresSudo);
    EXPECT_EQ(PruningPipeline::classify("missing required argument 'x'."), SkipReason::MissingArgument);
    EXPECT_FALSE(PruningPipeline::classify("Not applicable to this distro.").has_value());
    EXPECT_STREQ(to_string(SkipReason::MissingSoftware), "MISSING_SOFTWARE");
}

} // namespace hostdiag

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
