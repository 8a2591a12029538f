#include "JSONWriter.h"
#include "JsonUtil.h"
#include "BuildInfo.h"
#include <map>
#include <sstream>
#include <sys/utsname.h>

namespace hostdiag {
namespace {

    struct HostMeta {
        std::string hostname;
        std::string kernel;
        std::string arch;
    };

    // Ordered JSON value; objects keep insertion order.
    struct JVal {
        enum Type { T_OBJ, T_ARR, T_STR, T_NUM, T_BOOL } type = T_OBJ;
        std::vector<std::pair<std::string, JVal>> obj;
        std::vector<JVal> arr;
        std::string str; // string text or number/bool token
        JVal() = default;
        explicit JVal(Type t): type(t) {}
        static JVal s(const std::string& v){ JVal j(T_STR); j.str = v; return j; }
        static JVal n(size_t v){ JVal j(T_NUM); j.str = std::to_string(v); return j; }
        static JVal b(bool v){ JVal j(T_BOOL); j.str = v ? "true" : "false"; return j; }
        JVal& put(const std::string& k, JVal v){ obj.emplace_back(k, std::move(v)); return obj.back().second; }
        void push(JVal v){ arr.push_back(std::move(v)); }
    };

    using jsonutil::escape; using jsonutil::time_to_iso;

    static HostMeta collect_uname_info() {
        HostMeta h;
        struct utsname u{};
        if (uname(&u) == 0) {
            h.kernel = u.release;
            h.arch = u.machine;
            h.hostname = u.nodename;
        }
        return h;
    }

    static void emit(const JVal& v, std::ostream& os, bool pretty, int depth) {
        auto indent = [&](int d){ if(pretty){ os << '\n'; for(int i=0;i<d;++i) os << "  "; } };
        switch (v.type) {
            case JVal::T_STR: os << '"' << escape(v.str) << '"'; break;
            case JVal::T_NUM:
            case JVal::T_BOOL: os << v.str; break;
            case JVal::T_ARR: {
                os << '[';
                bool first = true;
                for (const auto& e : v.arr) {
                    if (!first) os << ',';
                    first = false;
                    indent(depth + 1);
                    emit(e, os, pretty, depth + 1);
                }
                if (!v.arr.empty()) indent(depth);
                os << ']';
                break;
            }
            case JVal::T_OBJ: {
                os << '{';
                bool first = true;
                for (const auto& kv : v.obj) {
                    if (!first) os << ',';
                    first = false;
                    indent(depth + 1);
                    os << '"' << escape(kv.first) << "\":" << (pretty ? " " : "");
                    emit(kv.second, os, pretty, depth + 1);
                }
                if (!v.obj.empty()) indent(depth);
                os << '}';
                break;
            }
        }
    }

    static JVal string_array(const std::vector<std::string>& items) {
        JVal a(JVal::T_ARR);
        for (const auto& i : items) a.push(JVal::s(i));
        return a;
    }

    static JVal module_result(const Module& mod) {
        JVal o;
        o.put("name", JVal::s(mod.name()));
        o.put("placement", JVal::s(to_string(mod.placement())));
        o.put("language", JVal::s(to_string(mod.language())));
        o.put("version", JVal::s(mod.version()));
        o.put("classes", string_array(mod.constraint().get("class")));
        o.put("domains", string_array(mod.constraint().get("domain")));
        o.put("verdict", JVal::s(mod.verdict() == Verdict::None ? "NOT_RUN" : to_string(mod.verdict())));
        o.put("summary", JVal::s(mod.summary()));
        o.put("details", string_array(mod.details()));
        if (!mod.digest().empty()) o.put("sha256", JVal::s(mod.digest()));
        return o;
    }

    static JVal build_meta(const RunReport& r) {
        HostMeta host = collect_uname_info();
        JVal meta;
        meta.put("tool", JVal::s("hostdiag"));
        meta.put("tool_version", JVal::s(buildinfo::APP_VERSION));
        meta.put("hostname", JVal::s(host.hostname));
        meta.put("kernel", JVal::s(host.kernel));
        meta.put("arch", JVal::s(host.arch));
        meta.put("distro", JVal::s(r.facts.distro));
        meta.put("root", JVal::b(r.facts.root));
        meta.put("instance", JVal::b(r.facts.instance));
        meta.put("net_driver", JVal::s(r.facts.net_driver));
        meta.put("virt_type", JVal::s(r.facts.virt_type));
        meta.put("run_dir", JVal::s(r.run_dir));
        meta.put("started_at", JVal::s(time_to_iso(r.started)));
        meta.put("finished_at", JVal::s(time_to_iso(r.finished)));
        return meta;
    }

    static JVal build_summary(const RunSummary& s) {
        JVal sum;
        sum.put("modules_run", JVal::n(s.total_run));
        JVal& classes = sum.put("classes", JVal());
        for (const auto& [cls, count] : s.per_class) classes.put(cls, JVal::n(count));
        JVal& diag = sum.put("diagnose", JVal());
        diag.put("successes", JVal::n(s.diagnose.successes));
        diag.put("failures", JVal::n(s.diagnose.failures));
        diag.put("warnings", JVal::n(s.diagnose.warnings));
        diag.put("unknown", JVal::n(s.diagnose.unknown));
        JVal& skipped = sum.put("skipped", JVal());
        auto count = [&](SkipReason r){ auto it = s.skips.find(r); return it == s.skips.end() ? size_t(0) : it->second; };
        skipped.put("sudo", JVal::n(count(SkipReason::RequiresSudo)));
        skipped.put("software", JVal::n(count(SkipReason::MissingSoftware)));
        skipped.put("parameters", JVal::n(count(SkipReason::MissingArgument)));
        skipped.put("perf_impact", JVal::n(count(SkipReason::PerformanceImpact)));
        return sum;
    }

} // namespace

std::string JSONWriter::write(const RunReport& report, bool pretty) const {
    JVal root;
    root.put("meta", build_meta(report));
    root.put("summary", build_summary(report.summary));

    JVal results(JVal::T_ARR);
    for (const auto* group : {&report.prediagnostic, &report.executed, &report.postdiagnostic})
        for (const auto& mod : *group) results.push(module_result(*mod));
    root.put("results", std::move(results));

    JVal skipped(JVal::T_ARR);
    for (const auto& mod : report.pruned) {
        JVal o;
        o.put("name", JVal::s(mod->name()));
        o.put("placement", JVal::s(to_string(mod->placement())));
        o.put("reason", JVal::s(mod->skip_reason()));
        skipped.push(std::move(o));
    }
    root.put("skipped", std::move(skipped));

    std::ostringstream os;
    emit(root, os, pretty, 0);
    if (pretty) os << '\n';
    return os.str();
}

}
