#include "RunSummary.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace hostdiag {

namespace {

void row(std::ostringstream& os, const std::string& label, const std::string& value) {
    os << std::left << std::setw(32) << label << ' ' << value << "\n";
}

size_t skip_count(const SkipHistogram& h, SkipReason r) {
    auto it = h.find(r);
    return it == h.end() ? 0 : it->second;
}

} // namespace

RunSummary RunSummary::build(const ModuleRegistry& executed, const SkipHistogram& skips) {
    RunSummary s;
    s.total_run = executed.size();
    s.skips = skips;
    for(const auto& [cls, mods] : executed.class_map()) s.per_class[cls] = mods.size();

    auto it = executed.class_map().find("diagnose");
    if(it != executed.class_map().end()) {
        for(const auto& mod : it->second) {
            switch(mod->verdict()) {
                case Verdict::Success: ++s.diagnose.successes; break;
                case Verdict::Failure: ++s.diagnose.failures; break;
                case Verdict::Warn: ++s.diagnose.warnings; break;
                case Verdict::Unknown: ++s.diagnose.unknown; break;
                case Verdict::None: break;
            }
        }
        s.diagnose_results = it->second;
        std::stable_sort(s.diagnose_results.begin(), s.diagnose_results.end(), [](const ModulePtr& a, const ModulePtr& b){
            return std::string(to_string(a->verdict())) < std::string(to_string(b->verdict()));
        });
    }
    return s;
}

std::string RunSummary::render() const {
    std::ostringstream os;
    if(per_class.count("diagnose")) {
        os << "\n----------[Diagnostic Results]----------\n\n";
        for(const auto& mod : diagnose_results) {
            row(os, "module " + mod->label(), mod->summary());
            for(const auto& d : mod->details()) row(os, " ", d);
        }
    }

    os << "\n--------------[Run  Stats]--------------\n\n";
    row(os, "Total modules run:", std::to_string(total_run));
    for(const auto& [cls, count] : per_class) {
        row(os, "'" + cls + "' modules run:", std::to_string(count));
        if(cls == "diagnose") {
            row(os, "    successes:", std::to_string(diagnose.successes));
            row(os, "    failures:", std::to_string(diagnose.failures));
            row(os, "    warnings:", std::to_string(diagnose.warnings));
            row(os, "    unknown:", std::to_string(diagnose.unknown));
        }
    }

    if(!skips.empty()) {
        os << "\n" << std::left << std::setw(32) << "Modules not run due to missing:" << ' '
           << std::setw(4) << "sudo" << " | " << std::setw(8) << "software" << " | "
           << std::setw(10) << "parameters" << " | " << std::setw(11) << "perf-impact" << "\n";
        os << std::setw(32) << "" << ' ' << std::right
           << std::setw(4) << skip_count(skips, SkipReason::RequiresSudo) << " | "
           << std::setw(8) << skip_count(skips, SkipReason::MissingSoftware) << " | "
           << std::setw(10) << skip_count(skips, SkipReason::MissingArgument) << " | "
           << std::setw(11) << skip_count(skips, SkipReason::PerformanceImpact) << "\n";
    }
    return os.str();
}

}
