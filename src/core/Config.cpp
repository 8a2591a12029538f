#include "Config.h"
#include "Utils.h"

namespace hostdiag {

bool is_truthy(const std::string& v) {
    std::string s = utils::to_lower(utils::trim(v));
    return s == "true" || s == "yes" || s == "1" || s == "on";
}

}
