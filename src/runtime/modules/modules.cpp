#include "runtime/modules/modules.hpp"

#include <functional>

namespace mathguard::runtime::modules {

bool NativeModule(const std::string& name, MemberTable& out) {
    static const std::map<std::string, std::function<MemberTable()>> factories = {
        {"math", MathMembers},
        {"cmath", CmathMembers},
        {"fractions", FractionsMembers},
        {"decimal", DecimalMembers},
        {"itertools", ItertoolsMembers},
        {"functools", FunctoolsMembers},
        {"operator", OperatorMembers},
        {"statistics", StatisticsMembers},
        {"random", RandomMembers},
    };
    auto it = factories.find(name);
    if (it == factories.end()) {
        return false;
    }
    out = it->second();
    return true;
}

}  // namespace mathguard::runtime::modules
