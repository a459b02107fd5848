#pragma once

#include <map>
#include <string>

#include "runtime/value.hpp"

namespace mathguard::runtime::modules {

using MemberTable = std::map<std::string, Value>;

MemberTable MathMembers();
MemberTable CmathMembers();
MemberTable FractionsMembers();
MemberTable DecimalMembers();
MemberTable ItertoolsMembers();
MemberTable FunctoolsMembers();
MemberTable OperatorMembers();
MemberTable StatisticsMembers();
MemberTable RandomMembers();

// Native member table of a module the runtime implements; false for any
// other name.
bool NativeModule(const std::string& name, MemberTable& out);

}  // namespace mathguard::runtime::modules
