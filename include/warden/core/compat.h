#ifndef WARDEN_CORE_COMPAT_H
#define WARDEN_CORE_COMPAT_H

#include <optional>
#include <variant>

namespace warden {

// Vocabulary types, spelled without the std:: prefix in public headers
using std::nullopt;
using std::optional;
using std::variant;

using std::get;
using std::holds_alternative;

}  // namespace warden

#endif  // WARDEN_CORE_COMPAT_H
