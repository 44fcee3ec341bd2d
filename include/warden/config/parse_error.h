#ifndef WARDEN_CONFIG_PARSE_ERROR_H
#define WARDEN_CONFIG_PARSE_ERROR_H

#include <string>

#include <fmt/format.h>

#include "warden/core/error.h"

namespace warden {
namespace config {

/**
 * @brief A rejected configuration value
 *
 * what() reads "warden.yaml:4: servers[0].command: expected a list"; the
 * location and field parts are left out when unknown. line is 1-based, or
 * -1 when the value did not come from a file.
 */
class ConfigParseError : public WardenError {
 public:
  ConfigParseError(const std::string& reason,
                   const std::string& field = "",
                   const std::string& file = "",
                   int line = -1)
      : WardenError(errors::ConfigInvalid,
                    describe(reason, field, file, line)),
        reason_(reason),
        field_(field),
        file_(file),
        line_(line) {}

  const std::string& reason() const { return reason_; }
  const std::string& field() const { return field_; }
  const std::string& file() const { return file_; }
  int line() const { return line_; }

 private:
  static std::string describe(const std::string& reason,
                              const std::string& field,
                              const std::string& file,
                              int line) {
    std::string out;
    if (!file.empty()) {
      out = line > 0 ? fmt::format("{}:{}: ", file, line) : file + ": ";
    }
    if (!field.empty()) {
      out += field + ": ";
    }
    return out + reason;
  }

  std::string reason_;
  std::string field_;
  std::string file_;
  int line_;
};

}  // namespace config
}  // namespace warden

#endif  // WARDEN_CONFIG_PARSE_ERROR_H
