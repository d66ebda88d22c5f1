#pragma once

#include <optional>
#include <string>

namespace courier::common {

struct logging_config final {
  std::string level{"info"};
  std::optional<std::string> file;
  std::string logger_name{"courier"};
};

/// Install the process-wide async logger: colored console sink plus an
/// optional append-mode file sink. Unknown levels fall back to info.
void init_logging(const logging_config& config);

}  // namespace courier::common
