#include "config.hpp"
#include <fmt/core.h>
#include <stdexcept>

namespace runbox {
using namespace std;

void engine_config::validate() const {
    if (max_concurrency == 0)
        throw invalid_argument("max_concurrency must be positive");
    if (workspace_root.empty())
        throw invalid_argument("workspace_root must be specified");
    if (max_timeout.count() <= 0)
        throw invalid_argument("max_timeout must be positive");
    if (cleanup_delay.count() < 0)
        throw invalid_argument("cleanup_delay must not be negative");
    if (kill_delay.count() < 0)
        throw invalid_argument("kill_delay must not be negative");
    if (default_max_output_bytes == 0 || default_max_output_bytes > max_output_bytes)
        throw invalid_argument(fmt::format("default_max_output_bytes must be in (0, {}]", max_output_bytes));
    if (max_source_bytes == 0)
        throw invalid_argument("max_source_bytes must be positive");
}

}  // namespace runbox
