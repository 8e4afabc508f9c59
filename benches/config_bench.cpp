#include "bench_common.hpp"

#include "toolshield/config/config.hpp"

void run_config_benchmark() {
  toolshield::bench::run_bench("config_parse_validate", 2000, [] {
    const auto parsed = toolshield::config::parse_config("[rate_limit]\nmax_calls = 5\n"
                                                         "period_seconds = 30\n");
    if (parsed.ok()) {
      (void)toolshield::config::validate_config(parsed.value());
    }
  });
}
