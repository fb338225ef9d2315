#include "bench_common.hpp"

#include "gembridge/config/config.hpp"

void run_config_benchmark() {
  gembridge::bench::run_bench("config_parse_validate", 2000, [] {
    const auto parsed = gembridge::config::parse_config(
        "[gemini]\nbinary = \"gemini\"\ndefault_timeout_secs = 300\n"
        "[observability]\nbackend = \"log\"\n");
    if (parsed.ok()) {
      (void)gembridge::config::validate_config(parsed.value());
    }
  });
}
