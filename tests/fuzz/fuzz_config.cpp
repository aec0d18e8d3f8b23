#include "trustgate/Config.h"
#include <cstddef>
#include <cstdint>
#include <string_view>

using namespace trustgate;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  std::string_view text(reinterpret_cast<const char*>(data), size);
  auto loaded = parse_config_json(text);
  if (loaded.status.ok) (void)config_to_json(loaded.config);
  return 0;
}
