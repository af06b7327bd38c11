#include "core/App.h"

#include <cstdio>
#include <cstdlib>
#include <string_view>

namespace {

void usage(const char* argv0) {
  std::printf("usage: %s [--level PATH] [--physics PATH] [--ticks N] [--report-every N]\n",
              argv0);
  std::printf("  --level PATH         Level TOML to simulate (default: built-in test level)\n");
  std::printf("  --physics PATH       Physics tuning TOML\n");
  std::printf("  --ticks N            Run N ticks then exit (default: 600)\n");
  std::printf("  --report-every N     Print body state every N ticks\n");
  std::printf("  -h, --help           Show this help\n");
}

bool parseInt(const char* s, int& out) {
  if (!s || !*s)
    return false;
  char* end = nullptr;
  const long v = std::strtol(s, &end, 10);
  if (!end || *end != '\0')
    return false;
  if (v < 1 || v > 1000000)
    return false;
  out = static_cast<int>(v);
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  AppConfig cfg{};
  cfg.argv0 = argv[0];

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg(argv[i]);
    if (arg == "--level") {
      if (i + 1 >= argc) {
        std::printf("missing --level value\n");
        usage(argv[0]);
        return 1;
      }
      cfg.levelTomlPath = argv[++i];
    } else if (arg == "--physics") {
      if (i + 1 >= argc) {
        std::printf("missing --physics value\n");
        usage(argv[0]);
        return 1;
      }
      cfg.physicsTomlPath = argv[++i];
    } else if (arg == "--ticks") {
      if (i + 1 >= argc || !parseInt(argv[i + 1], cfg.maxTicks)) {
        std::printf("invalid --ticks value\n");
        usage(argv[0]);
        return 1;
      }
      ++i;
    } else if (arg == "--report-every") {
      if (i + 1 >= argc || !parseInt(argv[i + 1], cfg.reportEvery)) {
        std::printf("invalid --report-every value\n");
        usage(argv[0]);
        return 1;
      }
      ++i;
    } else if (arg == "-h" || arg == "--help") {
      usage(argv[0]);
      return 0;
    } else {
      std::printf("unknown option: %s\n", argv[i]);
      usage(argv[0]);
      return 1;
    }
  }

  App app;
  if (!app.init(cfg)) {
    return 1;
  }

  app.run();
  app.shutdown();
  return 0;
}
