#include <iostream>
#include <string_view>

#ifndef CANOPY_VERSION
#define CANOPY_VERSION "unknown"
#endif

#ifndef CANOPY_UI_UNAVAILABLE_REASON
#define CANOPY_UI_UNAVAILABLE_REASON "UI dependencies are unavailable in this build."
#endif

namespace {

constexpr int kExitCodeOk = 0;
constexpr int kExitCodeUiRequiredUnavailable = 2;

bool has_flag(int argc, char** argv, std::string_view flag) {
  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    if (!arg) continue;
    if (flag == arg) return true;
  }
  return false;
}

void print_usage(const char* exe) {
  const char* name = (exe && *exe) ? exe : "canopy";
  std::cout << "canopy viewer v" << CANOPY_VERSION << "\n\n";
  std::cout << "Usage: " << name << " [--help] [--version] [--require-ui]\n\n";
  std::cout << "This build does not include the interactive viewer.\n";
  std::cout << "Reason: " << CANOPY_UI_UNAVAILABLE_REASON << "\n\n";
  std::cout << "To run the simulation in this build, use:\n";
  std::cout << "  canopy_cli --ticks 200\n\n";
  std::cout << "To build the viewer, install SDL2 and Dear ImGui (with its SDL2 and\n";
  std::cout << "SDL_Renderer2 backends) and reconfigure.\n";
  std::cout << "\nExit codes:\n";
  std::cout << "  " << kExitCodeOk << ": viewer unavailable; informational launch.\n";
  std::cout << "  " << kExitCodeUiRequiredUnavailable << ": viewer explicitly required via --require-ui.\n";
}

}  // namespace

int main(int argc, char** argv) {
  if (has_flag(argc, argv, "--version")) {
    std::cout << CANOPY_VERSION << "\n";
    return 0;
  }

  if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
    print_usage(argv[0]);
    return 0;
  }

  std::cerr << "canopy viewer is unavailable in this build.\n";
  std::cerr << "Reason: " << CANOPY_UI_UNAVAILABLE_REASON << "\n";
  std::cerr << "Run with --help for details.\n";
  if (has_flag(argc, argv, "--require-ui")) return kExitCodeUiRequiredUnavailable;
  return kExitCodeOk;
}
