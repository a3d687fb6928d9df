// Standalone Z rescaler launched once per variant in subprocess batch mode.
#include <iostream>
#include <string>

#include "log_service.h"
#include "mesh_rescale.h"

int main(int argc, char** argv) {
  if (argc != 2) {
    std::cerr << "Usage: z_mesh_scaler <scalar.txt>\n"
              << "  line 1: source mesh, line 2: destination mesh\n"
              << "  line 3: z1 z1new, line 4: z2 z2new\n";
    return 1;
  }

  LogService log;
  log.SetListener([](const LogEvent& event) {
    if (event.level == LogLevel::Info) {
      std::cout << event.message << "\n";
    } else {
      const char* tag = event.level == LogLevel::Error ? "error" : "warning";
      std::cerr << tag << ": " << event.message << "\n";
    }
  });

  const MeshRescaleResult result = RescaleMeshFile(argv[1], &log);
  return result.ok ? 0 : 1;
}
