#ifndef MESH_RESCALE_H
#define MESH_RESCALE_H

#include <filesystem>
#include <string>

class LogService;

// Breakpoints of the piecewise-linear Z remap.
struct ZRescaleParams {
  double z1 = 0.0;
  double z1_new = 0.0;
  double z2 = 0.0;
  double z2_new = 0.0;
};

// Contents of a scalar-config file; relative paths are already resolved
// against the directory holding the config.
struct ZScalarConfig {
  std::filesystem::path source_mesh;
  std::filesystem::path dest_mesh;
  ZRescaleParams params;
};

struct MeshRescaleResult {
  bool ok = false;
  std::string error;
  long long nodes_rescaled = 0;
  long long lines_passed_through = 0;  // Malformed node-block lines copied as-is.
};

bool LoadZScalarConfig(const std::filesystem::path& path,
                       ZScalarConfig* out,
                       std::string* error);

//   z <= z1       -> z
//   z1 < z <= z2  -> z1_new + (z - z1) * (z2_new - z1_new) / (z2 - z1), z1_new if z2 == z1
//   z > z2        -> z + (z2_new - z2)
double RescaleZ(double z, const ZRescaleParams& params);

// Fixed-width node record: "%-10s, %20.13E, %20.13E, %20.13E".
std::string FormatNodeRecord(const std::string& id, double x, double y, double z);

// Streams config.source_mesh into config.dest_mesh, remapping Z inside *NODE
// blocks. Never throws.
MeshRescaleResult RescaleMesh(const ZScalarConfig& config, LogService* log = nullptr);
MeshRescaleResult RescaleMeshFile(const std::filesystem::path& config_path,
                                  LogService* log = nullptr);

#endif  // MESH_RESCALE_H
