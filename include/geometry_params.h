#ifndef GEOMETRY_PARAMS_H
#define GEOMETRY_PARAMS_H

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

class LogService;

// Parameter name -> value in millimetres; absent when the name was not found.
using GeometryParameterSet = std::map<std::string, std::optional<double>>;

std::vector<std::string> DefaultGeometryParameterNames();

// Pure scan of file content. For each name the first line of the form
// "<indent><name><whitespace><number>" wins; everything after the number is ignored.
GeometryParameterSet ExtractGeometryParameters(const std::string& content,
                                               const std::vector<std::string>& names);

// Returns false only when the file cannot be read. Missing parameters come back
// as absent entries and are reported as warnings.
bool LoadGeometryParameters(const std::filesystem::path& path,
                            const std::vector<std::string>& names,
                            GeometryParameterSet* out,
                            std::string* error,
                            LogService* log = nullptr);

std::vector<std::string> MissingParameters(const GeometryParameterSet& params);

#endif  // GEOMETRY_PARAMS_H
