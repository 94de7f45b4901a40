#pragma once

#include <jailer/config_file.hh>
#include <jailer/config_model.hh>
#include <jailer/result.hh>

namespace jailer {

// Names of all variables understood by load_config_model()
[[nodiscard]] const std::vector<const char*>& config_variable_names();

// Maps the variables of @p cf to ConfigModel::Options and validates them.
// Malformed values are reported as violations of the variable they came from.
Result<ConfigModel, ConfigError> load_config_model(const ConfigFile& cf);

// Throws std::runtime_error if the file cannot be read and ConfigFile::ParseError
// on syntax errors
Result<ConfigModel, ConfigError> load_config_model_from_file(const char* path);

} // namespace jailer
