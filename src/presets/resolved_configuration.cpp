#include "resolved_configuration.hpp"

bool ResolvedConfiguration::operator==(const ResolvedConfiguration& other) const {
    return kind == other.kind &&
           preset_name == other.preset_name &&
           display_name == other.display_name &&
           description == other.description &&
           generator == other.generator &&
           binary_dir == other.binary_dir &&
           install_dir == other.install_dir &&
           toolchain_file == other.toolchain_file &&
           target_executable == other.target_executable &&
           cache_variables == other.cache_variables &&
           environment == other.environment &&
           unset_environment == other.unset_environment &&
           configure_preset == other.configure_preset &&
           configuration == other.configuration &&
           targets == other.targets &&
           jobs == other.jobs;
}
