#include "ConfigReader.hpp"
#include <iostream>
#include <fstream>
#include <algorithm>
#include <cctype>
#include <limits>

namespace SEBM {

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }
    return parseStream(file);
}

bool ConfigReader::loadString(const std::string& text) {
    std::istringstream in(text);
    return parseStream(in);
}

bool ConfigReader::parseStream(std::istream& in) {
    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(in, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header [section]
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }

    return true;
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> ConfigReader::split(const std::string& str, char delim) const {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }

    return result;
}

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                   const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                        int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    int result = default_val;
    if (!parseInt(val, result)) {
        std::cerr << "Warning: Cannot parse [" << section << "] " << key
                  << " = '" << val << "' as integer, using " << default_val << std::endl;
        return default_val;
    }
    return result;
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    double result = default_val;
    if (!parseDouble(val, result)) {
        std::cerr << "Warning: Cannot parse [" << section << "] " << key
                  << " = '" << val << "' as double, using " << default_val << std::endl;
        return default_val;
    }
    return result;
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                          bool default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    std::transform(val.begin(), val.end(), val.begin(), ::tolower);

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    return default_val;
}

std::uint64_t ConfigReader::getUInt64(const std::string& section, const std::string& key,
                                      std::uint64_t default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    std::uint64_t result = default_val;
    if (!parseUInt64(val, result)) {
        std::cerr << "Warning: Cannot parse [" << section << "] " << key
                  << " = '" << val << "' as unsigned integer, using " << default_val << std::endl;
        return default_val;
    }
    return result;
}

std::vector<double> ConfigReader::getDoubleArray(const std::string& section,
                                                 const std::string& key) const {
    std::vector<double> result;
    std::string val = getString(section, key);
    if (val.empty()) return result;

    auto tokens = split(val, ',');
    for (const auto& token : tokens) {
        double x = 0.0;
        if (parseDouble(token, x)) {
            result.push_back(x);
        } else {
            std::cerr << "Warning: Cannot parse '" << token << "' as double" << std::endl;
        }
    }

    return result;
}

// The whole value must be consumed; "1e5" is not an integer and "0.01s"
// is not a double.

bool ConfigReader::parseInt(const std::string& text, int& value) {
    try {
        size_t pos = 0;
        const long v = std::stol(text, &pos);
        if (pos != text.size()) return false;
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
            return false;
        }
        value = static_cast<int>(v);
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

bool ConfigReader::parseDouble(const std::string& text, double& value) {
    try {
        size_t pos = 0;
        const double v = std::stod(text, &pos);
        if (pos != text.size()) return false;
        value = v;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

bool ConfigReader::parseUInt64(const std::string& text, std::uint64_t& value) {
    // stoull silently wraps negative input
    if (text.empty() || text[0] == '-') return false;
    try {
        size_t pos = 0;
        const unsigned long long v = std::stoull(text, &pos);
        if (pos != text.size()) return false;
        value = static_cast<std::uint64_t>(v);
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    std::vector<std::string> sections;
    for (const auto& pair : data) {
        sections.push_back(pair.first);
    }
    return sections;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        for (const auto& pair : sec_it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

// =============================================================================
// Record Parsing
// =============================================================================

bool ConfigReader::parsePhysicalParameters(PhysicalParameters& p) const {
    if (!hasSection("physics")) return false;

    p.solar_constant = getDouble("physics", "solar_constant", p.solar_constant);
    p.reference_temperature = getDouble("physics", "reference_temperature", p.reference_temperature);
    p.emissivity = getDouble("physics", "emissivity", p.emissivity);
    p.stefan_boltzmann = getDouble("physics", "stefan_boltzmann", p.stefan_boltzmann);
    p.albedo_ice = getDouble("physics", "albedo_ice", p.albedo_ice);
    p.albedo_water = getDouble("physics", "albedo_water", p.albedo_water);
    p.transition_temperature = getDouble("physics", "transition_temperature", p.transition_temperature);
    p.transition_width = getDouble("physics", "transition_width", p.transition_width);
    p.albedo_relaxation_rate = getDouble("physics", "albedo_relaxation_rate", p.albedo_relaxation_rate);
    p.noise_temperature = getDouble("physics", "noise_temperature", p.noise_temperature);
    p.noise_albedo = getDouble("physics", "noise_albedo", p.noise_albedo);

    return true;
}

bool ConfigReader::parseInitialState(ClimateState& state) const {
    if (!hasSection("initial")) return false;

    state.temperature = getDouble("initial", "temperature", state.temperature);
    state.albedo = getDouble("initial", "albedo", state.albedo);

    return true;
}

bool ConfigReader::parseDeterministicConfig(DeterministicConfig& config) const {
    if (!hasSection("deterministic")) return false;

    config.start_time = getDouble("deterministic", "start_time", config.start_time);
    config.end_time = getDouble("deterministic", "end_time", config.end_time);
    config.num_samples = getInt("deterministic", "num_samples", config.num_samples);
    config.max_internal_dt = getDouble("deterministic", "max_internal_dt", config.max_internal_dt);

    return true;
}

bool ConfigReader::parseEquilibriumConfig(EquilibriumConfig& config) const {
    if (!hasSection("equilibrium")) return false;

    if (hasKey("equilibrium", "guesses")) {
        std::vector<double> guesses = getDoubleArray("equilibrium", "guesses");
        if (!guesses.empty()) config.guesses = guesses;
    }
    config.tolerance = getDouble("equilibrium", "tolerance", config.tolerance);
    config.max_iterations = getInt("equilibrium", "max_iterations", config.max_iterations);
    config.merge_tolerance = getDouble("equilibrium", "merge_tolerance", config.merge_tolerance);

    return true;
}

bool ConfigReader::parseEnsembleConfig(EnsembleConfig& config) const {
    if (!hasSection("ensemble")) return false;

    config.start_time = getDouble("ensemble", "start_time", config.start_time);
    config.dt = getDouble("ensemble", "dt", config.dt);
    config.num_steps = getInt("ensemble", "num_steps", config.num_steps);
    config.num_runs = getInt("ensemble", "num_runs", config.num_runs);
    config.num_threads = getInt("ensemble", "num_threads", config.num_threads);
    config.burn_in_steps = getInt("ensemble", "burn_in_steps", config.burn_in_steps);
    config.discard_diverged = getBool("ensemble", "discard_diverged", config.discard_diverged);

    if (hasKey("ensemble", "seed") && !getString("ensemble", "seed").empty()) {
        config.seed = getUInt64("ensemble", "seed", config.seed);
        config.has_seed = true;
    }

    return true;
}

bool ConfigReader::parseOutputConfig(OutputConfig& config) const {
    if (!hasSection("output")) return false;

    config.prefix = getString("output", "prefix", config.prefix);
    config.write_trajectory = getBool("output", "write_trajectory", config.write_trajectory);
    config.write_ensemble = getBool("output", "write_ensemble", config.write_ensemble);
    config.write_statistics = getBool("output", "write_statistics", config.write_statistics);

    return true;
}

// =============================================================================
// Validation
// =============================================================================

ConfigReader::NumberKind ConfigReader::numberKind(const std::string& section,
                                                  const std::string& key) {
    static const std::map<std::string, std::map<std::string, NumberKind>> kinds = {
        {"physics", {{"solar_constant", NumberKind::Real},
                     {"reference_temperature", NumberKind::Real},
                     {"emissivity", NumberKind::Real},
                     {"stefan_boltzmann", NumberKind::Real},
                     {"albedo_ice", NumberKind::Real},
                     {"albedo_water", NumberKind::Real},
                     {"transition_temperature", NumberKind::Real},
                     {"transition_width", NumberKind::Real},
                     {"albedo_relaxation_rate", NumberKind::Real},
                     {"noise_temperature", NumberKind::Real},
                     {"noise_albedo", NumberKind::Real}}},
        {"initial", {{"temperature", NumberKind::Real},
                     {"albedo", NumberKind::Real}}},
        {"deterministic", {{"start_time", NumberKind::Real},
                           {"end_time", NumberKind::Real},
                           {"num_samples", NumberKind::Integer},
                           {"max_internal_dt", NumberKind::Real}}},
        {"equilibrium", {{"guesses", NumberKind::RealList},
                         {"tolerance", NumberKind::Real},
                         {"max_iterations", NumberKind::Integer},
                         {"merge_tolerance", NumberKind::Real}}},
        {"ensemble", {{"start_time", NumberKind::Real},
                      {"dt", NumberKind::Real},
                      {"num_steps", NumberKind::Integer},
                      {"num_runs", NumberKind::Integer},
                      {"seed", NumberKind::Unsigned},
                      {"num_threads", NumberKind::Integer},
                      {"burn_in_steps", NumberKind::Integer}}},
    };

    auto sec_it = kinds.find(section);
    if (sec_it == kinds.end()) return NumberKind::None;
    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return NumberKind::None;
    return key_it->second;
}

ConfigReader::ValidationResult ConfigReader::validate() const {
    ValidationResult result;
    result.valid = true;

    auto error = [&result](const std::string& msg) {
        result.errors.push_back(msg);
        result.valid = false;
    };

    if (!hasSection("physics")) {
        result.warnings.push_back("No [physics] section found - using defaults");
    }

    // Values the typed getters would replace by their defaults
    for (const auto& sec : data) {
        for (const auto& kv : sec.second) {
            const NumberKind kind = numberKind(sec.first, kv.first);
            if (kind == NumberKind::None || kv.second.empty()) continue;

            bool ok = true;
            int i = 0;
            double d = 0.0;
            std::uint64_t u = 0;
            switch (kind) {
                case NumberKind::Integer:  ok = parseInt(kv.second, i); break;
                case NumberKind::Real:     ok = parseDouble(kv.second, d); break;
                case NumberKind::Unsigned: ok = parseUInt64(kv.second, u); break;
                case NumberKind::RealList:
                    for (const auto& token : split(kv.second, ',')) {
                        ok = ok && parseDouble(token, d);
                    }
                    break;
                case NumberKind::None: break;
            }
            if (!ok) {
                error("[" + sec.first + "] " + kv.first + " = '" + kv.second +
                      "' is not a valid number");
            }
        }
    }

    PhysicalParameters p;
    parsePhysicalParameters(p);
    if (!(p.solar_constant > 0.0)) error("solar_constant must be positive");
    if (!(p.reference_temperature > 0.0)) error("reference_temperature must be positive");
    if (!(p.transition_width > 0.0)) error("transition_width must be positive");
    if (p.emissivity < 0.0) error("emissivity must be non-negative");
    if (p.stefan_boltzmann < 0.0) error("stefan_boltzmann must be non-negative");
    if (p.albedo_relaxation_rate < 0.0) error("albedo_relaxation_rate must be non-negative");
    if (p.noise_temperature < 0.0 || p.noise_albedo < 0.0) {
        error("Noise intensities must be non-negative");
    }
    if (p.albedo_ice <= p.albedo_water) {
        result.warnings.push_back("albedo_ice <= albedo_water - no ice-albedo feedback");
    }
    if (p.albedo_ice < 0.0 || p.albedo_ice > 1.0 || p.albedo_water < 0.0 || p.albedo_water > 1.0) {
        result.warnings.push_back("Albedo endpoints outside [0, 1]");
    }
    if (p.emissivity > 1.0) {
        result.warnings.push_back("emissivity > 1");
    }

    ClimateState s;
    parseInitialState(s);
    if (!s.isFinite()) error("Initial state must be finite");
    if (s.albedo < 0.0 || s.albedo > 1.0) {
        result.warnings.push_back("Initial albedo outside [0, 1]");
    }
    if (s.temperature <= 0.0) {
        result.warnings.push_back("Initial temperature is not positive");
    }

    DeterministicConfig det;
    parseDeterministicConfig(det);
    if (det.num_samples < 2) error("[deterministic] num_samples must be at least 2");
    if (!(det.end_time > det.start_time)) error("[deterministic] end_time must exceed start_time");
    if (!(det.max_internal_dt > 0.0)) error("[deterministic] max_internal_dt must be positive");

    EquilibriumConfig eq;
    parseEquilibriumConfig(eq);
    if (eq.guesses.empty()) error("[equilibrium] at least one guess is required");
    if (!(eq.tolerance > 0.0)) error("[equilibrium] tolerance must be positive");
    if (eq.max_iterations < 1) error("[equilibrium] max_iterations must be at least 1");
    if (eq.merge_tolerance < 0.0) error("[equilibrium] merge_tolerance must be non-negative");

    EnsembleConfig ens;
    parseEnsembleConfig(ens);
    if (!(ens.dt > 0.0)) error("[ensemble] dt must be positive");
    if (ens.num_steps < 1) error("[ensemble] num_steps must be at least 1");
    if (ens.num_runs < 1) error("[ensemble] num_runs must be at least 1");
    if (ens.num_threads < 1) error("[ensemble] num_threads must be at least 1");
    if (ens.burn_in_steps < 0 || ens.burn_in_steps >= ens.num_steps) {
        error("[ensemble] burn_in_steps must lie in [0, num_steps)");
    }
    if (hasKey("ensemble", "seed") && getString("ensemble", "seed").empty()) {
        result.warnings.push_back("[ensemble] seed is empty - a random seed will be drawn");
    }

    OutputConfig out;
    parseOutputConfig(out);
    if (out.prefix.empty()) error("[output] prefix must not be empty");

    return result;
}

// =============================================================================
// Template Generation
// =============================================================================

bool ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot write configuration template: " << filename << std::endl;
        return false;
    }

    const PhysicalParameters p;
    const ClimateState s;
    const DeterministicConfig det;
    const EquilibriumConfig eq;
    const EnsembleConfig ens;
    const OutputConfig out;

    file.precision(17);

    file << "# SEBM Configuration File\n";
    file << "# Fluxes are normalized by the solar constant; time is in model units\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value\n\n";

    file << "[physics]\n";
    file << "solar_constant = " << p.solar_constant << "            # S0 [W/m^2]\n";
    file << "reference_temperature = " << p.reference_temperature << "      # T0 [K]\n";
    file << "emissivity = " << p.emissivity << "\n";
    file << "stefan_boltzmann = " << p.stefan_boltzmann << "\n";
    file << "albedo_ice = " << p.albedo_ice << "\n";
    file << "albedo_water = " << p.albedo_water << "\n";
    file << "transition_temperature = " << p.transition_temperature << "     # Tc [K]\n";
    file << "transition_width = " << p.transition_width << "            # wT [K]\n";
    file << "albedo_relaxation_rate = " << p.albedo_relaxation_rate << "  # delta\n";
    file << "noise_temperature = " << p.noise_temperature << "            # eta_T\n";
    file << "noise_albedo = " << p.noise_albedo << "                 # eta_a\n\n";

    file << "[initial]\n";
    file << "temperature = " << s.temperature << "\n";
    file << "albedo = " << s.albedo << "\n\n";

    file << "[deterministic]\n";
    file << "start_time = " << det.start_time << "\n";
    file << "end_time = " << det.end_time << "\n";
    file << "num_samples = " << det.num_samples << "\n";
    file << "max_internal_dt = " << det.max_internal_dt << "       # RK4 substep bound\n\n";

    file << "[equilibrium]\n";
    file << "guesses = ";
    for (size_t i = 0; i < eq.guesses.size(); ++i) {
        file << (i ? ", " : "") << eq.guesses[i];
    }
    file << "\n";
    file << "tolerance = " << eq.tolerance << "               # |netFlux| target\n";
    file << "max_iterations = " << eq.max_iterations << "\n";
    file << "merge_tolerance = " << eq.merge_tolerance << "\n\n";

    file << "[ensemble]\n";
    file << "start_time = " << ens.start_time << "\n";
    file << "dt = " << ens.dt << "\n";
    file << "num_steps = " << ens.num_steps << "\n";
    file << "num_runs = " << ens.num_runs << "\n";
    file << "# seed = 12345                       # Omit for a random seed\n";
    file << "num_threads = " << ens.num_threads << "\n";
    file << "burn_in_steps = " << ens.burn_in_steps << "\n";
    file << "discard_diverged = " << (ens.discard_diverged ? "true" : "false")
         << "         # Keep finite runs when some diverge\n\n";

    file << "[output]\n";
    file << "prefix = " << out.prefix << "\n";
    file << "write_trajectory = " << (out.write_trajectory ? "true" : "false") << "\n";
    file << "write_ensemble = " << (out.write_ensemble ? "true" : "false") << "\n";
    file << "write_statistics = " << (out.write_statistics ? "true" : "false") << "\n";

    return static_cast<bool>(file);
}

} // namespace SEBM
