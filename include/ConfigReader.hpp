#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "SEBM.hpp"
#include "EnergyBalanceModel.hpp"
#include <cstdint>
#include <string>
#include <map>
#include <vector>
#include <sstream>

namespace SEBM {

/**
 * @brief INI-style configuration reader
 *
 * Builds every parameter record of the model from a single text file:
 *
 *   [physics]        PhysicalParameters
 *   [initial]        ClimateState
 *   [deterministic]  DeterministicConfig
 *   [equilibrium]    EquilibriumConfig
 *   [ensemble]       EnsembleConfig
 *   [output]         OutputConfig
 *
 * Missing sections and keys keep their defaults.
 */
class ConfigReader {
public:
    struct ValidationResult {
        bool valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    ConfigReader();
    ~ConfigReader() = default;

    // Load configuration file
    bool loadFile(const std::string& filename);

    // Parse configuration text directly (same syntax as a file)
    bool loadString(const std::string& text);

    // =========================================================================
    // Record Parsing (return true if the section exists)
    // =========================================================================

    bool parsePhysicalParameters(PhysicalParameters& params) const;
    bool parseInitialState(ClimateState& state) const;
    bool parseDeterministicConfig(DeterministicConfig& config) const;
    bool parseEquilibriumConfig(EquilibriumConfig& config) const;
    bool parseEnsembleConfig(EnsembleConfig& config) const;
    bool parseOutputConfig(OutputConfig& config) const;

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                         const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key,
              int default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                    double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                bool default_val = false) const;
    std::uint64_t getUInt64(const std::string& section, const std::string& key,
                            std::uint64_t default_val = 0) const;
    std::vector<double> getDoubleArray(const std::string& section,
                                       const std::string& key) const;

    // =========================================================================
    // Section/Key Query Methods
    // =========================================================================

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;

    /**
     * @brief Range checks on the parsed records
     *
     * Errors make the configuration unusable; warnings flag values the
     * model accepts but that are physically questionable.
     */
    ValidationResult validate() const;

    // Write a commented configuration holding every default
    static bool generateTemplate(const std::string& filename);

    // Whole-string numeric conversion; false on trailing characters or overflow
    static bool parseInt(const std::string& text, int& value);
    static bool parseDouble(const std::string& text, double& value);
    static bool parseUInt64(const std::string& text, std::uint64_t& value);

private:
    enum class NumberKind { None, Integer, Real, Unsigned, RealList };

    std::map<std::string, std::map<std::string, std::string>> data;

    static NumberKind numberKind(const std::string& section, const std::string& key);

    bool parseStream(std::istream& in);

    std::string trim(const std::string& str) const;
    std::vector<std::string> split(const std::string& str, char delim) const;
};

} // namespace SEBM

#endif // CONFIG_READER_HPP
