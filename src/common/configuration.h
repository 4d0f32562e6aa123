#ifndef STABPING_CONFIGURATION_H_
#define STABPING_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstddef>

namespace Stabping {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

// Template specializations for getEnvValue
template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

/**
 * Main configuration structure
 */
struct StabpingConfig {
    // Where the sample log lives
    struct Data {
        ConfigValue<std::string> dir_name{"stabping_data", "STABPING_DATA_DIR_NAME"};
        ConfigValue<std::string> index_file{"tcpping.index.json", "STABPING_INDEX_FILE"};
        ConfigValue<std::string> data_file{"tcpping.data.dat", "STABPING_DATA_FILE"};
        // Directories searched for dir_name. Empty: cwd, ~/.config, /etc.
        std::vector<std::string> search_paths;
    } data;

    // CSV output
    struct Output {
        // "crlf" or "lf"
        ConfigValue<std::string> line_terminator{"crlf", "STABPING_CSV_LINE_TERMINATOR"};
        ConfigValue<size_t> buffer_size{1UL << 16, "STABPING_OUTPUT_BUFFER_SIZE"};
    } output;
};

// Largest accepted output.buffer_size (64 MiB)
static constexpr size_t kMaxOutputBufferSize = 64UL << 20;

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Restore compiled-in defaults
    void reset() { config_ = StabpingConfig{}; }

    // Get the configuration
    const StabpingConfig& config() const { return config_; }
    StabpingConfig& config() { return config_; }

    // Helper methods for common access patterns
    std::string getDataDirName() const { return config_.data.dir_name.get(); }
    std::string getIndexFile() const { return config_.data.index_file.get(); }
    std::string getDataFile() const { return config_.data.data_file.get(); }
    std::vector<std::string> getSearchPaths() const { return config_.data.search_paths; }
    size_t getOutputBufferSize() const { return config_.output.buffer_size.get(); }
    // Resolved terminator bytes ("\r\n" or "\n")
    std::string getLineTerminator() const;

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    StabpingConfig config_;
    mutable std::vector<std::string> validation_errors_;
};

} // namespace Stabping

#endif // STABPING_CONFIGURATION_H_
