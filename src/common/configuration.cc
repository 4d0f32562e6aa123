#include "configuration.h"
#include <cctype>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Stabping {

namespace {

// Applies the "stabping" section of a parsed settings document.
void ApplyYAML(const YAML::Node& yaml, StabpingConfig& config) {
    if (!yaml["stabping"]) {
        LOG(WARNING) << "Settings document has no 'stabping' section; using defaults";
        return;
    }
    auto root = yaml["stabping"];

    // Data
    if (root["data"]) {
        auto data = root["data"];
        if (data["dir_name"]) config.data.dir_name.set(data["dir_name"].as<std::string>());
        if (data["index_file"]) config.data.index_file.set(data["index_file"].as<std::string>());
        if (data["data_file"]) config.data.data_file.set(data["data_file"].as<std::string>());
        if (data["search_paths"]) {
            config.data.search_paths.clear();
            for (const auto& path : data["search_paths"]) {
                config.data.search_paths.push_back(path.as<std::string>());
            }
        }
    }

    // Output
    if (root["output"]) {
        auto output = root["output"];
        if (output["line_terminator"]) config.output.line_terminator.set(output["line_terminator"].as<std::string>());
        if (output["buffer_size"]) config.output.buffer_size.set(output["buffer_size"].as<size_t>());
    }
}

} // namespace

// Template specializations for environment variable parsing
template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        // stoull accepts a leading '-' and wraps it around to a huge value.
        const char* digits = env_val;
        while (std::isspace(static_cast<unsigned char>(*digits))) digits++;
        if (*digits == '-') {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": negative value " << env_val;
            return std::nullopt;
        }
        try {
            return std::stoull(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        ApplyYAML(yaml, config_);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse settings file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        ApplyYAML(yaml, config_);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse settings string: " << e.what();
        return false;
    }
}

std::string Configuration::getLineTerminator() const {
    return config_.output.line_terminator.get() == "lf" ? "\n" : "\r\n";
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.data.dir_name.get().empty()) {
        validation_errors_.push_back("Data directory name must not be empty");
    }
    if (config_.data.index_file.get().empty()) {
        validation_errors_.push_back("Index file name must not be empty");
    }
    if (config_.data.data_file.get().empty()) {
        validation_errors_.push_back("Data file name must not be empty");
    }

    const std::string terminator = config_.output.line_terminator.get();
    if (terminator != "crlf" && terminator != "lf") {
        validation_errors_.push_back("Line terminator must be 'crlf' or 'lf', got '" + terminator + "'");
    }

    const size_t buffer_size = config_.output.buffer_size.get();
    if (buffer_size < 1 || buffer_size > kMaxOutputBufferSize) {
        validation_errors_.push_back("Output buffer size must be between 1 byte and "
            + std::to_string(kMaxOutputBufferSize) + " bytes, got " + std::to_string(buffer_size));
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Stabping
