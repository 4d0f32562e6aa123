#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "common/configuration.h"

namespace Stabping {

namespace fs = std::filesystem;

/**
 * Finds the stabping data directory and loads the files inside it.
 * Every lookup failure is logged with LOG(ERROR) and returned as nullopt;
 * callers treat nullopt as fatal.
 */
class DataLocator {
public:
	explicit DataLocator(const Configuration& config) : config_(config) {}

	/**
	 * Locate the data directory
	 * @param stabping_config Path to stabping_config.json. When set, the data
	 *        directory must sit next to it; the search path is not consulted.
	 * @return Existing data directory, or nullopt
	 */
	std::optional<fs::path> FindDataDir(const std::optional<std::string>& stabping_config) const;

	// Address names, one per non-empty line of the index file.
	std::optional<std::vector<std::string>> ReadAddressIndex(const fs::path& data_dir) const;

	// Entire contents of the sample log.
	std::optional<std::vector<uint8_t>> ReadDataFile(const fs::path& data_dir) const;

	// Directories searched for the data directory, in order.
	std::vector<fs::path> SearchRoots() const;

private:
	const Configuration& config_;
};

// Reads a whole file into memory. Logs and returns nullopt on I/O failure.
std::optional<std::vector<uint8_t>> ReadFileBytes(const fs::path& path);

} // namespace Stabping
