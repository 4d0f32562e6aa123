#include "data_locator.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sys/stat.h>
#include <unistd.h>

#include <glog/logging.h>

#include "common/scoped_fd.h"

namespace Stabping {

namespace {

bool IsDirectory(const fs::path& p) {
	std::error_code ec;
	return fs::is_directory(p, ec);
}

} // namespace

std::vector<fs::path> DataLocator::SearchRoots() const {
	std::vector<fs::path> roots;
	const auto configured = config_.getSearchPaths();
	if (!configured.empty()) {
		roots.assign(configured.begin(), configured.end());
		return roots;
	}

	std::error_code ec;
	fs::path cwd = fs::current_path(ec);
	if (!ec) {
		roots.push_back(cwd);
	}
	if (const char* home = std::getenv("HOME"); home != nullptr && home[0] != '\0') {
		roots.push_back(fs::path(home) / ".config");
	}
	roots.push_back("/etc");
	return roots;
}

std::optional<fs::path> DataLocator::FindDataDir(const std::optional<std::string>& stabping_config) const {
	const std::string dir_name = config_.getDataDirName();

	if (stabping_config.has_value()) {
		fs::path data_dir = fs::path(*stabping_config).parent_path() / dir_name;
		if (IsDirectory(data_dir)) {
			return data_dir;
		}
		LOG(ERROR) << "Data directory not found: " << data_dir.string();
		return std::nullopt;
	}

	for (const fs::path& root : SearchRoots()) {
		fs::path candidate = root / dir_name;
		VLOG(2) << "Looking for data directory at " << candidate.string();
		if (IsDirectory(candidate)) {
			return candidate;
		}
	}

	LOG(ERROR) << "Could not find " << dir_name << " directory. "
		<< "Use --config to specify the stabping_config.json location.";
	return std::nullopt;
}

std::optional<std::vector<std::string>> DataLocator::ReadAddressIndex(const fs::path& data_dir) const {
	const fs::path index_path = data_dir / config_.getIndexFile();
	std::error_code ec;
	if (!fs::exists(index_path, ec)) {
		LOG(ERROR) << "Index file not found: " << index_path.string();
		return std::nullopt;
	}

	std::ifstream in(index_path);
	if (!in.is_open()) {
		LOG(ERROR) << "Cannot open index file " << index_path.string() << ": " << strerror(errno);
		return std::nullopt;
	}

	std::vector<std::string> addresses;
	std::string line;
	while (std::getline(in, line)) {
		if (!line.empty() && line.back() == '\r') {
			line.pop_back();
		}
		if (!line.empty()) {
			addresses.push_back(line);
		}
	}
	if (in.bad()) {
		LOG(ERROR) << "Error reading index file " << index_path.string();
		return std::nullopt;
	}

	VLOG(1) << "Loaded " << addresses.size() << " addresses from " << index_path.string();
	return addresses;
}

std::optional<std::vector<uint8_t>> DataLocator::ReadDataFile(const fs::path& data_dir) const {
	const fs::path data_path = data_dir / config_.getDataFile();
	std::error_code ec;
	if (!fs::exists(data_path, ec)) {
		LOG(ERROR) << "Data file not found: " << data_path.string();
		return std::nullopt;
	}
	return ReadFileBytes(data_path);
}

std::optional<std::vector<uint8_t>> ReadFileBytes(const fs::path& path) {
	ScopedFd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
	if (!fd.valid()) {
		LOG(ERROR) << "Cannot open " << path.string() << ": " << strerror(errno);
		return std::nullopt;
	}

	struct stat st;
	if (fstat(fd.get(), &st) != 0) {
		LOG(ERROR) << "fstat failed on " << path.string() << ": " << strerror(errno);
		return std::nullopt;
	}

	std::vector<uint8_t> bytes;
	bytes.reserve(st.st_size > 0 ? static_cast<size_t>(st.st_size) : 0);
	uint8_t chunk[1 << 16];
	while (true) {
		ssize_t n = ::read(fd.get(), chunk, sizeof(chunk));
		if (n < 0) {
			if (errno == EINTR) {
				continue;
			}
			LOG(ERROR) << "Read failed on " << path.string() << ": " << strerror(errno);
			return std::nullopt;
		}
		if (n == 0) {
			break;
		}
		bytes.insert(bytes.end(), chunk, chunk + n);
	}

	VLOG(1) << "Read " << bytes.size() << " bytes from " << path.string();
	return bytes;
}

} // namespace Stabping
