#include "text_sink.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <utility>

#include <glog/logging.h>

namespace Stabping {

std::unique_ptr<FdTextSink> FdTextSink::OpenFile(const std::string& path, size_t buffer_size) {
	ScopedFd fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
	if (!fd.valid()) {
		LOG(ERROR) << "Cannot open output file " << path << ": " << strerror(errno);
		return nullptr;
	}
	const int raw = fd.get();
	return std::unique_ptr<FdTextSink>(new FdTextSink(raw, std::move(fd), path, buffer_size));
}

std::unique_ptr<FdTextSink> FdTextSink::Stdout(size_t buffer_size) {
	return std::unique_ptr<FdTextSink>(new FdTextSink(STDOUT_FILENO, ScopedFd(), "stdout", buffer_size));
}

FdTextSink::FdTextSink(int fd, ScopedFd owned, std::string name, size_t buffer_size)
	: fd_(fd),
	  owned_(std::move(owned)),
	  name_(std::move(name)),
	  buffer_size_(buffer_size == 0 ? 1 : buffer_size) {
	buffer_.reserve(buffer_size_);
}

FdTextSink::~FdTextSink() {
	if (!Close()) {
		LOG(ERROR) << "Output to " << name_ << " is incomplete";
	}
}

void FdTextSink::Write(std::string_view text) {
	if (!ok_) {
		return;
	}
	buffer_.append(text.data(), text.size());
	if (buffer_.size() >= buffer_size_) {
		Flush();
	}
}

bool FdTextSink::Flush() {
	if (ok_ && !buffer_.empty()) {
		if (fd_ < 0) {
			LOG(ERROR) << "Write to " << name_ << " after close";
			ok_ = false;
		} else {
			ok_ = WriteAll(buffer_.data(), buffer_.size());
		}
	}
	buffer_.clear();
	return ok_;
}

bool FdTextSink::Close() {
	if (fd_ < 0) {
		return ok_;
	}
	Flush();
	if (owned_.valid() && owned_.reset() != 0) {
		LOG(ERROR) << "Closing " << name_ << " failed: " << strerror(errno);
		ok_ = false;
	}
	fd_ = -1;
	return ok_;
}

bool FdTextSink::WriteAll(const char* data, size_t len) {
	size_t written = 0;
	while (written < len) {
		ssize_t n = ::write(fd_, data + written, len - written);
		if (n < 0) {
			if (errno == EINTR) {
				continue;
			}
			LOG(ERROR) << "Write to " << name_ << " failed: " << strerror(errno);
			return false;
		}
		written += static_cast<size_t>(n);
	}
	return true;
}

} // namespace Stabping
