#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include "common/scoped_fd.h"

namespace Stabping {

/**
 * Interface for a writable text destination (CSV output)
 */
class TextSink {
public:
	virtual ~TextSink() = default;

	virtual void Write(std::string_view text) = 0;
	// Push buffered text to the destination. Returns ok().
	virtual bool Flush() = 0;
	// Flush and release the destination. Returns ok().
	virtual bool Close() = 0;
	// False once any write to the destination failed.
	virtual bool ok() const = 0;
	// Human-readable destination name for reports, e.g. a path or "stdout".
	virtual std::string Describe() const = 0;
};

/**
 * Buffered sink over a POSIX file descriptor.
 * A sink opened from a path owns its descriptor and closes it on destruction;
 * the stdout sink only flushes.
 */
class FdTextSink : public TextSink {
public:
	static constexpr size_t kDefaultBufferSize = 1UL << 16;

	// Creates or truncates path. Returns nullptr (and logs) if it cannot be opened.
	static std::unique_ptr<FdTextSink> OpenFile(const std::string& path,
			size_t buffer_size = kDefaultBufferSize);
	static std::unique_ptr<FdTextSink> Stdout(size_t buffer_size = kDefaultBufferSize);

	~FdTextSink() override;

	FdTextSink(const FdTextSink&) = delete;
	FdTextSink& operator=(const FdTextSink&) = delete;

	void Write(std::string_view text) override;
	bool Flush() override;
	// Closes an owned descriptor. Safe to call more than once.
	bool Close() override;
	bool ok() const override { return ok_; }
	std::string Describe() const override { return name_; }

private:
	FdTextSink(int fd, ScopedFd owned, std::string name, size_t buffer_size);

	bool WriteAll(const char* data, size_t len);

	int fd_;
	ScopedFd owned_;
	std::string name_;
	std::string buffer_;
	size_t buffer_size_;
	bool ok_ = true;
};

/**
 * Accumulates text in memory
 */
class StringTextSink : public TextSink {
public:
	void Write(std::string_view text) override { text_.append(text.data(), text.size()); }
	bool Flush() override { return true; }
	bool Close() override { return true; }
	bool ok() const override { return true; }
	std::string Describe() const override { return "memory"; }

	const std::string& str() const { return text_; }

private:
	std::string text_;
};

} // namespace Stabping
