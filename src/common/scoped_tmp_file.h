// RAII wrapper for the per-batch temporary file that backs a packaged log artifact.
// The file is closed and unlinked on scope exit, on every return path.
#ifndef COLLECTOR_SRC_COMMON_SCOPED_TMP_FILE_H_
#define COLLECTOR_SRC_COMMON_SCOPED_TMP_FILE_H_

#include <cstdint>
#include <string>

namespace Collector {

class ScopedTmpFile {
public:
	ScopedTmpFile() = default;
	~ScopedTmpFile() { Release(); }

	ScopedTmpFile(const ScopedTmpFile&) = delete;
	ScopedTmpFile& operator=(const ScopedTmpFile&) = delete;

	ScopedTmpFile(ScopedTmpFile&& o) noexcept;
	ScopedTmpFile& operator=(ScopedTmpFile&& o) noexcept;

	/**
	 * Creates a new empty file
	 * @param dir Directory to create it in; empty selects TMPDIR or /tmp
	 * @param error Set to the strerror() text on failure
	 * @return true if the file was created
	 */
	bool Create(const std::string& dir, std::string& error);

	/**
	 * Appends data at the current end of the file, retrying short writes
	 * @return false (with error set) if not all bytes could be written
	 */
	bool Write(const std::string& data, std::string& error);

	/**
	 * Reads the whole file from the beginning
	 */
	bool ReadAll(std::string& out, std::string& error) const;

	// Closes and deletes the file. Safe to call more than once.
	void Release();

	bool is_open() const { return fd_ >= 0; }
	const std::string& path() const { return path_; }
	int64_t size() const { return size_; }

private:
	int fd_ = -1;
	std::string path_;
	int64_t size_ = 0;
};

} // namespace Collector

#endif  // COLLECTOR_SRC_COMMON_SCOPED_TMP_FILE_H_
