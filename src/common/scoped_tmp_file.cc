#include "scoped_tmp_file.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>
#include <fcntl.h>
#include <unistd.h>

#include <glog/logging.h>

namespace Collector {

ScopedTmpFile::ScopedTmpFile(ScopedTmpFile&& o) noexcept
	: fd_(o.fd_), path_(std::move(o.path_)), size_(o.size_) {
	o.fd_ = -1;
	o.path_.clear();
	o.size_ = 0;
}

ScopedTmpFile& ScopedTmpFile::operator=(ScopedTmpFile&& o) noexcept {
	if (this != &o) {
		Release();
		fd_ = o.fd_;
		path_ = std::move(o.path_);
		size_ = o.size_;
		o.fd_ = -1;
		o.path_.clear();
		o.size_ = 0;
	}
	return *this;
}

bool ScopedTmpFile::Create(const std::string& dir, std::string& error) {
	Release();

	std::string base = dir;
	if (base.empty()) {
		const char* env_dir = std::getenv("TMPDIR");
		base = (env_dir && env_dir[0]) ? env_dir : "/tmp";
	}
	if (base.back() != '/') {
		base += '/';
	}

	// mkstemp needs a writable template
	std::string tmpl = base + "collector-logs-XXXXXX";
	std::vector<char> buf(tmpl.begin(), tmpl.end());
	buf.push_back('\0');

	int fd = ::mkstemp(buf.data());
	if (fd < 0) {
		error = std::string("mkstemp(") + tmpl + "): " + strerror(errno);
		return false;
	}

	fd_ = fd;
	path_ = buf.data();
	size_ = 0;
	VLOG(3) << "[ScopedTmpFile] Created " << path_;
	return true;
}

bool ScopedTmpFile::Write(const std::string& data, std::string& error) {
	if (fd_ < 0) {
		error = "write to a closed tmp file";
		return false;
	}

	size_t written = 0;
	while (written < data.size()) {
		ssize_t n = ::write(fd_, data.data() + written, data.size() - written);
		if (n < 0) {
			if (errno == EINTR) continue;
			error = std::string("write(") + path_ + "): " + strerror(errno);
			size_ += static_cast<int64_t>(written);
			return false;
		}
		written += static_cast<size_t>(n);
	}
	size_ += static_cast<int64_t>(written);
	return true;
}

bool ScopedTmpFile::ReadAll(std::string& out, std::string& error) const {
	out.clear();
	if (fd_ < 0) {
		error = "read from a closed tmp file";
		return false;
	}

	out.resize(static_cast<size_t>(size_));
	size_t done = 0;
	while (done < out.size()) {
		ssize_t n = ::pread(fd_, &out[done], out.size() - done, static_cast<off_t>(done));
		if (n < 0) {
			if (errno == EINTR) continue;
			error = std::string("pread(") + path_ + "): " + strerror(errno);
			out.clear();
			return false;
		}
		if (n == 0) break;
		done += static_cast<size_t>(n);
	}
	out.resize(done);
	return true;
}

void ScopedTmpFile::Release() {
	if (fd_ >= 0) {
		::close(fd_);
		fd_ = -1;
	}
	if (!path_.empty()) {
		if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
			LOG(WARNING) << "[ScopedTmpFile] Failed to remove " << path_ << ": " << strerror(errno);
		}
		path_.clear();
	}
	size_ = 0;
}

} // namespace Collector
