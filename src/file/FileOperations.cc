#include "FileOperations.hh"
#include "FileException.hh"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

namespace flashkit::FileOperations {

static std::string getUserHomeDir()
{
	if (const char* home = getenv("HOME")) {
		return home;
	}
	if (const auto* pw = getpwuid(getuid())) {
		return pw->pw_dir;
	}
	return {};
}

std::string expandTilde(std::string path)
{
	if (path.empty() || (path[0] != '~')) return path;
	if ((path.size() > 1) && (path[1] != '/')) return path; // ~user not supported

	std::string result = getUserHomeDir();
	if (result.empty()) {
		// failed to find homedir, return the path unchanged
		return path;
	}
	if (path.size() == 1) return result;
	if (result.back() == '/') result.pop_back();
	result.append(path, 1);
	return result;
}

FILE_t openFile(const std::string& filename, const char* mode)
{
	FILE_t file(fopen(filename.c_str(), mode));
	if (!file) {
		throw FileException("Error opening file \"", filename, "\": ", strerror(errno));
	}
	return file;
}

std::string getUserFlashkitDir()
{
	return expandTilde("~/.flashkit");
}

bool isRegularFile(const std::string& filename)
{
	struct stat st;
	return (stat(filename.c_str(), &st) == 0) && S_ISREG(st.st_mode);
}

} // namespace flashkit::FileOperations
