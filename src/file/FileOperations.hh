#ifndef FILEOPERATIONS_HH
#define FILEOPERATIONS_HH

#include <cstdio>
#include <memory>
#include <string>
#include <string_view>

namespace flashkit::FileOperations {

	struct FClose {
		void operator()(FILE* f) const { fclose(f); }
	};
	using FILE_t = std::unique_ptr<FILE, FClose>;

	/**
	 * Expand a leading '~' to the users home directory.
	 * Only the current user's home directory ("~/...") is supported.
	 */
	[[nodiscard]] std::string expandTilde(std::string path);

	/** Open a file, throws FileException on failure. */
	[[nodiscard]] FILE_t openFile(const std::string& filename, const char* mode);

	/** Get the flashkit user directory: ~/.flashkit */
	[[nodiscard]] std::string getUserFlashkitDir();

	[[nodiscard]] bool isRegularFile(const std::string& filename);

} // namespace flashkit::FileOperations

#endif
