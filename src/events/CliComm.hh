#ifndef CLICOMM_HH
#define CLICOMM_HH

#include "strCat.hh"

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

namespace flashkit {

class CliComm
{
public:
	enum class LogLevel : uint8_t {
		INFO,
		WARNING,
		LOGLEVEL_ERROR, // ERROR may give preprocessor name clashes
		PROGRESS,
		NUM // must be last
	};

	/** Log a message with a certain priority level.
	  * The 'fraction' parameter is only meaningful for 'level=PROGRESS'.
	  * See printProgress() for details.
	  */
	virtual void log(LogLevel level, std::string_view message, float fraction = 0.0f) = 0;

	// convenience methods (shortcuts for log())
	void printInfo    (std::string_view message);
	void printWarning (std::string_view message);
	void printError   (std::string_view message);
	// 'fraction' should be between 0.0 and 1.0, a negative value means an
	// unknown progress fraction, values > 1.0 are clipped to 1.0.
	// The last message in such a sequence MUST have 'fraction >= 1.0'.
	void printProgress(std::string_view message, float fraction);

	// These overloads are (only) needed so that a plain string literal
	// doesn't pick the templated overload below.
	void printInfo(const char* message) {
		printInfo(std::string_view(message));
	}
	void printWarning(const char* message) {
		printWarning(std::string_view(message));
	}
	void printError(const char* message) {
		printError(std::string_view(message));
	}

	template<typename... Args>
	void printInfo(Args&& ...args) {
		auto tmp = strCat(std::forward<Args>(args)...);
		printInfo(std::string_view(tmp));
	}
	template<typename... Args>
	void printWarning(Args&& ...args) {
		auto tmp = strCat(std::forward<Args>(args)...);
		printWarning(std::string_view(tmp));
	}
	template<typename... Args>
	void printError(Args&& ...args) {
		auto tmp = strCat(std::forward<Args>(args)...);
		printError(std::string_view(tmp));
	}

	[[nodiscard]] static std::string_view getLevelString(LogLevel level) {
		static constexpr std::array<std::string_view, 4> levelStr = {
			"info", "warning", "error", "progress"
		};
		return levelStr[std::to_underlying(level)];
	}

protected:
	CliComm() = default;
	~CliComm() = default;
};

[[nodiscard]] inline auto toString(CliComm::LogLevel level)
{
	return CliComm::getLevelString(level);
}

} // namespace flashkit

#endif
