#ifndef SETTINGSCONFIG_HH
#define SETTINGSCONFIG_HH

#include "MX29GL128.hh"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace flashkit {

class CliComm;

/** The user settings, stored in settings.xml:
  *
  *   <settings>
  *     <setting id="port">/dev/ttyACM0</setting>
  *     <setting id="delay">1</setting>
  *   </settings>
  *
  * Known ids: port, delay (ms), erase_timeout (ms), write_timeout (ms)
  * and poll_interval (us). Values are validated when they are set, a bad
  * value throws ConfigException. Unknown ids are ignored with a warning.
  */
class SettingsConfig
{
public:
	explicit SettingsConfig(CliComm& cliComm);

	/** Load from file, throws FileException or ConfigException. */
	void loadSetting(const std::string& filename);
	/** Load from an in-memory document, 'source' is used in messages. */
	void loadFromMemory(std::string_view xml, std::string_view source);

	[[nodiscard]] const std::string* getValueForSetting(std::string_view setting) const;
	void setValueForSetting(std::string_view setting, std::string_view value);

	[[nodiscard]] const std::string& getPort() const;
	[[nodiscard]] unsigned getDelay() const;
	[[nodiscard]] FlashTimeouts getTimeouts() const;

	/** Default location: ~/.flashkit/settings.xml */
	[[nodiscard]] static std::string getDefaultFilename();

private:
	[[nodiscard]] uint32_t getNumber(std::string_view setting) const;

private:
	CliComm& cliComm;
	std::map<std::string, std::string, std::less<>> settingValues;
};

} // namespace flashkit

#endif
