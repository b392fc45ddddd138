#include "SettingsConfig.hh"
#include "ConfigException.hh"
#include "CliComm.hh"
#include "FileException.hh"
#include "FileOperations.hh"

#include "StringOp.hh"

#include <array>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <memory>

namespace flashkit {

namespace {

struct XmlDocFree {
	void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
using XmlDoc = std::unique_ptr<xmlDoc, XmlDocFree>;

struct XmlCharFree {
	void operator()(xmlChar* str) const { xmlFree(str); }
};
using XmlString = std::unique_ptr<xmlChar, XmlCharFree>;

struct Default {
	std::string_view id;
	std::string_view value;
	bool numeric;
};
constexpr std::array<Default, 5> DEFAULTS = {{
	{"port",          "auto",  false},
	{"delay",         "1",     true},
	{"erase_timeout", "10000", true},
	{"write_timeout", "5000",  true},
	{"poll_interval", "100",   true},
}};

[[nodiscard]] const Default* findDefault(std::string_view id)
{
	for (const auto& d : DEFAULTS) {
		if (d.id == id) return &d;
	}
	return nullptr;
}

constexpr int PARSE_OPTIONS = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;

[[nodiscard]] std::string_view toView(const xmlChar* str)
{
	return str ? std::string_view(reinterpret_cast<const char*>(str)) : std::string_view{};
}

} // namespace

SettingsConfig::SettingsConfig(CliComm& cliComm_)
	: cliComm(cliComm_)
{
	for (const auto& d : DEFAULTS) {
		settingValues.emplace(d.id, d.value);
	}
}

std::string SettingsConfig::getDefaultFilename()
{
	return FileOperations::getUserFlashkitDir() + "/settings.xml";
}

template<typename SetFunc>
static void parseDocument(XmlDoc doc, std::string_view source, CliComm& cliComm, SetFunc set)
{
	if (!doc) {
		throw ConfigException("Loading of settings from \"", source, "\" failed: malformed XML");
	}
	xmlNode* root = xmlDocGetRootElement(doc.get());
	if (!root || (toView(root->name) != "settings")) {
		throw ConfigException("Loading of settings from \"", source,
		                      "\" failed: root element must be <settings>");
	}
	for (xmlNode* node = root->children; node; node = node->next) {
		if (node->type != XML_ELEMENT_NODE) continue;
		if (toView(node->name) != "setting") {
			cliComm.printWarning("Ignoring unknown element <", toView(node->name),
			                     "> in ", source);
			continue;
		}
		XmlString id(xmlGetProp(node, reinterpret_cast<const xmlChar*>("id")));
		if (!id) {
			throw ConfigException("Setting without id in ", source);
		}
		XmlString content(xmlNodeGetContent(node));
		std::string_view value = toView(content.get());
		StringOp::trim(value, " \t\r\n");
		if (!findDefault(toView(id.get()))) {
			cliComm.printWarning("Ignoring unknown setting \"", toView(id.get()),
			                     "\" in ", source);
			continue;
		}
		set(toView(id.get()), value);
	}
}

void SettingsConfig::loadSetting(const std::string& filename)
{
	if (!FileOperations::isRegularFile(filename)) {
		throw FileException("Settings file not found: ", filename);
	}
	parseDocument(XmlDoc(xmlReadFile(filename.c_str(), nullptr, PARSE_OPTIONS)),
	              filename, cliComm,
	              [&](std::string_view id, std::string_view value) {
		setValueForSetting(id, value);
	});
}

void SettingsConfig::loadFromMemory(std::string_view xml, std::string_view source)
{
	parseDocument(XmlDoc(xmlReadMemory(xml.data(), int(xml.size()), nullptr, nullptr, PARSE_OPTIONS)),
	              source, cliComm,
	              [&](std::string_view id, std::string_view value) {
		setValueForSetting(id, value);
	});
}

const std::string* SettingsConfig::getValueForSetting(std::string_view setting) const
{
	auto it = settingValues.find(setting);
	return (it != settingValues.end()) ? &it->second : nullptr;
}

void SettingsConfig::setValueForSetting(std::string_view setting, std::string_view value)
{
	const auto* def = findDefault(setting);
	if (!def) {
		throw ConfigException("Unknown setting: ", setting);
	}
	if (def->numeric && !StringOp::stringTo<uint32_t>(value)) {
		throw ConfigException("Invalid value for setting \"", setting, "\": ", value);
	}
	if (!def->numeric && value.empty()) {
		throw ConfigException("Setting \"", setting, "\" can't be empty");
	}
	settingValues.insert_or_assign(std::string(setting), std::string(value));
}

uint32_t SettingsConfig::getNumber(std::string_view setting) const
{
	// validated in setValueForSetting()
	return StringOp::stringTo<uint32_t>(*getValueForSetting(setting)).value_or(0);
}

const std::string& SettingsConfig::getPort() const
{
	return *getValueForSetting("port");
}

unsigned SettingsConfig::getDelay() const
{
	return getNumber("delay");
}

FlashTimeouts SettingsConfig::getTimeouts() const
{
	FlashTimeouts result;
	result.erase = uint64_t(getNumber("erase_timeout")) * 1000;
	result.write = uint64_t(getNumber("write_timeout")) * 1000;
	result.pollInterval = getNumber("poll_interval");
	return result;
}

} // namespace flashkit
