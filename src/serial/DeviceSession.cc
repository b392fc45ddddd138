#include "DeviceSession.hh"
#include "FlashkitLink.hh"
#include "LinkException.hh"
#include "CliComm.hh"

namespace flashkit {

DeviceSession::DeviceSession(FlashkitLink& link_, CliComm& cliComm_, unsigned delayMs)
	: link(link_), cliComm(cliComm_)
{
	if (link.isConnected()) {
		throw LinkException("Device ", link.getName(), " is already in use");
	}
	try {
		link.connect();
		link.setDelay(delayMs);
		connected = true;
	} catch (LinkException& e) {
		link.disconnect();
		cliComm.printWarning("Device not detected: ", e.getMessage());
	}
}

DeviceSession::~DeviceSession()
{
	if (connected) {
		link.disconnect();
	}
}

std::string DeviceSession::getPortName() const
{
	return connected ? link.getName() : std::string{};
}

FlashkitLink& DeviceSession::checkedLink()
{
	if (!connected) throw NotConnectedException();
	return link;
}

void DeviceSession::setDelay(unsigned ms)
{
	checkedLink().setDelay(ms);
}

uint16_t DeviceSession::readWord(uint32_t address)
{
	return checkedLink().readWord(address);
}

void DeviceSession::writeWord(uint32_t address, uint16_t value)
{
	checkedLink().writeWord(address, value);
}

void DeviceSession::writeByte(uint32_t address, uint8_t value)
{
	checkedLink().writeByte(address, value);
}

void DeviceSession::read(uint32_t address, std::span<uint8_t> buffer)
{
	checkedLink().read(address, buffer);
}

void DeviceSession::write(uint32_t address, std::span<const uint8_t> data)
{
	checkedLink().write(address, data);
}

} // namespace flashkit
