#include "SerialFlashkitLink.hh"
#include "LinkException.hh"

#include "narrow.hh"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <glob.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace flashkit {

// Programmer command bytes. A command byte may be combined with the
// parameter flags below.
static constexpr uint8_t CMD_ADDR  = 0x00;
static constexpr uint8_t CMD_LEN   = 0x01;
static constexpr uint8_t CMD_RD    = 0x02;
static constexpr uint8_t CMD_WR    = 0x03;
static constexpr uint8_t CMD_DELAY = 0x05;

static constexpr uint8_t PAR_MODE8  = 0x10;
static constexpr uint8_t PAR_DEV_ID = 0x20;
static constexpr uint8_t PAR_SINGLE = 0x40;
static constexpr uint8_t PAR_INC    = 0x80;

// CMD_LEN takes a 16-bit word count
static constexpr size_t MAX_BLOCK = 0x8000;
static constexpr int READ_TIMEOUT_MS = 1000;

SerialFlashkitLink::SerialFlashkitLink(std::string port)
	: requestedPort(std::move(port))
{
}

SerialFlashkitLink::~SerialFlashkitLink()
{
	closePort();
}

void SerialFlashkitLink::connect()
{
	if (isConnected()) return;

	if (requestedPort != "auto") {
		openPort(requestedPort);
		try {
			(void)getID();
		} catch (LinkException&) {
			closePort();
			throw LinkException("No flashkit programmer answering on ", requestedPort);
		}
		return;
	}

	for (const char* pattern : {"/dev/ttyACM*", "/dev/ttyUSB*"}) {
		glob_t globResult;
		if (glob(pattern, 0, nullptr, &globResult) != 0) {
			globfree(&globResult);
			continue;
		}
		std::vector<std::string> candidates(globResult.gl_pathv,
		                                    globResult.gl_pathv + globResult.gl_pathc);
		globfree(&globResult);

		for (const auto& name : candidates) {
			if (tryPort(name)) return;
		}
	}
	throw LinkException("Flashkit programmer not found");
}

bool SerialFlashkitLink::tryPort(const std::string& name)
{
	try {
		openPort(name);
		(void)getID();
		return true;
	} catch (LinkException&) {
		// not a (responding) programmer, try the next port
		closePort();
		return false;
	}
}

void SerialFlashkitLink::openPort(const std::string& name)
{
	int newFd = ::open(name.c_str(), O_RDWR | O_NOCTTY);
	if (newFd < 0) {
		throw LinkException("Failed to open ", name, ": ", strerror(errno));
	}

	termios tty;
	memset(&tty, 0, sizeof(tty));
	if (tcgetattr(newFd, &tty) != 0) {
		int err = errno;
		::close(newFd);
		throw LinkException("Failed to read attributes of ", name, ": ", strerror(err));
	}

	// The programmer is USB CDC, the baud rate is not used on the wire
	// but must be set to something valid.
	cfsetospeed(&tty, B115200);
	cfsetispeed(&tty, B115200);
	cfmakeraw(&tty);
	tty.c_cflag |= (CLOCAL | CREAD); // Ignore modem controls
	tty.c_cflag &= ~PARENB;          // No parity
	tty.c_cflag &= ~CSTOPB;          // 1 stop bit
	tty.c_cflag &= ~CSIZE;
	tty.c_cflag |= CS8;              // 8 bits
	tty.c_cflag &= ~CRTSCTS;         // No hardware flow control
	tty.c_cc[VMIN] = 0;
	tty.c_cc[VTIME] = 0;

	if (tcsetattr(newFd, TCSANOW, &tty) != 0) {
		int err = errno;
		::close(newFd);
		throw LinkException("Failed to configure ", name, ": ", strerror(err));
	}
	tcflush(newFd, TCIOFLUSH);

	fd = newFd;
	portName = name;
}

void SerialFlashkitLink::closePort() noexcept
{
	if (fd != -1) {
		::close(fd);
		fd = -1;
	}
	portName.clear();
}

void SerialFlashkitLink::disconnect() noexcept
{
	closePort();
}

void SerialFlashkitLink::send(std::span<const uint8_t> data)
{
	while (!data.empty()) {
		auto n = ::write(fd, data.data(), data.size());
		if (n < 0) {
			if (errno == EINTR) continue;
			throw LinkException("Write to ", portName, " failed: ", strerror(errno));
		}
		data = data.subspan(size_t(n));
	}
}

void SerialFlashkitLink::receive(std::span<uint8_t> data)
{
	while (!data.empty()) {
		pollfd pfd = {fd, POLLIN, 0};
		int r = ::poll(&pfd, 1, READ_TIMEOUT_MS);
		if (r < 0) {
			if (errno == EINTR) continue;
			throw LinkException("Read from ", portName, " failed: ", strerror(errno));
		}
		if (r == 0) {
			throw LinkException("Read timeout on ", portName);
		}
		auto n = ::read(fd, data.data(), data.size());
		if (n < 0) {
			if (errno == EINTR || errno == EAGAIN) continue;
			throw LinkException("Read from ", portName, " failed: ", strerror(errno));
		}
		if (n == 0) {
			throw LinkException("Device ", portName, " disconnected");
		}
		data = data.subspan(size_t(n));
	}
}

void SerialFlashkitLink::setAddress(uint32_t address)
{
	// the programmer takes word addresses
	uint32_t word = address / 2;
	std::array<uint8_t, 6> cmd = {
		CMD_ADDR, narrow_cast<uint8_t>(word >> 16),
		CMD_ADDR, narrow_cast<uint8_t>(word >> 8),
		CMD_ADDR, narrow_cast<uint8_t>(word >> 0),
	};
	send(cmd);
}

uint16_t SerialFlashkitLink::getID()
{
	std::array<uint8_t, 1> cmd = {CMD_RD | PAR_SINGLE | PAR_DEV_ID};
	send(cmd);
	std::array<uint8_t, 2> id;
	receive(id);
	return narrow_cast<uint16_t>((id[0] << 8) | id[1]);
}

void SerialFlashkitLink::setDelay(unsigned ms)
{
	std::array<uint8_t, 2> cmd = {CMD_DELAY, narrow_cast<uint8_t>(std::min(ms, 255u))};
	send(cmd);
}

uint16_t SerialFlashkitLink::readWord(uint32_t address)
{
	setAddress(address);
	std::array<uint8_t, 1> cmd = {CMD_RD | PAR_SINGLE};
	send(cmd);
	std::array<uint8_t, 2> buf;
	receive(buf);
	return narrow_cast<uint16_t>((buf[0] << 8) | buf[1]);
}

void SerialFlashkitLink::writeWord(uint32_t address, uint16_t value)
{
	setAddress(address);
	std::array<uint8_t, 3> cmd = {
		CMD_WR | PAR_SINGLE,
		narrow_cast<uint8_t>(value >> 8),
		narrow_cast<uint8_t>(value & 0xFF),
	};
	send(cmd);
}

void SerialFlashkitLink::writeByte(uint32_t address, uint8_t value)
{
	setAddress(address);
	std::array<uint8_t, 2> cmd = {CMD_WR | PAR_SINGLE | PAR_MODE8, value};
	send(cmd);
}

void SerialFlashkitLink::read(uint32_t address, std::span<uint8_t> buffer)
{
	setAddress(address);
	while (!buffer.empty()) {
		auto len = std::min(buffer.size(), MAX_BLOCK);
		auto words = len / 2;
		std::array<uint8_t, 5> cmd = {
			CMD_LEN, narrow_cast<uint8_t>(words >> 8),
			CMD_LEN, narrow_cast<uint8_t>(words & 0xFF),
			CMD_RD | PAR_INC,
		};
		send(cmd);
		receive(buffer.first(len));
		buffer = buffer.subspan(len);
	}
}

void SerialFlashkitLink::write(uint32_t address, std::span<const uint8_t> data)
{
	setAddress(address);
	while (!data.empty()) {
		auto len = std::min(data.size(), MAX_BLOCK);
		auto words = len / 2;
		std::array<uint8_t, 5> cmd = {
			CMD_LEN, narrow_cast<uint8_t>(words >> 8),
			CMD_LEN, narrow_cast<uint8_t>(words & 0xFF),
			CMD_WR | PAR_INC,
		};
		send(cmd);
		send(data.first(len));
		data = data.subspan(len);
	}
}

} // namespace flashkit
