#include "FakeCartridge.hh"
#include "LinkException.hh"

#include "narrow.hh"

#include <algorithm>

namespace flashkit {

static constexpr uint32_t BANK_SIZE   = 0x80000;
static constexpr uint32_t SPACE_SIZE  = 0x400000;
static constexpr uint32_t SECTOR_SIZE = 0x20000;
static constexpr uint32_t RAM_BASE    = 0x200000;
static constexpr uint32_t RAM_CTRL    = 0xA13000;
static constexpr uint32_t REG_FIRST   = 0xA130F2;
static constexpr uint32_t REG_LAST    = 0xA130FF;

FakeCartridge::FakeCartridge()
	: chip(CHIP_SIZE, 0xFF)
{
}

void FakeCartridge::connect()
{
	if (failConnect) throw LinkException("no device");
	connected = true;
}

void FakeCartridge::setRamSize(uint32_t size)
{
	ram.assign(size, 0);
	// not all zero, so the first toggle test sees a real value
	for (size_t i = 0; i < ram.size(); ++i) ram[i] = uint8_t(i * 7 + 3);
}

void FakeCartridge::fillChip(std::span<const uint8_t> data, uint32_t offset)
{
	std::ranges::copy(data, chip.begin() + offset);
}

void FakeCartridge::clearLog()
{
	writes.clear();
	bankWrites = {};
	numAccesses = 0;
}

uint32_t FakeCartridge::toChip(uint32_t address) const
{
	unsigned bank = address / BANK_SIZE;
	unsigned page = (bank == 0) ? 0 : pages[bank];
	uint32_t offset = page * BANK_SIZE + (address % BANK_SIZE);
	return offset % mirrorSize;
}

bool FakeCartridge::inRam(uint32_t address) const
{
	return ramEnabled && !ram.empty() &&
	       (RAM_BASE <= address) && (address < SPACE_SIZE);
}

uint16_t FakeCartridge::readChipWord(uint32_t chipOffset) const
{
	chipOffset &= ~1u;
	return narrow_cast<uint16_t>((chip[chipOffset] << 8) | chip[chipOffset + 1]);
}

void FakeCartridge::programWord(uint32_t chipOffset, uint16_t value)
{
	chipOffset &= ~1u;
	// programming can only clear bits
	chip[chipOffset + 0] &= narrow_cast<uint8_t>(value >> 8);
	chip[chipOffset + 1] &= narrow_cast<uint8_t>(value & 0xFF);
}

void FakeCartridge::startBusy(uint16_t status)
{
	busyLeft = neverReady ? ~0u : busyReads;
	busyStatus = status;
}

uint16_t FakeCartridge::readWord(uint32_t address)
{
	if (!connected) throw LinkException("not connected");
	++numAccesses;
	address &= ~1u;
	if ((REG_FIRST <= address) && (address <= REG_LAST)) {
		if (failRegisterReads) throw LinkException("read timeout");
		return pages[(address - 0xA130F0) / 2];
	}
	if (address >= SPACE_SIZE) return 0xFFFF;
	if (inRam(address)) {
		auto cell = ((address - RAM_BASE) / 2) % ram.size();
		return narrow_cast<uint16_t>(0xFF00 | ram[cell]);
	}
	if (busyLeft) {
		--busyLeft;
		return busyStatus;
	}
	return readChipWord(toChip(address));
}

void FakeCartridge::writeWord(uint32_t address, uint16_t value)
{
	if (!connected) throw LinkException("not connected");
	++numAccesses;
	address &= ~1u;
	writes.push_back({address, value, false});
	if (address == RAM_CTRL) {
		ramEnabled = (value & 1) != 0;
		return;
	}
	if (address >= SPACE_SIZE) return;
	if (inRam(address)) {
		auto cell = ((address - RAM_BASE) / 2) % ram.size();
		if (cell == faultyRamCell) value = narrow_cast<uint16_t>(~value);
		ram[cell] = narrow_cast<uint8_t>(value & 0xFF);
		return;
	}
	flashWrite(address, value);
}

void FakeCartridge::writeByte(uint32_t address, uint8_t value)
{
	if (!connected) throw LinkException("not connected");
	++numAccesses;
	writes.push_back({address, value, true});
	if ((REG_FIRST < address) && (address <= REG_LAST) && (address & 1)) {
		unsigned bank = (address - 0xA130F1) / 2;
		pages[bank] = value & 0x0F;
		++bankWrites[bank];
	}
}

void FakeCartridge::read(uint32_t address, std::span<uint8_t> buffer)
{
	for (size_t i = 0; i < buffer.size(); i += 2) {
		auto w = readWord(narrow<uint32_t>(address + i));
		buffer[i] = narrow_cast<uint8_t>(w >> 8);
		if (i + 1 < buffer.size()) buffer[i + 1] = narrow_cast<uint8_t>(w & 0xFF);
	}
}

void FakeCartridge::write(uint32_t address, std::span<const uint8_t> data)
{
	for (size_t i = 0; i < data.size(); i += 2) {
		uint8_t lo = (i + 1 < data.size()) ? data[i + 1] : 0xFF;
		writeWord(narrow<uint32_t>(address + i), narrow_cast<uint16_t>((data[i] << 8) | lo));
	}
}

void FakeCartridge::flashWrite(uint32_t address, uint16_t value)
{
	uint32_t chipOffset = toChip(address);
	uint32_t wordAddr = (chipOffset / 2) & 0x7FF;
	uint8_t cmd = narrow_cast<uint8_t>(value & 0xFF);

	if ((cmd == 0xF0) && (state != State::PROGRAM) && (state != State::BUFFER_DATA)
	    && (state != State::BUFFER_COUNT)) {
		state = State::READ;
		busyLeft = 0;
		return;
	}

	switch (state) {
	case State::READ:
		state = ((wordAddr == 0x555) && (cmd == 0xAA)) ? State::UNLOCK1 : State::READ;
		break;
	case State::UNLOCK1:
		state = ((wordAddr == 0x2AA) && (cmd == 0x55)) ? State::UNLOCK2 : State::READ;
		break;
	case State::UNLOCK2:
		if ((wordAddr == 0x555) && (cmd == 0x80)) {
			state = State::ERASE_SETUP;
		} else if ((wordAddr == 0x555) && (cmd == 0xA0)) {
			state = State::PROGRAM;
		} else if (cmd == 0x25) {
			bufferSector = chipOffset & ~(SECTOR_SIZE - 1);
			state = State::BUFFER_COUNT;
		} else {
			state = State::READ;
		}
		break;
	case State::ERASE_SETUP:
		state = ((wordAddr == 0x555) && (cmd == 0xAA)) ? State::ERASE_UNLOCK1 : State::READ;
		break;
	case State::ERASE_UNLOCK1:
		state = ((wordAddr == 0x2AA) && (cmd == 0x55)) ? State::ERASE_UNLOCK2 : State::READ;
		break;
	case State::ERASE_UNLOCK2:
		state = State::READ;
		if (cmd == 0x30) {
			uint32_t sector = chipOffset & ~(SECTOR_SIZE - 1);
			std::fill_n(chip.begin() + sector, SECTOR_SIZE, uint8_t(0xFF));
			++numErased;
			startBusy(0x0000); // DQ7 reads 0 while erasing
		}
		break;
	case State::PROGRAM:
		state = State::READ;
		programWord(chipOffset, value);
		++numWordPrograms;
		startBusy(narrow_cast<uint16_t>(~value & 0x0080));
		break;
	case State::BUFFER_COUNT:
		if ((chipOffset & ~(SECTOR_SIZE - 1)) != bufferSector) {
			state = State::READ;
			break;
		}
		bufferRemaining = unsigned(value) + 1;
		bufferData.clear();
		state = State::BUFFER_DATA;
		break;
	case State::BUFFER_DATA:
		bufferData.emplace_back(chipOffset, value);
		if (--bufferRemaining == 0) state = State::BUFFER_CONFIRM;
		break;
	case State::BUFFER_CONFIRM:
		state = State::READ;
		if ((cmd == 0x29) && ((chipOffset & ~(SECTOR_SIZE - 1)) == bufferSector)) {
			for (const auto& [offset, word] : bufferData) {
				programWord(offset, word);
			}
			++numBufferPrograms;
			startBusy(narrow_cast<uint16_t>(~bufferData.back().second & 0x0080));
		}
		break;
	}
}

} // namespace flashkit
