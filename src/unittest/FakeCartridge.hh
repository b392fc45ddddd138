#ifndef FAKECARTRIDGE_HH
#define FAKECARTRIDGE_HH

#include "CliComm.hh"
#include "FlashkitLink.hh"
#include "PollClock.hh"

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace flashkit {

/** In-memory model of the programmer plus cartridge: the CPLD bank
  * registers, the RAM window at 0x200000 and an MX29GL128 with its
  * command state machine and DQ7 status polling.
  */
class FakeCartridge final : public FlashkitLink
{
public:
	static constexpr uint32_t CHIP_SIZE = 0x800000;

	struct BusWrite {
		uint32_t address;
		uint16_t value;
		bool byte;
	};

	FakeCartridge();

	void connect() override;
	void disconnect() noexcept override { connected = false; }
	[[nodiscard]] bool isConnected() const override { return connected; }
	[[nodiscard]] std::string getName() const override { return "fake"; }
	void setDelay(unsigned ms) override { delay = ms; }

	[[nodiscard]] uint16_t readWord(uint32_t address) override;
	void writeWord(uint32_t address, uint16_t value) override;
	void writeByte(uint32_t address, uint8_t value) override;
	void read(uint32_t address, std::span<uint8_t> buffer) override;
	void write(uint32_t address, std::span<const uint8_t> data) override;

	// test setup
	/** Chip contents repeat every 'size' bytes (the decoded size). */
	void setMirrorSize(uint32_t size) { mirrorSize = size; }
	/** Battery RAM of 'size' bytes, 0 for none. Addresses beyond it alias. */
	void setRamSize(uint32_t size);
	void fillChip(std::span<const uint8_t> data, uint32_t offset = 0);
	void setBusyReads(unsigned n) { busyReads = n; }
	void setNeverReady(bool b) { neverReady = b; }
	void setFailConnect(bool b) { failConnect = b; }
	void setBankPage(unsigned bank, uint8_t page) { pages[bank] = page; }
	void setFailRegisterReads(bool b) { failRegisterReads = b; }
	/** Writes to RAM cell 'cell' store the inverted value. */
	void setRamWriteFault(uint32_t cell) { faultyRamCell = cell; }

	// inspection
	[[nodiscard]] std::span<const uint8_t> getChip() const { return chip; }
	[[nodiscard]] uint8_t getBankPage(unsigned bank) const { return pages[bank]; }
	[[nodiscard]] bool isRamEnabled() const { return ramEnabled; }
	[[nodiscard]] std::span<const uint8_t> getRam() const { return ram; }
	[[nodiscard]] unsigned getDelay() const { return delay; }
	[[nodiscard]] const std::vector<BusWrite>& getWrites() const { return writes; }
	[[nodiscard]] unsigned getNumAccesses() const { return numAccesses; }
	[[nodiscard]] unsigned getNumBankWrites(unsigned bank) const { return bankWrites[bank]; }
	[[nodiscard]] unsigned getNumErased() const { return numErased; }
	[[nodiscard]] unsigned getNumBufferPrograms() const { return numBufferPrograms; }
	[[nodiscard]] unsigned getNumWordPrograms() const { return numWordPrograms; }
	void clearLog();

private:
	enum class State {
		READ, UNLOCK1, UNLOCK2, ERASE_SETUP, ERASE_UNLOCK1, ERASE_UNLOCK2,
		PROGRAM, BUFFER_COUNT, BUFFER_DATA, BUFFER_CONFIRM,
	};

	[[nodiscard]] uint32_t toChip(uint32_t address) const;
	[[nodiscard]] bool inRam(uint32_t address) const;
	[[nodiscard]] uint16_t readChipWord(uint32_t chipOffset) const;
	void programWord(uint32_t chipOffset, uint16_t value);
	void flashWrite(uint32_t address, uint16_t value);
	void startBusy(uint16_t status);

private:
	std::vector<uint8_t> chip;
	std::vector<uint8_t> ram;
	std::array<uint8_t, 8> pages = {};
	std::array<unsigned, 8> bankWrites = {};
	std::vector<BusWrite> writes;

	State state = State::READ;
	uint32_t bufferSector = 0;
	unsigned bufferRemaining = 0;
	std::vector<std::pair<uint32_t, uint16_t>> bufferData;

	uint32_t mirrorSize = CHIP_SIZE;
	unsigned busyReads = 2;
	unsigned busyLeft = 0;
	uint16_t busyStatus = 0;
	unsigned delay = 0;
	unsigned numAccesses = 0;
	unsigned numErased = 0;
	unsigned numBufferPrograms = 0;
	unsigned numWordPrograms = 0;
	std::optional<uint32_t> faultyRamCell;
	bool ramEnabled = false;
	bool connected = false;
	bool failConnect = false;
	bool neverReady = false;
	bool failRegisterReads = false;
};

/** Time only advances when asked: every getTime() call moves the clock
  * forward by 'step', sleep() by the requested amount.
  */
class FakeClock final : public PollClock
{
public:
	explicit FakeClock(uint64_t step_ = 1000) : step(step_) {}

	[[nodiscard]] uint64_t getTime() override { now += step; return now; }
	void sleep(uint64_t us) override { now += us; ++numSleeps; }

	[[nodiscard]] unsigned getNumSleeps() const { return numSleeps; }

private:
	uint64_t now = 0;
	uint64_t step;
	unsigned numSleeps = 0;
};

/** Keeps every logged message, for inspection. */
class LogCollector final : public CliComm
{
public:
	struct Entry {
		LogLevel level;
		std::string message;
	};

	void log(LogLevel level, std::string_view message, float /*fraction*/) override {
		entries.push_back({level, std::string(message)});
	}

	[[nodiscard]] unsigned count(LogLevel level) const {
		unsigned n = 0;
		for (const auto& e : entries) n += (e.level == level);
		return n;
	}
	[[nodiscard]] bool contains(std::string_view text) const {
		for (const auto& e : entries) {
			if (e.message.find(text) != std::string::npos) return true;
		}
		return false;
	}

	std::vector<Entry> entries;
};

} // namespace flashkit

#endif
