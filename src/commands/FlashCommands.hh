#ifndef FLASHCOMMANDS_HH
#define FLASHCOMMANDS_HH

#include "Command.hh"

#include <functional>
#include <span>
#include <string>

namespace flashkit {

class Cartridge;
class Interpreter;
class Programmer;
class TclObject;

/** The Tcl commands that operate on the cartridge. Every command opens its
  * own DeviceSession for the duration of the command.
  */
class FlashCommands
{
public:
	FlashCommands(Interpreter& interpreter, Programmer& programmer);

private:
	void withCartridge(const std::function<void(Cartridge&)>& action);

private:
	Programmer& programmer;

	struct InfoCmd final : Command {
		InfoCmd(Interpreter& interpreter, FlashCommands& parent);
		void execute(std::span<const TclObject> tokens, TclObject& result) override;
		[[nodiscard]] std::string help() const override;
		FlashCommands& parent;
	} infoCmd;

	struct EraseCmd final : Command {
		EraseCmd(Interpreter& interpreter, FlashCommands& parent);
		void execute(std::span<const TclObject> tokens, TclObject& result) override;
		[[nodiscard]] std::string help() const override;
		FlashCommands& parent;
	} eraseCmd;

	struct WriteRomCmd final : Command {
		WriteRomCmd(Interpreter& interpreter, FlashCommands& parent);
		void execute(std::span<const TclObject> tokens, TclObject& result) override;
		[[nodiscard]] std::string help() const override;
		FlashCommands& parent;
	} writeRomCmd;

	struct ReadRomCmd final : Command {
		ReadRomCmd(Interpreter& interpreter, FlashCommands& parent);
		void execute(std::span<const TclObject> tokens, TclObject& result) override;
		[[nodiscard]] std::string help() const override;
		FlashCommands& parent;
	} readRomCmd;

	struct ReadRamCmd final : Command {
		ReadRamCmd(Interpreter& interpreter, FlashCommands& parent);
		void execute(std::span<const TclObject> tokens, TclObject& result) override;
		[[nodiscard]] std::string help() const override;
		FlashCommands& parent;
	} readRamCmd;

	struct WriteRamCmd final : Command {
		WriteRamCmd(Interpreter& interpreter, FlashCommands& parent);
		void execute(std::span<const TclObject> tokens, TclObject& result) override;
		[[nodiscard]] std::string help() const override;
		FlashCommands& parent;
	} writeRamCmd;

	struct BankCmd final : Command {
		BankCmd(Interpreter& interpreter, FlashCommands& parent);
		void execute(std::span<const TclObject> tokens, TclObject& result) override;
		[[nodiscard]] std::string help() const override;
		FlashCommands& parent;
	} bankCmd;

	struct HelpCmd final : Command {
		HelpCmd(Interpreter& interpreter, FlashCommands& parent);
		void execute(std::span<const TclObject> tokens, TclObject& result) override;
		[[nodiscard]] std::string help() const override;
		FlashCommands& parent;
	} helpCmd;
};

} // namespace flashkit

#endif
