#ifndef COMMAND_HH
#define COMMAND_HH

#include "CommandException.hh"

#include <span>
#include <string>
#include <string_view>

namespace flashkit {

class Interpreter;
class TclObject;

/** A Tcl command implemented in C++. Registers itself with the
  * interpreter on construction and unregisters on destruction.
  */
class Command
{
public:
	Command(const Command&) = delete;
	Command& operator=(const Command&) = delete;

	/** Execute this command.
	  * @param tokens Tokenized command line;
	  *     tokens[0] is the command itself.
	  * @param result The result of the command must be assigned to this
	  *               parameter.
	  * @throws FlashkitException Thrown when there was an error while
	  *                           executing this command.
	  */
	virtual void execute(std::span<const TclObject> tokens, TclObject& result) = 0;

	/** One-line usage, printed by 'help'. */
	[[nodiscard]] virtual std::string help() const = 0;

	[[nodiscard]] const std::string& getName() const { return name; }
	[[nodiscard]] Interpreter& getInterpreter() const { return interpreter; }

	// used by Interpreter::(un)registerCommand()
	void setToken(void* token_) { token = token_; }
	[[nodiscard]] void* getToken() const { return token; }

protected:
	Command(Interpreter& interpreter, std::string_view name);
	~Command();

	struct Between { unsigned min; unsigned max; };
	void checkNumArgs(std::span<const TclObject> tokens, unsigned exactly, const char* errMessage) const;
	void checkNumArgs(std::span<const TclObject> tokens, Between between, const char* errMessage) const;

private:
	Interpreter& interpreter;
	std::string name;
	void* token = nullptr;
};

} // namespace flashkit

#endif
