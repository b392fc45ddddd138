#ifndef INTERPRETER_HH
#define INTERPRETER_HH

#include "TclObject.hh"

#include <tcl.h>
#include <span>
#include <string>

namespace flashkit {

class Command;

class Interpreter
{
public:
	Interpreter();
	Interpreter(const Interpreter&) = delete;
	Interpreter(Interpreter&&) = delete;
	Interpreter& operator=(const Interpreter&) = delete;
	Interpreter& operator=(Interpreter&&) = delete;
	~Interpreter();

	static void init(const char* programName);
	void registerCommand(const std::string& name, Command& command);
	void unregisterCommand(Command& command);

	/** Evaluate a script, throws CommandException on a Tcl error. */
	TclObject execute(const std::string& command);
	/** Execute a single, already split command (no substitutions). */
	TclObject executeCommand(std::span<const TclObject> words);

	[[noreturn]] void wrongNumArgs(unsigned argc, std::span<const TclObject> tokens, const char* message);

private:
	static int commandProc(ClientData clientData, Tcl_Interp* interp,
	                       int objc, Tcl_Obj* const* objv);

	Tcl_Interp* interp;

	friend class TclObject;
};

} // namespace flashkit

#endif
