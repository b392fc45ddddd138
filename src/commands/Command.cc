#include "Command.hh"
#include "Interpreter.hh"
#include "TclObject.hh"

namespace flashkit {

Command::Command(Interpreter& interpreter_, std::string_view name_)
	: interpreter(interpreter_), name(name_)
{
	interpreter.registerCommand(name, *this);
}

Command::~Command()
{
	interpreter.unregisterCommand(*this);
}

void Command::checkNumArgs(std::span<const TclObject> tokens, unsigned exactly,
                           const char* errMessage) const
{
	if (tokens.size() == exactly) return;
	interpreter.wrongNumArgs(1, tokens, errMessage);
}

void Command::checkNumArgs(std::span<const TclObject> tokens, Between between,
                           const char* errMessage) const
{
	if ((between.min <= tokens.size()) && (tokens.size() <= between.max)) return;
	interpreter.wrongNumArgs(1, tokens, errMessage);
}

} // namespace flashkit
