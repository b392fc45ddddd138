#include "Interpreter.hh"
#include "Command.hh"
#include "CommandException.hh"

#include "narrow.hh"
#include "strCat.hh"
#include "xrange.hh"

#include <algorithm>
#include <bit>
#include <cstdlib>
#include <exception>
#include <vector>

namespace flashkit {

void Interpreter::init(const char* programName)
{
	Tcl_FindExecutable(programName);
}

Interpreter::Interpreter()
	: interp(Tcl_CreateInterp())
{
	Tcl_Preserve(interp);
}

Interpreter::~Interpreter()
{
	if (!Tcl_InterpDeleted(interp)) {
		Tcl_DeleteInterp(interp);
	}
	Tcl_Release(interp);

	// Tcl_Finalize() should only be called once for the whole application,
	// but the unittests create multiple Interpreter objects.
	static bool scheduled = false;
	if (!scheduled) {
		scheduled = true;
		atexit(Tcl_Finalize);
	}
}

void Interpreter::registerCommand(const std::string& name, Command& command)
{
	auto token = Tcl_CreateObjCommand(
		interp, name.c_str(), commandProc,
		static_cast<ClientData>(&command), nullptr);
	command.setToken(token);
}

void Interpreter::unregisterCommand(Command& command)
{
	Tcl_DeleteCommandFromToken(interp, static_cast<Tcl_Command>(command.getToken()));
}

int Interpreter::commandProc(ClientData clientData, Tcl_Interp* interp,
                             int objc, Tcl_Obj* const* objv)
{
	// exceptions must not pass through Tcl
	auto& command = *static_cast<Command*>(clientData);
	std::span<const TclObject> tokens(
		std::bit_cast<TclObject*>(const_cast<Tcl_Obj**>(objv)),
		size_t(objc));
	int res = TCL_OK;
	TclObject result;
	try {
		command.execute(tokens, result);
	} catch (FlashkitException& e) {
		result = e.getMessage();
		res = TCL_ERROR;
	} catch (std::exception& e) {
		result = strCat("Internal error: ", e.what());
		res = TCL_ERROR;
	}
	Tcl_SetObjResult(interp, result.getTclObject());
	return res;
}

TclObject Interpreter::execute(const std::string& command)
{
	if (Tcl_Eval(interp, command.c_str()) != TCL_OK) {
		throw CommandException(Tcl_GetStringResult(interp));
	}
	return TclObject(Tcl_GetObjResult(interp));
}

TclObject Interpreter::executeCommand(std::span<const TclObject> words)
{
	std::vector<Tcl_Obj*> objv;
	objv.reserve(words.size());
	for (const auto& w : words) objv.push_back(w.getTclObjectNonConst());
	if (Tcl_EvalObjv(interp, narrow<int>(objv.size()), objv.data(), TCL_EVAL_GLOBAL) != TCL_OK) {
		throw CommandException(Tcl_GetStringResult(interp));
	}
	return TclObject(Tcl_GetObjResult(interp));
}

void Interpreter::wrongNumArgs(unsigned argc, std::span<const TclObject> tokens, const char* message)
{
	std::vector<Tcl_Obj*> objv;
	for (auto i : xrange(std::min<size_t>(argc, tokens.size()))) {
		objv.push_back(tokens[i].getTclObjectNonConst());
	}
	Tcl_WrongNumArgs(interp, narrow<int>(objv.size()), objv.data(), message);
	throw CommandException(Tcl_GetStringResult(interp));
}

} // namespace flashkit
