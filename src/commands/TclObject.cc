#include "TclObject.hh"
#include "Interpreter.hh"
#include "CommandException.hh"

namespace flashkit {

[[noreturn]] static void throwException(Tcl_Interp* interp)
{
	std::string_view message = interp ? Tcl_GetStringResult(interp)
	                                  : "TclObject error";
	throw CommandException(message);
}

static void unshare(Tcl_Obj*& obj)
{
	if (Tcl_IsShared(obj)) {
		Tcl_DecrRefCount(obj);
		obj = Tcl_DuplicateObj(obj);
		Tcl_IncrRefCount(obj);
	}
}

void TclObject::addDictKeyValues(std::initializer_list<Tcl_Obj*> keyValuePairs)
{
	unshare(obj);
	Tcl_Interp* interp = nullptr;
	auto it = keyValuePairs.begin(), et = keyValuePairs.end();
	while (it != et) {
		Tcl_Obj* key   = *it++;
		Tcl_Obj* value = *it++;
		if (Tcl_DictObjPut(interp, obj, key, value) != TCL_OK) {
			throwException(interp);
		}
	}
}

std::string_view TclObject::getString() const
{
	int length;
	const char* buf = Tcl_GetStringFromObj(obj, &length);
	return {buf, size_t(length)};
}

int TclObject::getInt(Interpreter& interp_) const
{
	auto* interp = interp_.interp;
	int result;
	if (Tcl_GetIntFromObj(interp, obj, &result) != TCL_OK) {
		throwException(interp);
	}
	return result;
}

TclObject TclObject::getDictValue(Interpreter& interp_, std::string_view key) const
{
	auto* interp = interp_.interp;
	TclObject keyObj(key);
	Tcl_Obj* value;
	if (Tcl_DictObjGet(interp, obj, keyObj.obj, &value) != TCL_OK) {
		throwException(interp);
	}
	return value ? TclObject(value) : TclObject();
}

} // namespace flashkit
