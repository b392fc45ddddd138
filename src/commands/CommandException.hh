#ifndef COMMANDEXCEPTION_HH
#define COMMANDEXCEPTION_HH

#include "FlashkitException.hh"

namespace flashkit {

class CommandException : public FlashkitException
{
public:
	using FlashkitException::FlashkitException;
};

} // namespace flashkit

#endif
