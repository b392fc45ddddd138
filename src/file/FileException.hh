#ifndef FILEEXCEPTION_HH
#define FILEEXCEPTION_HH

#include "FlashkitException.hh"

namespace flashkit {

class FileException : public FlashkitException
{
public:
	using FlashkitException::FlashkitException;
};

} // namespace flashkit

#endif
