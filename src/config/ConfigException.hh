#ifndef CONFIGEXCEPTION_HH
#define CONFIGEXCEPTION_HH

#include "FlashkitException.hh"

namespace flashkit {

class ConfigException final : public FlashkitException
{
public:
	using FlashkitException::FlashkitException;
};

} // namespace flashkit

#endif
