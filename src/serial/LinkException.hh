#ifndef LINKEXCEPTION_HH
#define LINKEXCEPTION_HH

#include "FlashkitException.hh"

namespace flashkit {

/** Transport failure: the serial link could not be opened, or a transfer
  * did not complete.
  */
class LinkException : public FlashkitException
{
public:
	using FlashkitException::FlashkitException;
};

/** A hardware access was attempted without a live device session. */
class NotConnectedException final : public FlashkitException
{
public:
	NotConnectedException()
		: FlashkitException("Device is not connected") {}
};

} // namespace flashkit

#endif
