#ifndef FLASHKITEXCEPTION_HH
#define FLASHKITEXCEPTION_HH

#include "strCat.hh"

#include <concepts>
#include <string>
#include <type_traits>
#include <utility>

namespace flashkit {

class FlashkitException
{
public:
	explicit FlashkitException() = default;

	explicit FlashkitException(std::string message_)
		: message(std::move(message_)) {}

	template<typename T, typename... Args>
		requires(!std::same_as<FlashkitException, std::remove_cvref_t<T>>) // don't block copy-constructor
	explicit FlashkitException(T&& t, Args&&... args)
		: message(strCat(std::forward<T>(t), std::forward<Args>(args)...))
	{
	}

	[[nodiscard]] const std::string& getMessage() const &  { return message; }
	[[nodiscard]]       std::string  getMessage()       && { return std::move(message); }

private:
	std::string message;
};

class FatalError
{
public:
	explicit FatalError(std::string message_)
		: message(std::move(message_)) {}

	template<typename T, typename... Args>
		requires(!std::same_as<FatalError, std::remove_cvref_t<T>>) // don't block copy-constructor
	explicit FatalError(T&& t, Args&&... args)
		: message(strCat(std::forward<T>(t), std::forward<Args>(args)...))
	{
	}

	[[nodiscard]] const std::string& getMessage() const &  { return message; }
	[[nodiscard]]       std::string  getMessage()       && { return std::move(message); }

private:
	std::string message;
};

/** Thrown for an out-of-range bank, page, sector or offset, or for a
  * malformed programming request. Always raised before the hardware is
  * touched.
  */
class InvalidArgumentException final : public FlashkitException
{
public:
	using FlashkitException::FlashkitException;
};

} // namespace flashkit

#endif
