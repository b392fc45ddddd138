#ifndef VERSION_HH
#define VERSION_HH

#include <string>

namespace flashkit {

class Version
{
public:
	// Defined by build system:
	static const char* const VERSION;

	// Computed using constants above:
	static std::string full();
};

} // namespace flashkit

#endif
