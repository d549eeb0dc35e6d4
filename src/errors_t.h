#ifndef ERRORS_T
#define ERRORS_T

#include <stdexcept>
#include <string>

// Mutation attempted after the session reached Selected or Cancelled.
class ClosedSessionError : public std::runtime_error {
public:
	ClosedSessionError() : std::runtime_error("session is closed") {}
};

// Terminal backend unusable; aborts the session.
class RenderError : public std::runtime_error {
public:
	explicit RenderError(const std::string& what) : std::runtime_error(what) {}
};

class EmptyInputError : public std::runtime_error {
public:
	explicit EmptyInputError(const std::string& what)
	        : std::runtime_error(what)
	{}
};

class ConfigError : public std::runtime_error {
public:
	explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Bad command-line arguments; reported together with the usage text.
class UsageError : public std::runtime_error {
public:
	explicit UsageError(const std::string& what) : std::runtime_error(what) {}
};

#endif
