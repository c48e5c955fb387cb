#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace fsm_regex {

struct regex_error : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// empty pattern, dangling quantifier, unclosed or malformed character class
struct invalid_pattern : regex_error
{
    using regex_error::regex_error;
};

// match() called without an input value
struct input_required : regex_error
{
    using regex_error::regex_error;
};

// input is not valid UTF-8
struct invalid_input : regex_error
{
    using regex_error::regex_error;
};

} // namespace fsm_regex

#endif // ERRORS_HPP
