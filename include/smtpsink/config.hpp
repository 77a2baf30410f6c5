/*

config.hpp
----------

Global build configuration for smtpsink.

Define SMTPSINK_USE_STD_REGEX to match command arguments with std::regex
instead of Boost.Regex.

Define SMTPSINK_USE_STANDALONE_ASIO to build against standalone Asio
instead of Boost.Asio.

*/

#pragma once

#if defined(SMTPSINK_USE_STD_REGEX)
#define SMTPSINK_STD_REGEX_ENABLED 1
#else
#define SMTPSINK_STD_REGEX_ENABLED 0
#endif
