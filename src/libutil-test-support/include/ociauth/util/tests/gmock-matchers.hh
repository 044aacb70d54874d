#pragma once
///@file

#include "ociauth/util/terminal.hh"

#include <gmock/gmock.h>

namespace ociauth::testing {

/**
 * Matches strings (or `what()` messages, with `ThrowsMessage`) that
 * contain `substring` once all ANSI escapes are stripped, so that
 * highlighted parts of error messages can be matched verbatim.
 */
MATCHER_P(HasSubstrIgnoreANSI, substring, "has substring " + ::testing::PrintToString(substring))
{
    return filterANSIEscapes(std::string(arg), /*filterAll=*/true).find(substring) != std::string::npos;
}

/**
 * `filterANSIEscapes()` for use in plain `EXPECT_EQ` assertions about
 * error messages.
 */
inline std::string stripANSI(std::string_view s)
{
    return filterANSIEscapes(s, /*filterAll=*/true);
}

} // namespace ociauth::testing
