// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stdexcept>
#include <string>

namespace kick {

// Raised at match setup (invalid geometry, non-positive dt, missing agent binding, bad YAML).
// Never raised once the first tick has run.
class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Corrupt, truncated or unreadable replay stream.
class ReplayError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace kick
