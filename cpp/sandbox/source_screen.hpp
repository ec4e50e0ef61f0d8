#ifndef SANDBOX_SOURCE_SCREEN_HPP
#define SANDBOX_SOURCE_SCREEN_HPP

#include <string>

namespace sandbox {

// Static check of a snippet that already compiled. Rejects code that walks
// the object graph towards interpreter internals:
//  - attributes starting with an underscore, except __init__, __name__,
//    __qualname__, __doc__ and the public methods of named tuples;
//  - frame, generator and traceback attributes;
//  - dunder names other than __name__, and dunder string constants;
//  - imports of modules or names starting with an underscore;
//  - format strings that access attributes starting with an underscore.
// Returns true if the snippet may run, otherwise sets reason.
bool ScreenSource(const std::string& source, std::string* reason);

// Only the attribute rules of ScreenSource. Meant for code compiled by
// libraries while a snippet runs, e.g. pandas query strings, which may use
// private names of their own. Code that does not parse is accepted, as it
// cannot run either.
bool ScreenAttributes(const std::string& source, std::string* reason);

}  // namespace sandbox

#endif
