#ifndef __NANOGEN_OPTIONS_TEXT_H__
#define __NANOGEN_OPTIONS_TEXT_H__

#include <string>

#include "options/effective.h"
#include "options/options.h"

namespace nanogen {
namespace options {

// Renders the present fields of `options` in text format, one `name: value` line per value in
// field table order. Enumeration values are rendered by name, or by number if unrecognized.
// Unknown fields follow as `<number>: <wire type> <hex payload>` lines.
std::string ToText(Options const& options);

// Same as above, wrapped in a block named after the scope (e.g. `message { ... }`).
std::string ToText(ScopedOptions const& options);

// Renders all the effective values. Fields without a default are omitted when absent.
std::string ToText(EffectiveOptions const& options);

std::string ToText(Scope scope, EffectiveOptions const& options);

}  // namespace options
}  // namespace nanogen

#endif  // __NANOGEN_OPTIONS_TEXT_H__
